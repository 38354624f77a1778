#include "PingProbe.hpp"
#include "Identity.hpp"
#include "Payloads.hpp"
#include <iostream>

namespace shortgap {

    PingProbe::PingProbe(boost::asio::io_context& ctx, PeerRegistry& reg, MemberId self, const PartyConfig& cfg)
        : io(ctx),
          registry(reg),
          selfId(std::move(self)),
          config(cfg),
          cadenceTimer(ctx) {}

    void PingProbe::setRttSource(RttSource source) {
        rttSource = std::move(source);
    }

    void PingProbe::setRoundCompleteHandler(RoundCallback cb) {
        onRoundComplete = std::move(cb);
    }

    std::optional<uint32_t> PingProbe::combine(const std::vector<std::optional<uint32_t>>& probes) {
        uint64_t total = 0;
        uint32_t count = 0;
        for (const auto& probe : probes) {
            if (!probe) continue;
            total += *probe;
            ++count;
        }
        if (count == 0) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(total / count);
    }

    uint32_t PingProbe::elapsedMillis(std::chrono::steady_clock::time_point since) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since);
        return static_cast<uint32_t>(elapsed.count());
    }

    // ============================================================
    // Lifecycle
    // ============================================================
    void PingProbe::start() {
        if (running.exchange(true)) return;

        std::weak_ptr<PingProbe> weak = shared_from_this();
        subscription = registry.subscribe([weak](const RegistryEvent& event) {
            if (event.kind != RegistryEvent::Kind::MembershipChanged || event.online) return;
            auto self = weak.lock();
            if (!self) return;
            boost::asio::post(self->io, [self, id = event.memberId] { self->cancelMember(id); });
        });

        auto self = shared_from_this();
        boost::asio::post(io, [self] { self->scheduleTick(); });
    }

    void PingProbe::stop() {
        if (!running.exchange(false)) return;

        registry.unsubscribe(subscription);
        auto self = shared_from_this();
        boost::asio::post(io, [self] {
            self->cadenceTimer.cancel();
            if (self->current) {
                self->abandonRound();
            }
        });
    }

    void PingProbe::scheduleTick() {
        if (!running.load()) return;

        auto self = shared_from_this();
        cadenceTimer.expires_after(config.probeCadence);
        cadenceTimer.async_wait([self](const boost::system::error_code& ec) {
            if (ec || !self->running.load()) return;
            self->onTick();
            self->scheduleTick();
        });
    }

    void PingProbe::runRound() {
        auto self = shared_from_this();
        boost::asio::post(io, [self] {
            if (self->running.load()) self->onTick();
        });
    }

    void PingProbe::onTick() {
        if (current) {
            auto age = std::chrono::steady_clock::now() - current->startedAt;
            if (age <= 2 * config.probeCadence) {
                std::cout << "PingProbe: round " << current->id << " still running, skipping tick" << std::endl;
                return;
            }
            std::cerr << "PingProbe: abandoning round " << current->id << " after "
                      << std::chrono::duration_cast<std::chrono::seconds>(age).count() << "s" << std::endl;
            abandonRound();
        }
        beginRound();
    }

    // ============================================================
    // Rounds
    // ============================================================
    void PingProbe::beginRound() {
        PartySnapshot party = registry.snapshot();

        auto round = std::make_shared<Round>();
        round->id = nextRoundId++;
        round->transport = party->activeTransport;
        round->startedAt = std::chrono::steady_clock::now();
        current = round;
        inFlight.store(true);

        std::vector<Member> peers;
        for (const auto& [id, member] : party->members) {
            if (id == selfId || !member.isOnline) continue;
            peers.push_back(member);
        }

        round->outstanding = peers.size();
        if (peers.empty()) {
            finishRound(round);
            return;
        }

        for (const auto& peer : peers) {
            probePeer(round, peer);
        }
    }

    void PingProbe::abandonRound() {
        auto round = current;
        current.reset();
        inFlight.store(false);
        round->abandoned = true;

        auto attempts = round->attempts;
        for (auto& [id, attempt] : attempts) {
            (void)id;
            attempt->cancelled = true;
            finishAttempt(round, attempt);
        }
    }

    void PingProbe::cancelMember(const MemberId& memberId) {
        if (!current) return;

        auto it = current->attempts.find(memberId);
        if (it == current->attempts.end()) return;

        auto attempt = it->second;
        attempt->cancelled = true;
        finishAttempt(current, attempt);
    }

    // ============================================================
    // Per-peer probes
    // ============================================================
    void PingProbe::probePeer(const std::shared_ptr<Round>& round, const Member& peer) {
        auto attempt = std::make_shared<Attempt>(io);
        attempt->peerId = peer.id;
        round->attempts[peer.id] = attempt;

        auto address = peer.preferredAddress(TransportKind::Tcp);
        if (!address) {
            // nothing to connect to; only the WebRTC probe can still succeed
            finishAttempt(round, attempt);
            return;
        }
        attempt->address = *address;

        auto self = shared_from_this();
        attempt->phaseStart = std::chrono::steady_clock::now();
        armTimer(round, attempt);
        attempt->resolver.async_resolve(address->host, std::to_string(address->port),
            [self, round, attempt](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (attempt->done) return;
                if (ec) {
                    std::cerr << "PingProbe: resolve " << attempt->address.key() << " failed: " << ec.message() << std::endl;
                    self->finishAttempt(round, attempt);
                    return;
                }
                self->startConnect(round, attempt, results);
            });
    }

    void PingProbe::armTimer(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt) {
        auto self = shared_from_this();
        attempt->timer.expires_after(config.probeTimeout);
        attempt->timer.async_wait([self, round, attempt](const boost::system::error_code& ec) {
            if (ec || attempt->done) return;
            std::cerr << "PingProbe: probe to " << attempt->peerId << " timed out" << std::endl;
            self->finishAttempt(round, attempt);
        });
    }

    void PingProbe::startConnect(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt,
                                 const tcp::resolver::results_type& endpoints) {
        auto self = shared_from_this();
        attempt->phaseStart = std::chrono::steady_clock::now();
        armTimer(round, attempt);
        boost::asio::async_connect(attempt->socket, endpoints,
            [self, round, attempt](const boost::system::error_code& ec, const tcp::endpoint&) {
                if (attempt->done) return;
                if (ec) {
                    std::cerr << "PingProbe: connect to " << attempt->address.key() << " failed: " << ec.message() << std::endl;
                    self->finishAttempt(round, attempt);
                    return;
                }
                attempt->connectMillis = elapsedMillis(attempt->phaseStart);
                self->startEcho(round, attempt);
            });
    }

    void PingProbe::startEcho(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt) {
        ProbePayload probe;
        probe.senderId = selfId;
        probe.sentAtMs = toMillis(Clock::now());
        probe.nonce = randomNonce();
        attempt->nonce = probe.nonce;

        auto frame = std::make_shared<std::vector<uint8_t>>(serializeMessage(makeMessage(MessageType::PROBE, probe)));

        auto self = shared_from_this();
        attempt->phaseStart = std::chrono::steady_clock::now();
        armTimer(round, attempt);
        boost::asio::async_write(attempt->socket, boost::asio::buffer(*frame),
            [self, round, attempt, frame](const boost::system::error_code& ec, std::size_t) {
                if (attempt->done) return;
                if (ec) {
                    std::cerr << "PingProbe: probe send to " << attempt->peerId << " failed: " << ec.message() << std::endl;
                    self->finishAttempt(round, attempt);
                    return;
                }
                self->readEcho(round, attempt);
            });
    }

    void PingProbe::readEcho(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt) {
        auto self = shared_from_this();
        attempt->headerBuf.assign(MESSAGE_HEADER_SIZE, 0);
        boost::asio::async_read(attempt->socket, boost::asio::buffer(attempt->headerBuf),
            [self, round, attempt](const boost::system::error_code& ec, std::size_t) {
                if (attempt->done) return;

                Message header;
                uint64_t payloadLen = 0;
                if (ec || !parseMessageHeader(attempt->headerBuf, header, payloadLen)) {
                    self->finishAttempt(round, attempt);
                    return;
                }

                attempt->bodyBuf.assign(static_cast<size_t>(payloadLen) + CHECKSUM_SIZE, 0);
                boost::asio::async_read(attempt->socket, boost::asio::buffer(attempt->bodyBuf),
                    [self, round, attempt](const boost::system::error_code& ec2, std::size_t) {
                        if (attempt->done) return;

                        std::vector<uint8_t> full(attempt->headerBuf);
                        full.insert(full.end(), attempt->bodyBuf.begin(), attempt->bodyBuf.end());

                        Message echo;
                        ProbePayload payload;
                        if (!ec2 && parseExactMessage(full, echo) && echo.type == MessageType::PROBE_ECHO &&
                            decode(echo.payload, payload) && payload.nonce == attempt->nonce) {
                            attempt->echoMillis = elapsedMillis(attempt->phaseStart);
                        } else {
                            std::cerr << "PingProbe: bad echo from " << attempt->peerId << std::endl;
                        }
                        self->finishAttempt(round, attempt);
                    });
            });
    }

    void PingProbe::finishAttempt(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt) {
        if (attempt->done) return;
        attempt->done = true;

        boost::system::error_code ignored;
        attempt->timer.cancel();
        attempt->resolver.cancel();
        attempt->socket.close(ignored);
        round->attempts.erase(attempt->peerId);

        if (round->abandoned) return;

        if (!attempt->cancelled) {
            std::vector<std::optional<uint32_t>> probes{attempt->connectMillis, attempt->echoMillis};
            if (rttSource) {
                probes.push_back(rttSource(attempt->peerId));
            }

            auto score = combine(probes);
            if (score) {
                PingSample sample;
                sample.peerId = attempt->peerId;
                sample.transport = round->transport;
                sample.roundTripMillis = *score;
                sample.measuredAt = Clock::now();
                registry.recordPing(attempt->peerId, round->transport, sample);
                if (attempt->connectMillis) {
                    registry.verifyAddress(attempt->peerId, attempt->address);
                }
                round->scores.push_back(*score);
            } else {
                std::cerr << "PingProbe: " << attempt->peerId << " unreachable this round" << std::endl;
                registry.recordProbeFailure(attempt->peerId);
            }
        }

        if (round->outstanding > 0 && --round->outstanding == 0) {
            finishRound(round);
        }
    }

    void PingProbe::finishRound(const std::shared_ptr<Round>& round) {
        if (current != round) return;

        // own score: mean latency to every peer reached this round
        std::vector<std::optional<uint32_t>> perPeer(round->scores.begin(), round->scores.end());
        auto own = combine(perPeer);
        if (own) {
            PingSample sample;
            sample.peerId = selfId;
            sample.transport = round->transport;
            sample.roundTripMillis = *own;
            sample.measuredAt = Clock::now();
            registry.recordPing(selfId, round->transport, sample);
        }

        current.reset();
        inFlight.store(false);
        completed.fetch_add(1);
        std::cout << "PingProbe: round " << round->id << " complete, " << round->scores.size()
                  << " peer(s) scored" << std::endl;

        if (onRoundComplete) {
            onRoundComplete(round->id);
        }
    }

} // namespace shortgap
