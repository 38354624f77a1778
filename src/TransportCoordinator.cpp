#include "TransportCoordinator.hpp"
#include <algorithm>
#include <iostream>

namespace shortgap {

    std::string switchStateToString(SwitchState state) {
        switch (state) {
            case SwitchState::Idle:      return "Idle";
            case SwitchState::Preparing: return "Preparing";
            case SwitchState::Switching: return "Switching";
            case SwitchState::Complete:  return "Complete";
            case SwitchState::Failed:    return "Failed";
            default:                     return "Unknown";
        }
    }

    TransportCoordinator::TransportCoordinator(boost::asio::io_context& ctx, PeerRegistry& reg, Elector::Ptr el,
                                               MemberId self, const PartyConfig& cfg)
        : io(ctx),
          registry(reg),
          elector(std::move(el)),
          selfId(std::move(self)),
          config(cfg),
          tcpAcceptor(ctx),
          wsAcceptor(ctx),
          switchTimer(ctx),
          leaveTimer(ctx) {}

    void TransportCoordinator::setChatHandler(ChatCallback cb) { onChat = std::move(cb); }
    void TransportCoordinator::setTransportChangedHandler(TransportCallback cb) { onTransportChanged = std::move(cb); }
    void TransportCoordinator::setSwitchStateHandler(SwitchStateCallback cb) { onSwitchState = std::move(cb); }
    void TransportCoordinator::setConnectionLostHandler(ConnectionLostCallback cb) { onConnectionLost = std::move(cb); }

    // ============================================================
    // Lifecycle
    // ============================================================
    void TransportCoordinator::start() {
        if (running.exchange(true)) return;

        auto bindListener = [this](tcp::acceptor& acceptor, uint16_t port) -> uint16_t {
            tcp::endpoint endpoint(boost::asio::ip::make_address(config.bindAddress), port);
            acceptor.open(endpoint.protocol());
            acceptor.set_option(tcp::acceptor::reuse_address(true));
            acceptor.bind(endpoint);
            acceptor.listen();
            return acceptor.local_endpoint().port();
        };

        try {
            boundTcpPort.store(bindListener(tcpAcceptor, config.tcpPort));
            boundWsPort.store(bindListener(wsAcceptor, config.webSocketPort()));
        } catch (const boost::system::system_error& e) {
            std::cerr << "TransportCoordinator: cannot listen: " << e.what() << std::endl;
            running.store(false);
            boost::system::error_code ignored;
            tcpAcceptor.close(ignored);
            wsAcceptor.close(ignored);
            throw;
        }

        std::cout << "TransportCoordinator: listening on " << config.bindAddress << " tcp " << tcpPort()
                  << ", ws " << wsPort() << std::endl;

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        subscription = registry.subscribe([weak](const RegistryEvent& event) {
            if (event.kind != RegistryEvent::Kind::MembershipChanged) return;
            if (auto self = weak.lock()) {
                boost::asio::post(self->io, [self, event] { self->onMembershipEvent(event); });
            }
        });

        doAcceptTcp();
        doAcceptWs();
    }

    void TransportCoordinator::stop() {
        if (!running.exchange(false)) return;

        registry.unsubscribe(subscription);
        auto self = shared_from_this();
        boost::asio::post(io, [self] {
            boost::system::error_code ignored;
            self->tcpAcceptor.close(ignored);
            self->wsAcceptor.close(ignored);
            self->switchTimer.cancel();
            self->cancelHostDial();

            auto all = std::move(self->links);
            self->links.clear();
            self->memberLinks.clear();
            self->uplinkId = 0;
            self->updateCounters();
            for (auto& [id, link] : all) {
                (void)id;
                if (link.timer) link.timer->cancel();
                channelClose(link.channel);
            }

            if (self->negotiator) {
                self->negotiator->closeAll();
            }
            self->finishLeave();
        });
    }

    void TransportCoordinator::setRtcNegotiator(RtcNegotiator::Ptr rtc) {
        negotiator = std::move(rtc);
        if (!negotiator) return;

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        negotiator->setSignalSender([weak](const RtcSignalPayload& signal) {
            if (auto self = weak.lock()) {
                boost::asio::post(self->io, [self, signal] { self->sendSignal(signal); });
            }
        });
        negotiator->setIncomingHandler([weak](RtcChannel::Ptr channel) {
            auto self = weak.lock();
            if (!self || !channel) return;
            boost::asio::post(self->io, [self, channel] {
                if (!self->running.load()) {
                    channel->close();
                    return;
                }
                self->adoptPending(Channel(channel));
            });
        });
    }

    std::optional<uint32_t> TransportCoordinator::rttFor(const MemberId& memberId) const {
        if (!negotiator) return std::nullopt;
        return negotiator->roundTripMillis(memberId);
    }

    bool TransportCoordinator::isHost() const {
        return registry.snapshot()->hostId == selfId;
    }

    // ============================================================
    // Accept loops
    // ============================================================
    void TransportCoordinator::doAcceptTcp() {
        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        tcpAcceptor.async_accept([weak](const boost::system::error_code& ec, tcp::socket socket) {
            auto self = weak.lock();
            if (!self) return;

            if (!ec) {
                self->adoptPending(Channel(std::make_shared<TcpChannel>(std::move(socket))));
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cerr << "TransportCoordinator: tcp accept error: " << ec.message() << std::endl;
            }

            if (self->running.load()) {
                self->doAcceptTcp();
            }
        });
    }

    void TransportCoordinator::doAcceptWs() {
        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        wsAcceptor.async_accept([weak](const boost::system::error_code& ec, tcp::socket socket) {
            auto self = weak.lock();
            if (!self) return;

            if (!ec) {
                auto channel = std::make_shared<WsChannel>(self->io, std::move(socket));
                channel->accept([weak, channel](const boost::system::error_code& ec2) {
                    auto owner = weak.lock();
                    if (!owner) return;
                    if (ec2) {
                        std::cerr << "TransportCoordinator: websocket upgrade failed: " << ec2.message() << std::endl;
                        return;
                    }
                    if (!owner->running.load()) {
                        channel->close();
                        return;
                    }
                    owner->adoptPending(Channel(channel));
                });
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cerr << "TransportCoordinator: websocket accept error: " << ec.message() << std::endl;
            }

            if (self->running.load()) {
                self->doAcceptWs();
            }
        });
    }

    void TransportCoordinator::adoptPending(const Channel& channel) {
        const uint64_t id = nextLinkId++;

        Link link;
        link.channel = channel;
        link.role = LinkRole::Pending;
        link.timer = std::make_shared<boost::asio::steady_timer>(io);
        links.emplace(id, std::move(link));

        attachHandlers(id, channel);
        channelStart(channel);
        armLinkTimer(id, config.connectTimeout, "handshake");
    }

    void TransportCoordinator::attachHandlers(uint64_t id, const Channel& channel) {
        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        channelSetHandlers(channel,
            [weak, id](const Message& msg) {
                if (auto self = weak.lock()) self->handleLinkMessage(id, msg);
            },
            [weak, id](const std::string& reason) {
                if (auto self = weak.lock()) self->handleLinkClosed(id, reason);
            });
    }

    void TransportCoordinator::armLinkTimer(uint64_t id, std::chrono::milliseconds after, const std::string& what) {
        auto it = links.find(id);
        if (it == links.end()) return;

        if (!it->second.timer) {
            it->second.timer = std::make_shared<boost::asio::steady_timer>(io);
        }
        auto timer = it->second.timer;

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        timer->expires_after(after);
        timer->async_wait([weak, id, timer, what](const boost::system::error_code& ec) {
            if (ec) return;
            auto self = weak.lock();
            if (!self) return;

            auto link = self->links.find(id);
            if (link == self->links.end() || link->second.timer != timer) return;

            const LinkRole role = link->second.role;
            if (role == LinkRole::Member || role == LinkRole::Uplink) return;

            auto dial = link->second.dial;
            if (role != LinkRole::Retired) {
                std::cerr << "TransportCoordinator: " << what << " timed out" << std::endl;
            }
            self->dropLink(id);
            if (role == LinkRole::Dialing && dial) {
                self->dialNext(dial);
            }
        });
    }

    // ============================================================
    // Link dispatch
    // ============================================================
    void TransportCoordinator::handleLinkMessage(uint64_t id, const Message& msg) {
        auto it = links.find(id);
        if (it == links.end()) return;

        switch (it->second.role) {
            case LinkRole::Pending:
                handlePending(id, msg);
                break;

            case LinkRole::Dialing: {
                if (msg.type != MessageType::HANDSHAKE_ACK) break;
                HandshakeAckPayload ack;
                if (!decode(msg.payload, ack)) {
                    std::cerr << "TransportCoordinator: malformed handshake ack" << std::endl;
                    auto dial = it->second.dial;
                    dropLink(id);
                    if (dial) dialNext(dial);
                    break;
                }
                handleAck(id, ack);
                break;
            }

            case LinkRole::Member: {
                const MemberId peer = it->second.peer;
                handleFromMember(id, peer, msg);
                break;
            }

            case LinkRole::Uplink:
                handleFromHost(msg);
                break;

            case LinkRole::Retired: {
                const MemberId peer = it->second.peer;
                handleRetired(peer, msg);
                break;
            }
        }
    }

    void TransportCoordinator::handleLinkClosed(uint64_t id, const std::string& reason) {
        auto it = links.find(id);
        if (it == links.end()) return;

        const LinkRole role = it->second.role;
        const MemberId peer = it->second.peer;
        const PeerAddress address = it->second.address;
        auto dial = it->second.dial;
        eraseLink(id);

        switch (role) {
            case LinkRole::Pending:
            case LinkRole::Retired:
                break;

            case LinkRole::Dialing:
                std::cerr << "TransportCoordinator: dial to " << address.key() << " closed: " << reason << std::endl;
                if (dial) dialNext(dial);
                break;

            case LinkRole::Member:
                std::cerr << "TransportCoordinator: lost member " << peer << ": " << reason << std::endl;
                if (!leaving && running.load()) onPeerUnreachable(peer);
                break;

            case LinkRole::Uplink:
                if (hostDial && !hostDial->finished && hostDial->target == peer) {
                    std::cout << "TransportCoordinator: old uplink to " << peer << " closed while redialing" << std::endl;
                    break;
                }
                std::cerr << "TransportCoordinator: lost uplink to host " << peer << ": " << reason << std::endl;
                if (!leaving && running.load()) onPeerUnreachable(peer);
                break;
        }
    }

    void TransportCoordinator::handlePending(uint64_t id, const Message& msg) {
        switch (msg.type) {
            case MessageType::PROBE:
                echoProbe(id, msg);
                retireLink(id);
                break;

            case MessageType::HANDSHAKE: {
                HandshakePayload hs;
                if (!decode(msg.payload, hs)) {
                    std::cerr << "TransportCoordinator: malformed handshake" << std::endl;
                    dropLink(id);
                    return;
                }
                admit(id, hs);
                break;
            }

            default:
                std::cerr << "TransportCoordinator: " << messageTypeToString(msg.type)
                          << " before handshake, closing" << std::endl;
                dropLink(id);
                break;
        }
    }

    void TransportCoordinator::handleFromMember(uint64_t id, const MemberId& peer, const Message& msg) {
        registry.touch(peer);
        {
            PartySnapshot party = registry.snapshot();
            if (party->find(peer) != nullptr && !party->isOnline(peer)) {
                registry.markOnline(peer);
            }
        }

        const auto now = Clock::now();
        switch (msg.type) {
            case MessageType::CHAT:
                if (deliverChat(msg)) {
                    doRelay(msg, peer);
                }
                break;

            case MessageType::SCORE_TABLE: {
                ScoreTablePayload table;
                if (decode(msg.payload, table)) {
                    applyScores(table);
                    elector->checkChallenge(now);
                }
                break;
            }

            case MessageType::CHALLENGE: {
                HostClaim claim;
                if (decode(msg.payload, claim)) {
                    elector->considerChallenge(claim, now);
                }
                break;
            }

            case MessageType::HOST_CHANGE: {
                HostClaim claim;
                if (decode(msg.payload, claim)) {
                    elector->considerClaim(claim, now);
                }
                break;
            }

            case MessageType::TRANSPORT_CHANGE: {
                TransportChangePayload change;
                if (decode(msg.payload, change)) {
                    std::cout << "TransportCoordinator: " << peer << " asked for "
                              << transportToString(change.kind) << std::endl;
                    startHostSwitch(change.kind);
                }
                break;
            }

            case MessageType::RTC_SIGNAL: {
                RtcSignalPayload signal;
                if (decode(msg.payload, signal)) {
                    signal.senderId = peer;
                    routeSignal(signal);
                }
                break;
            }

            case MessageType::DISCONNECT:
                memberLeft(peer);
                break;

            case MessageType::PROBE:
                echoProbe(id, msg);
                break;

            default:
                std::cerr << "TransportCoordinator: ignoring " << messageTypeToString(msg.type)
                          << " from member " << peer << std::endl;
                break;
        }
    }

    void TransportCoordinator::handleFromHost(const Message& msg) {
        if (!uplinkPeer.empty()) {
            registry.touch(uplinkPeer);
        }

        const auto now = Clock::now();
        switch (msg.type) {
            case MessageType::CHAT:
                deliverChat(msg);
                break;

            case MessageType::PEER_LIST: {
                PeerListPayload list;
                if (!decode(msg.payload, list)) break;
                registry.merge(membersOf(list), selfId);
                HostClaim claim = Elector::claimFor(*registry.snapshot(), list.hostId, list.term, now,
                                                    config.stalenessThreshold);
                if (!claim.empty()) {
                    elector->considerClaim(claim, now);
                }
                break;
            }

            case MessageType::MEMBER_JOINED: {
                MemberRecord record;
                if (decode(msg.payload, record) && record.id != selfId) {
                    registry.merge({fromRecord(record)}, selfId);
                }
                break;
            }

            case MessageType::MEMBER_STATUS: {
                MemberStatusPayload status;
                if (!decode(msg.payload, status) || status.memberId == selfId) break;
                if (status.removed) {
                    registry.leave(status.memberId);
                } else if (status.online) {
                    registry.markOnline(status.memberId);
                } else {
                    registry.markOffline(status.memberId);
                }
                break;
            }

            case MessageType::SCORE_TABLE: {
                ScoreTablePayload table;
                if (decode(msg.payload, table)) {
                    applyScores(table);
                    elector->checkChallenge(now);
                }
                break;
            }

            case MessageType::HOST_CHANGE: {
                HostClaim claim;
                if (decode(msg.payload, claim)) {
                    elector->considerClaim(claim, now);
                }
                break;
            }

            case MessageType::TRANSPORT_CHANGE: {
                TransportChangePayload change;
                if (decode(msg.payload, change)) {
                    beginMemberSwitch(change.kind);
                }
                break;
            }

            case MessageType::RTC_SIGNAL: {
                RtcSignalPayload signal;
                if (decode(msg.payload, signal)) {
                    routeSignal(signal);
                }
                break;
            }

            case MessageType::DISCONNECT: {
                DisconnectPayload bye;
                if (decode(msg.payload, bye) && bye.senderId != selfId) {
                    registry.leave(bye.senderId);
                }
                break;
            }

            default:
                std::cerr << "TransportCoordinator: ignoring " << messageTypeToString(msg.type)
                          << " from host" << std::endl;
                break;
        }
    }

    void TransportCoordinator::handleRetired(const MemberId& peer, const Message& msg) {
        if (msg.type == MessageType::CHAT) {
            // sent before the sender moved to its new link
            if (deliverChat(msg) && isHost() && !peer.empty()) {
                doRelay(msg, peer);
            }
            return;
        }

        if (msg.type == MessageType::DISCONNECT) {
            DisconnectPayload bye;
            if (!decode(msg.payload, bye) || bye.senderId == selfId) return;
            if (isHost()) {
                memberLeft(bye.senderId);
            } else {
                registry.leave(bye.senderId);
            }
        }
    }

    // ============================================================
    // Admission (host side)
    // ============================================================
    void TransportCoordinator::admit(uint64_t id, const HandshakePayload& hs) {
        PartySnapshot party = registry.snapshot();

        if (hs.senderId.empty() || hs.senderId == selfId) {
            reject(id, "invalid sender");
            return;
        }
        if (!hs.partyId.empty() && !party->partyId.empty() && hs.partyId != party->partyId) {
            reject(id, "party mismatch");
            return;
        }

        if (!hs.claim.empty() && hs.claim.hostId != party->hostId) {
            elector->considerClaim(hs.claim, Clock::now());
        }

        if (!isHost()) {
            std::cout << "TransportCoordinator: not hosting, redirecting " << hs.senderId << std::endl;
            sendOn(id, makeMessage(MessageType::HANDSHAKE_ACK, makeAck(id, false, REDIRECT_REASON)));
            retireLink(id);
            return;
        }

        auto it = links.find(id);
        if (it == links.end()) return;

        Member member;
        member.id = hs.senderId;
        member.displayName = hs.displayName;
        const std::string host = !hs.advertisedHost.empty() ? hs.advertisedHost : channelRemoteHost(it->second.channel);
        if (!host.empty()) {
            if (hs.tcpPort != 0) member.addresses.push_back(PeerAddress{host, hs.tcpPort, TransportKind::Tcp});
            if (hs.wsPort != 0) member.addresses.push_back(PeerAddress{host, hs.wsPort, TransportKind::WebSocket});
        }

        try {
            registry.join(member);
        } catch (const PartyError& e) {
            std::cerr << "TransportCoordinator: cannot admit " << hs.senderId << ": " << e.what() << std::endl;
            reject(id, e.what());
            return;
        }

        auto previous = memberLinks.find(hs.senderId);
        const bool replacing = previous != memberLinks.end() && previous->second != id;
        if (replacing) {
            retireLink(previous->second);
        }

        it = links.find(id);
        if (it == links.end()) return;
        it->second.role = LinkRole::Member;
        it->second.peer = hs.senderId;
        if (it->second.timer) it->second.timer->cancel();
        memberLinks[hs.senderId] = id;
        updateCounters();

        HandshakeAckPayload ack = makeAck(id, true, "");
        auto admitted = registry.member(hs.senderId);
        if (admitted) {
            ack.assignedName = admitted->displayName;
        }
        sendOn(id, makeMessage(MessageType::HANDSHAKE_ACK, ack));

        std::cout << "TransportCoordinator: admitted " << ack.assignedName << " (" << hs.senderId << ") over "
                  << transportToString(channelKind(it->second.channel)) << std::endl;

        if (!replacing && admitted) {
            broadcast(makeMessage(MessageType::MEMBER_JOINED, toRecord(*admitted)), hs.senderId);
        }

        if (currentSwitch.load() == SwitchState::Preparing) {
            if (channelKind(it->second.channel) != switchTarget) {
                TransportChangePayload change;
                change.kind = switchTarget;
                change.senderId = selfId;
                sendOn(id, makeMessage(MessageType::TRANSPORT_CHANGE, change));
            }
            checkSwitchProgress();
        }
    }

    void TransportCoordinator::reject(uint64_t id, const std::string& reason) {
        sendOn(id, makeMessage(MessageType::HANDSHAKE_ACK, makeAck(id, false, reason)));
        retireLink(id);
    }

    void TransportCoordinator::echoProbe(uint64_t id, const Message& msg) {
        ProbePayload probe;
        if (!decode(msg.payload, probe)) {
            std::cerr << "TransportCoordinator: malformed probe" << std::endl;
            return;
        }
        sendOn(id, makeMessage(MessageType::PROBE_ECHO, probe));
    }

    HandshakeAckPayload TransportCoordinator::makeAck(uint64_t id, bool accepted, const std::string& reason) const {
        PartySnapshot party = registry.snapshot();

        HandshakeAckPayload ack;
        ack.partyId = party->partyId;
        ack.senderId = selfId;
        auto it = links.find(id);
        ack.transport = it != links.end() ? channelKind(it->second.channel) : party->activeTransport;
        ack.accepted = accepted;
        ack.reason = reason;
        ack.tcpPort = tcpPort();
        ack.wsPort = wsPort();
        ack.claim = elector->currentClaim(Clock::now());
        ack.peers = toPeerList(*party);
        return ack;
    }

    // ============================================================
    // Dialing (member side)
    // ============================================================
    void TransportCoordinator::join(const std::vector<PeerAddress>& bootstrap, DialCallback cb) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, bootstrap, cb] {
            auto dial = std::make_shared<Dial>();
            dial->purpose = Dial::Purpose::Join;
            dial->candidates = bootstrapCandidates(bootstrap);
            dial->done = cb;
            std::cout << "TransportCoordinator: joining through " << dial->candidates.size() << " address(es)" << std::endl;
            self->startDial(dial);
        });
    }

    void TransportCoordinator::connect(TransportKind transport, const MemberId& memberId, DialCallback cb) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, transport, memberId, cb] {
            self->dialHost(transport, memberId, cb);
        });
    }

    void TransportCoordinator::dialHost(TransportKind transport, const MemberId& memberId, DialCallback cb) {
        auto dial = std::make_shared<Dial>();
        dial->purpose = Dial::Purpose::Reconnect;
        dial->target = memberId;
        dial->requested = transport;
        dial->candidates = candidatesFor(memberId, transport, true);
        dial->rtcFirst = transport == TransportKind::WebRtc;
        dial->tryRtc = true;
        dial->done = std::move(cb);

        cancelHostDial();
        hostDial = dial;
        startDial(dial);
    }

    std::vector<PeerAddress> TransportCoordinator::bootstrapCandidates(const std::vector<PeerAddress>& bootstrap) {
        std::vector<PeerAddress> webSockets;
        std::vector<PeerAddress> tcps;

        for (const auto& address : bootstrap) {
            if (address.transport == TransportKind::WebSocket) webSockets.push_back(address);
            if (address.transport == TransportKind::Tcp) tcps.push_back(address);
        }

        // a TCP entry without an explicit WebSocket entry for its host implies the default port
        std::vector<PeerAddress> companions;
        for (const auto& address : tcps) {
            bool explicitWs = std::any_of(webSockets.begin(), webSockets.end(),
                                          [&](const PeerAddress& ws) { return ws.host == address.host; });
            if (!explicitWs) companions.push_back(webSocketCompanion(address));
        }

        std::vector<PeerAddress> out = webSockets;
        out.insert(out.end(), companions.begin(), companions.end());
        out.insert(out.end(), tcps.begin(), tcps.end());
        return out;
    }

    std::vector<PeerAddress> TransportCoordinator::candidatesFor(const MemberId& memberId, TransportKind first,
                                                                 bool withFallback) const {
        std::vector<PeerAddress> out;

        std::vector<TransportKind> order{first};
        for (TransportKind kind : TRANSPORT_PREFERENCE) {
            if (kind != first) order.push_back(kind);
        }

        auto member = registry.member(memberId);
        if (member) {
            for (TransportKind kind : order) {
                if (kind == TransportKind::WebRtc) continue;
                auto addresses = member->addressesFor(kind);
                out.insert(out.end(), addresses.begin(), addresses.end());
            }
        }

        if (withFallback) {
            for (const auto& address : registry.orderedAddresses(first, Clock::now(), selfId)) {
                if (address.transport == TransportKind::WebRtc) continue;
                if (std::find(out.begin(), out.end(), address) == out.end()) {
                    out.push_back(address);
                }
            }
        }
        return out;
    }

    void TransportCoordinator::startDial(const std::shared_ptr<Dial>& dial) {
        dialNext(dial);
    }

    void TransportCoordinator::dialNext(const std::shared_ptr<Dial>& dial) {
        if (dial->finished || !running.load()) return;

        if (dial->rtcFirst && !dial->rtcTried) {
            openRtcDial(dial);
            return;
        }

        while (dial->next < dial->candidates.size()) {
            const PeerAddress address = dial->candidates[dial->next++];
            if (!address.isValid() || address.transport == TransportKind::WebRtc) continue;
            openDialLink(dial, address);
            return;
        }

        if (dial->tryRtc && !dial->rtcTried) {
            openRtcDial(dial);
            return;
        }

        DialOutcome outcome;
        outcome.error = PartyErrc::TransportHandshakeFailed;
        outcome.reason = dial->target.empty() ? "no bootstrap address answered"
                                              : "every transport to " + dial->target + " failed";
        finishDial(dial, outcome);
    }

    void TransportCoordinator::openDialLink(const std::shared_ptr<Dial>& dial, const PeerAddress& address) {
        const uint64_t id = nextLinkId++;

        Channel channel;
        if (address.transport == TransportKind::Tcp) {
            channel = std::make_shared<TcpChannel>(io);
        } else {
            channel = std::make_shared<WsChannel>(io);
        }

        Link link;
        link.channel = channel;
        link.role = LinkRole::Dialing;
        link.peer = dial->target;
        link.address = address;
        link.timer = std::make_shared<boost::asio::steady_timer>(io);
        link.dial = dial;
        links.emplace(id, std::move(link));
        dial->linkId = id;

        attachHandlers(id, channel);
        armLinkTimer(id, config.connectTimeout, "connect to " + formatAddress(address));

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        auto onConnected = [weak, id](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (!self) return;

            auto it = self->links.find(id);
            if (it == self->links.end() || it->second.role != LinkRole::Dialing) return;

            if (ec) {
                std::cerr << "TransportCoordinator: connect to " << formatAddress(it->second.address)
                          << " failed: " << ec.message() << std::endl;
                auto pending = it->second.dial;
                self->dropLink(id);
                if (pending) self->dialNext(pending);
                return;
            }
            self->beginHandshake(id);
        };

        if (auto tcpChannel = std::get_if<TcpChannel::Ptr>(&channel)) {
            (*tcpChannel)->connectTo(address, onConnected);
        } else if (auto wsChannel = std::get_if<WsChannel::Ptr>(&channel)) {
            (*wsChannel)->connectTo(address, onConnected);
        }
    }

    void TransportCoordinator::openRtcDial(const std::shared_ptr<Dial>& dial) {
        dial->rtcTried = true;

        // signals travel over the uplink, so only the host can be reached this way
        if (!negotiator || dial->target.empty() || uplinkId == 0 || dial->target != uplinkPeer) {
            dialNext(dial);
            return;
        }

        dial->rtcPending = true;
        dial->rtcTimer = std::make_shared<boost::asio::steady_timer>(io);

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        dial->rtcTimer->expires_after(config.connectTimeout);
        dial->rtcTimer->async_wait([weak, dial](const boost::system::error_code& ec) {
            if (ec) return;
            auto self = weak.lock();
            if (!self || !dial->rtcPending) return;

            dial->rtcPending = false;
            std::cerr << "TransportCoordinator: WebRTC negotiation with " << dial->target << " timed out" << std::endl;
            if (self->negotiator) self->negotiator->close(dial->target);
            self->dialNext(dial);
        });

        negotiator->negotiate(dial->target, [weak, dial](RtcChannel::Ptr channel) {
            auto self = weak.lock();
            if (!self) return;
            boost::asio::post(self->io, [self, dial, channel] { self->onRtcNegotiated(dial, channel); });
        });
    }

    void TransportCoordinator::onRtcNegotiated(const std::shared_ptr<Dial>& dial, const RtcChannel::Ptr& channel) {
        if (dial->finished || !dial->rtcPending) {
            if (channel) channel->close();
            return;
        }

        dial->rtcPending = false;
        if (dial->rtcTimer) dial->rtcTimer->cancel();

        if (!channel) {
            std::cerr << "TransportCoordinator: WebRTC negotiation with " << dial->target << " failed" << std::endl;
            dialNext(dial);
            return;
        }

        const uint64_t id = nextLinkId++;
        Link link;
        link.channel = channel;
        link.role = LinkRole::Dialing;
        link.peer = dial->target;
        link.timer = std::make_shared<boost::asio::steady_timer>(io);
        link.dial = dial;
        links.emplace(id, std::move(link));
        dial->linkId = id;

        attachHandlers(id, Channel(channel));
        armLinkTimer(id, config.connectTimeout, "WebRTC handshake");
        beginHandshake(id);
    }

    void TransportCoordinator::beginHandshake(uint64_t id) {
        auto it = links.find(id);
        if (it == links.end()) return;

        channelStart(it->second.channel);

        PartySnapshot party = registry.snapshot();
        HandshakePayload hs;
        hs.partyId = party->partyId;
        hs.senderId = selfId;
        hs.transport = channelKind(it->second.channel);
        if (const Member* self = party->find(selfId)) {
            hs.displayName = self->displayName;
        }
        hs.tcpPort = tcpPort();
        hs.wsPort = wsPort();
        hs.advertisedHost = config.advertisedHost;
        hs.claim = elector->currentClaim(Clock::now());

        channelSend(it->second.channel, makeMessage(MessageType::HANDSHAKE, hs));
    }

    void TransportCoordinator::handleAck(uint64_t id, const HandshakeAckPayload& ack) {
        auto it = links.find(id);
        if (it == links.end()) return;

        auto dial = it->second.dial;
        const PeerAddress address = it->second.address;
        if (!dial || dial->finished) {
            dropLink(id);
            return;
        }
        if (it->second.timer) it->second.timer->cancel();

        if (!ack.accepted) {
            dropLink(id);
            if (ack.reason == REDIRECT_REASON) {
                followRedirect(dial, ack);
                return;
            }

            std::cerr << "TransportCoordinator: handshake rejected by " << ack.senderId << ": " << ack.reason << std::endl;
            DialOutcome outcome;
            outcome.error = ack.reason.rfind(partyErrcToString(PartyErrc::NameCollision), 0) == 0
                                ? PartyErrc::NameCollision
                                : PartyErrc::TransportHandshakeFailed;
            outcome.reason = ack.reason;
            outcome.ack = ack;
            finishDial(dial, outcome);
            return;
        }

        registry.merge(membersOf(ack.peers), selfId);
        if (dial->purpose == Dial::Purpose::Join) {
            registry.setPartyId(ack.peers.partyId, fromMillis(ack.peers.createdAtMs));
            registry.setActiveTransport(ack.peers.activeTransport);
        }

        if (address.isValid()) {
            if (ack.tcpPort != 0) registry.verifyAddress(ack.senderId, PeerAddress{address.host, ack.tcpPort, TransportKind::Tcp});
            if (ack.wsPort != 0) registry.verifyAddress(ack.senderId, PeerAddress{address.host, ack.wsPort, TransportKind::WebSocket});
            registry.verifyAddress(ack.senderId, address);
        }

        promoteUplink(id, ack.senderId);
        std::cout << "TransportCoordinator: uplink to host " << ack.senderId << " over "
                  << transportToString(ack.transport) << std::endl;

        DialOutcome outcome;
        outcome.ok = true;
        outcome.ack = ack;
        finishDial(dial, outcome);

        if (dial->purpose != Dial::Purpose::Join && !ack.claim.empty()) {
            elector->considerClaim(ack.claim, Clock::now());
        }
    }

    void TransportCoordinator::followRedirect(const std::shared_ptr<Dial>& dial, const HandshakeAckPayload& ack) {
        registry.merge(membersOf(ack.peers), selfId);

        const HostClaim& claim = ack.claim;
        if (claim.empty() || claim.hostId == ack.senderId) {
            dialNext(dial);
            return;
        }

        if (claim.hostId == selfId) {
            if (dial->purpose != Dial::Purpose::Join && elector->considerClaim(claim, Clock::now())) {
                DialOutcome outcome;
                outcome.ok = true;
                outcome.becameHost = true;
                outcome.ack = ack;
                finishDial(dial, outcome);
                return;
            }
            dialNext(dial);
            return;
        }

        if (++dial->redirects > MAX_HOST_REDIRECTS) {
            DialOutcome outcome;
            outcome.error = PartyErrc::TransportHandshakeFailed;
            outcome.reason = "too many host redirects";
            finishDial(dial, outcome);
            return;
        }

        std::cout << "TransportCoordinator: redirected to host " << claim.hostId << std::endl;
        dial->target = claim.hostId;
        dial->candidates = candidatesFor(claim.hostId, dial->requested, false);
        dial->next = 0;
        dial->rtcFirst = false;
        dial->tryRtc = false;
        dialNext(dial);
    }

    void TransportCoordinator::finishDial(const std::shared_ptr<Dial>& dial, const DialOutcome& outcome) {
        if (dial->finished) return;
        dial->finished = true;
        dial->rtcPending = false;
        if (dial->rtcTimer) dial->rtcTimer->cancel();
        if (hostDial == dial) hostDial.reset();

        if (!outcome.ok) {
            std::cerr << "TransportCoordinator: dial failed: " << outcome.reason << std::endl;
        }

        if (dial->done) {
            auto cb = std::move(dial->done);
            dial->done = nullptr;
            try {
                cb(outcome);
            } catch (const std::exception& e) {
                std::cerr << "TransportCoordinator: error in dial callback: " << e.what() << std::endl;
            }
        }
    }

    void TransportCoordinator::cancelHostDial() {
        if (!hostDial) return;

        auto dial = std::move(hostDial);
        hostDial.reset();
        dial->finished = true;
        dial->rtcPending = false;
        if (dial->rtcTimer) dial->rtcTimer->cancel();

        auto it = links.find(dial->linkId);
        if (it != links.end() && it->second.role == LinkRole::Dialing) {
            dropLink(dial->linkId);
        }
    }

    // ============================================================
    // Links
    // ============================================================
    void TransportCoordinator::promoteUplink(uint64_t id, const MemberId& hostId) {
        if (uplinkId != 0 && uplinkId != id) {
            retireLink(uplinkId);
        }

        auto it = links.find(id);
        if (it == links.end()) return;

        it->second.role = LinkRole::Uplink;
        it->second.peer = hostId;
        it->second.dial.reset();
        if (it->second.timer) it->second.timer->cancel();
        uplinkId = id;
        uplinkPeer = hostId;
        updateCounters();

        while (!backlog.empty()) {
            channelSend(it->second.channel, backlog.front());
            backlog.pop_front();
        }
    }

    void TransportCoordinator::retireLink(uint64_t id) {
        auto it = links.find(id);
        if (it == links.end() || it->second.role == LinkRole::Retired) return;

        Link& link = it->second;
        auto mapped = memberLinks.find(link.peer);
        if (mapped != memberLinks.end() && mapped->second == id) {
            memberLinks.erase(mapped);
        }
        if (uplinkId == id) {
            uplinkId = 0;
        }
        link.role = LinkRole::Retired;
        link.dial.reset();
        updateCounters();

        // data channels have no half-close
        if (channelKind(link.channel) == TransportKind::WebRtc) {
            dropLink(id);
            return;
        }

        channelCloseAfterFlush(link.channel);
        armLinkTimer(id, config.connectTimeout, "retirement");
    }

    void TransportCoordinator::dropLink(uint64_t id) {
        auto it = links.find(id);
        if (it == links.end()) return;

        Channel channel = it->second.channel;
        eraseLink(id);
        channelClose(channel);
    }

    void TransportCoordinator::eraseLink(uint64_t id) {
        auto it = links.find(id);
        if (it == links.end()) return;

        if (it->second.timer) it->second.timer->cancel();
        auto mapped = memberLinks.find(it->second.peer);
        if (mapped != memberLinks.end() && mapped->second == id) {
            memberLinks.erase(mapped);
        }
        if (uplinkId == id) {
            uplinkId = 0;
        }
        links.erase(it);
        updateCounters();

        if (leaving && links.empty()) {
            finishLeave();
        }
    }

    void TransportCoordinator::sendOn(uint64_t id, const Message& msg) {
        auto it = links.find(id);
        if (it == links.end()) return;
        channelSend(it->second.channel, msg);
    }

    void TransportCoordinator::broadcast(const Message& msg, const MemberId& except) {
        for (const auto& [memberId, id] : memberLinks) {
            if (memberId == except) continue;
            sendOn(id, msg);
        }
    }

    void TransportCoordinator::sendToHost(const Message& msg) {
        if (uplinkId != 0) {
            sendOn(uplinkId, msg);
        }
    }

    void TransportCoordinator::updateCounters() {
        uplinkOpen.store(uplinkId != 0);
        memberLinksOpen.store(memberLinks.size());
    }

    // ============================================================
    // Session traffic
    // ============================================================
    void TransportCoordinator::relay(const Message& msg, const MemberId& origin) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, msg, origin] { self->doRelay(msg, origin); });
    }

    void TransportCoordinator::doRelay(const Message& msg, const MemberId& origin) {
        if (isHost()) {
            PartySnapshot party = registry.snapshot();
            for (const auto& [id, member] : party->members) {
                if (id == selfId || id == origin || !member.isOnline) continue;

                auto mapped = memberLinks.find(id);
                auto it = mapped != memberLinks.end() ? links.find(mapped->second) : links.end();
                if (it == links.end() || !channelIsOpen(it->second.channel)) {
                    std::cerr << "TransportCoordinator: no open link to " << id << ", relay skipped" << std::endl;
                    registry.recordProbeFailure(id);
                    continue;
                }
                channelSend(it->second.channel, msg);
            }
            return;
        }

        if (uplinkId != 0) {
            sendToHost(msg);
            return;
        }

        if (msg.type == MessageType::CHAT) {
            // held until the next uplink opens
            backlog.push_back(msg);
            while (backlog.size() > config.dedupWindow) {
                backlog.pop_front();
            }
        }
    }

    bool TransportCoordinator::deliverChat(const Message& msg) {
        ChatPayload chat;
        if (!decode(msg.payload, chat)) {
            std::cerr << "TransportCoordinator: malformed chat message" << std::endl;
            return false;
        }

        if (onChat) {
            try {
                onChat(chat);
            } catch (const std::exception& e) {
                std::cerr << "TransportCoordinator: error in chat handler: " << e.what() << std::endl;
            }
        }
        return true;
    }

    void TransportCoordinator::applyScores(const ScoreTablePayload& table) {
        for (const auto& row : table.rows) {
            if (row.memberId.empty()) continue;

            PingSample sample;
            sample.peerId = row.memberId;
            sample.transport = row.transport;
            sample.roundTripMillis = row.millis;
            sample.measuredAt = fromMillis(row.measuredAtMs);
            registry.recordPing(row.memberId, row.transport, sample);
        }
    }

    void TransportCoordinator::shareScores() {
        auto self = shared_from_this();
        boost::asio::post(io, [self] {
            ScoreTablePayload table;
            table.senderId = self->selfId;
            table.rows = scoreRowsOf(*self->registry.snapshot());

            Message msg = makeMessage(MessageType::SCORE_TABLE, table);
            if (self->isHost()) {
                self->broadcast(msg);
            } else {
                self->sendToHost(msg);
            }
        });
    }

    void TransportCoordinator::sendChallenge(const HostClaim& claim) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, claim] {
            self->sendToHost(makeMessage(MessageType::CHALLENGE, claim));
        });
    }

    void TransportCoordinator::sendSignal(const RtcSignalPayload& signal) {
        RtcSignalPayload outgoing = signal;
        outgoing.senderId = selfId;
        if (isHost()) {
            routeSignal(outgoing);
        } else {
            sendToHost(makeMessage(MessageType::RTC_SIGNAL, outgoing));
        }
    }

    void TransportCoordinator::routeSignal(const RtcSignalPayload& signal) {
        if (signal.targetId == selfId) {
            if (negotiator) negotiator->onSignal(signal);
            return;
        }

        if (!isHost()) return;

        auto mapped = memberLinks.find(signal.targetId);
        if (mapped == memberLinks.end()) {
            std::cerr << "TransportCoordinator: no link to " << signal.targetId << " for WebRTC signal" << std::endl;
            return;
        }
        sendOn(mapped->second, makeMessage(MessageType::RTC_SIGNAL, signal));
    }

    void TransportCoordinator::onPeerUnreachable(const MemberId& memberId) {
        if (memberId.empty() || memberId == selfId) return;
        registry.markOffline(memberId);
    }

    void TransportCoordinator::memberLeft(const MemberId& memberId) {
        std::cout << "TransportCoordinator: " << memberId << " left the party" << std::endl;
        auto mapped = memberLinks.find(memberId);
        if (mapped != memberLinks.end()) {
            retireLink(mapped->second);
        }
        registry.leave(memberId);
    }

    void TransportCoordinator::onMembershipEvent(const RegistryEvent& event) {
        if (!running.load() || event.memberId == selfId || !isHost()) return;

        MemberStatusPayload status;
        status.memberId = event.memberId;
        status.online = event.online;
        status.removed = event.removed;
        broadcast(makeMessage(MessageType::MEMBER_STATUS, status), event.memberId);

        if (event.removed) {
            auto mapped = memberLinks.find(event.memberId);
            if (mapped != memberLinks.end()) {
                retireLink(mapped->second);
            }
        }
    }

    // ============================================================
    // Host changes
    // ============================================================
    void TransportCoordinator::onHostChanged(const HostClaim& claim, const MemberId& previousHost) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, claim, previousHost] {
            if (!self->running.load() || self->leaving) return;

            if (previousHost == self->selfId && !self->isHost()) {
                self->handOver(claim);
            }

            // a later change is already queued behind this one
            if (self->registry.snapshot()->hostId != claim.hostId) return;

            if (claim.hostId == self->selfId) {
                self->becomeHost();
                return;
            }

            if (self->uplinkId != 0 && self->uplinkPeer == claim.hostId) return;
            if (self->hostDial && self->hostDial->target == claim.hostId) return;
            self->reconnectTo(claim.hostId);
        });
    }

    void TransportCoordinator::becomeHost() {
        cancelHostDial();
        if (uplinkId != 0) {
            retireLink(uplinkId);
        }
        uplinkPeer.clear();
        backlog.clear();
        std::cout << "TransportCoordinator: now hosting the party" << std::endl;
    }

    void TransportCoordinator::handOver(const HostClaim& claim) {
        std::cout << "TransportCoordinator: handing over to " << claim.hostId << " (term " << claim.term << ")" << std::endl;

        // queued behind every relay already in the outboxes
        broadcast(makeMessage(MessageType::HOST_CHANGE, claim));

        std::vector<uint64_t> ids;
        for (const auto& [memberId, id] : memberLinks) {
            (void)memberId;
            ids.push_back(id);
        }
        for (uint64_t id : ids) {
            retireLink(id);
        }

        if (currentSwitch.load() == SwitchState::Preparing) {
            switchTimer.cancel();
            setSwitchState(SwitchState::Failed);
        }
    }

    void TransportCoordinator::reconnectTo(const MemberId& hostId) {
        if (uplinkId != 0) {
            retireLink(uplinkId);
        }

        const TransportKind kind = registry.snapshot()->activeTransport;
        std::cout << "TransportCoordinator: connecting to host " << hostId << " over "
                  << transportToString(kind) << std::endl;

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        dialHost(kind, hostId, [weak, hostId](const DialOutcome& outcome) {
            auto self = weak.lock();
            if (!self || outcome.ok) return;

            if (self->onConnectionLost) {
                self->onConnectionLost("cannot reach host " + hostId + ": " + outcome.reason);
            }
            // the next election picks somebody else
            self->onPeerUnreachable(hostId);
        });
    }

    // ============================================================
    // Transport switch
    // ============================================================
    void TransportCoordinator::switchTransport(TransportKind kind) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, kind] {
            if (self->isHost()) {
                self->startHostSwitch(kind);
                return;
            }

            if (self->uplinkId == 0) {
                std::cerr << "TransportCoordinator: no host to switch with" << std::endl;
                self->setSwitchState(SwitchState::Failed);
                return;
            }

            TransportChangePayload change;
            change.kind = kind;
            change.senderId = self->selfId;
            self->sendToHost(makeMessage(MessageType::TRANSPORT_CHANGE, change));
            self->setSwitchState(SwitchState::Preparing);

            std::weak_ptr<TransportCoordinator> weak = self;
            self->switchTimer.expires_after(self->config.switchTimeout);
            self->switchTimer.async_wait([weak](const boost::system::error_code& ec) {
                auto owner = weak.lock();
                if (ec || !owner) return;
                if (owner->currentSwitch.load() == SwitchState::Preparing) {
                    std::cerr << "TransportCoordinator: host never started the switch" << std::endl;
                    owner->setSwitchState(SwitchState::Failed);
                }
            });
        });
    }

    void TransportCoordinator::startHostSwitch(TransportKind kind) {
        if (!isHost()) return;
        if (currentSwitch.load() == SwitchState::Preparing && switchTarget == kind) return;

        switchTarget = kind;
        std::cout << "TransportCoordinator: switching party to " << transportToString(kind) << std::endl;
        setSwitchState(SwitchState::Preparing);

        TransportChangePayload change;
        change.kind = kind;
        change.senderId = selfId;
        Message msg = makeMessage(MessageType::TRANSPORT_CHANGE, change);
        for (const auto& [memberId, id] : memberLinks) {
            (void)memberId;
            auto it = links.find(id);
            if (it != links.end() && channelKind(it->second.channel) != kind) {
                channelSend(it->second.channel, msg);
            }
        }

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        switchTimer.expires_after(config.switchTimeout);
        switchTimer.async_wait([weak, kind](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (ec || !self) return;
            if (self->currentSwitch.load() == SwitchState::Preparing) {
                std::cerr << "TransportCoordinator: switch to " << transportToString(kind)
                          << " timed out" << std::endl;
                self->setSwitchState(SwitchState::Failed);
            }
        });

        checkSwitchProgress();
    }

    void TransportCoordinator::checkSwitchProgress() {
        if (currentSwitch.load() != SwitchState::Preparing || !isHost()) return;

        PartySnapshot party = registry.snapshot();
        for (const auto& [id, member] : party->members) {
            if (id == selfId || !member.isOnline) continue;

            auto mapped = memberLinks.find(id);
            if (mapped == memberLinks.end()) return;
            auto it = links.find(mapped->second);
            if (it == links.end() || channelKind(it->second.channel) != switchTarget) return;
        }

        switchTimer.cancel();
        setSwitchState(SwitchState::Switching);
        applyActiveTransport(switchTarget);
        setSwitchState(SwitchState::Complete);
    }

    void TransportCoordinator::beginMemberSwitch(TransportKind kind) {
        auto uplink = links.find(uplinkId);
        if (uplinkId == 0 || uplink == links.end()) return;

        switchTimer.cancel();
        if (channelKind(uplink->second.channel) == kind) {
            applyActiveTransport(kind);
            setSwitchState(SwitchState::Complete);
            return;
        }

        setSwitchState(SwitchState::Preparing);
        switchTarget = kind;

        auto dial = std::make_shared<Dial>();
        dial->purpose = Dial::Purpose::Switch;
        dial->target = uplinkPeer;
        dial->requested = kind;
        if (kind == TransportKind::WebRtc) {
            dial->rtcFirst = true;
        } else if (auto host = registry.member(uplinkPeer)) {
            dial->candidates = host->addressesFor(kind);
        }

        std::weak_ptr<TransportCoordinator> weak = shared_from_this();
        dial->done = [weak, kind](const DialOutcome& outcome) {
            auto self = weak.lock();
            if (!self) return;
            if (!outcome.ok) {
                self->setSwitchState(SwitchState::Failed);
                if (self->uplinkId == 0 && !self->uplinkPeer.empty()) {
                    self->reconnectTo(self->uplinkPeer);
                }
                return;
            }
            // new uplink is open and the old one is flushing
            self->setSwitchState(SwitchState::Switching);
            self->applyActiveTransport(kind);
            self->setSwitchState(SwitchState::Complete);
        };

        cancelHostDial();
        hostDial = dial;
        startDial(dial);
    }

    void TransportCoordinator::applyActiveTransport(TransportKind kind) {
        const TransportKind before = registry.snapshot()->activeTransport;
        registry.setActiveTransport(kind);
        if (before == kind) return;

        std::cout << "TransportCoordinator: active transport is now " << transportToString(kind) << std::endl;
        if (onTransportChanged) {
            onTransportChanged(kind);
        }
    }

    void TransportCoordinator::setSwitchState(SwitchState next) {
        if (currentSwitch.exchange(next) == next) return;

        std::cout << "TransportCoordinator: switch " << switchStateToString(next) << std::endl;
        if (onSwitchState) {
            onSwitchState(next);
        }
    }

    // ============================================================
    // Leaving
    // ============================================================
    void TransportCoordinator::leave(std::function<void()> done) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, done] {
            if (self->leaving) return;
            self->leaving = true;
            self->leaveDone = done;
            self->cancelHostDial();

            const auto now = Clock::now();
            if (self->isHost()) {
                MemberId successor = self->elector->yieldHost(now);
                if (!successor.empty()) {
                    std::cout << "TransportCoordinator: handing host role to " << successor << " before leaving" << std::endl;
                    self->broadcast(makeMessage(MessageType::HOST_CHANGE, self->elector->currentClaim(now)));
                }
            }

            DisconnectPayload bye;
            bye.senderId = self->selfId;
            Message msg = makeMessage(MessageType::DISCONNECT, bye);
            self->broadcast(msg);
            self->sendToHost(msg);

            std::vector<uint64_t> ids;
            for (const auto& [id, link] : self->links) {
                (void)link;
                ids.push_back(id);
            }
            for (uint64_t id : ids) {
                auto it = self->links.find(id);
                if (it == self->links.end()) continue;
                if (it->second.role == LinkRole::Pending || it->second.role == LinkRole::Dialing) {
                    self->dropLink(id);
                } else {
                    self->retireLink(id);
                }
            }

            std::weak_ptr<TransportCoordinator> weak = self;
            self->leaveTimer.expires_after(self->config.connectTimeout);
            self->leaveTimer.async_wait([weak](const boost::system::error_code& ec) {
                if (ec) return;
                if (auto owner = weak.lock()) owner->finishLeave();
            });

            if (self->links.empty()) {
                self->finishLeave();
            }
        });
    }

    void TransportCoordinator::finishLeave() {
        if (!leaveDone) return;

        leaveTimer.cancel();
        auto cb = std::move(leaveDone);
        leaveDone = nullptr;
        cb();
    }

} // namespace shortgap
