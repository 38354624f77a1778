#include "Elector.hpp"
#include <algorithm>
#include <iostream>

namespace shortgap {

    std::string electorStateToString(ElectorState state) {
        switch (state) {
            case ElectorState::Stable:   return "Stable";
            case ElectorState::Electing: return "Electing";
            case ElectorState::NoQuorum: return "NoQuorum";
            default:                     return "Unknown";
        }
    }

    Elector::Elector(boost::asio::io_context& ctx, PeerRegistry& reg, MemberId self, const PartyConfig& cfg)
        : io(ctx),
          registry(reg),
          selfId(std::move(self)),
          config(cfg),
          healthTimer(ctx) {}

    void Elector::setHostChangedHandler(HostChangedCallback cb) { onHostChanged = std::move(cb); }
    void Elector::setStateHandler(StateCallback cb) { onStateChanged = std::move(cb); }
    void Elector::setChallengeSender(ClaimCallback cb) { sendChallenge = std::move(cb); }

    // ============================================================
    // Lifecycle
    // ============================================================
    void Elector::start() {
        if (running.exchange(true)) return;

        std::weak_ptr<Elector> weak = shared_from_this();
        subscription = registry.subscribe([weak](const RegistryEvent& event) {
            if (auto self = weak.lock()) {
                self->onRegistryEvent(event);
            }
        });

        auto self = shared_from_this();
        boost::asio::post(io, [self] { self->scheduleHealthCheck(); });
    }

    void Elector::stop() {
        if (!running.exchange(false)) return;

        registry.unsubscribe(subscription);
        auto self = shared_from_this();
        boost::asio::post(io, [self] { self->healthTimer.cancel(); });
    }

    void Elector::scheduleHealthCheck() {
        if (!running.load()) return;

        auto self = shared_from_this();
        healthTimer.expires_after(config.healthCheckInterval);
        healthTimer.async_wait([self](const boost::system::error_code& ec) {
            if (ec || !self->running.load()) return;
            self->healthCheck(Clock::now());
            self->scheduleHealthCheck();
        });
    }

    void Elector::onRegistryEvent(const RegistryEvent& event) {
        if (event.kind != RegistryEvent::Kind::MembershipChanged) return;

        {
            std::lock_guard<std::mutex> lock(mtx);
            if (sweeping) return; // the sweep elects once at its end
        }

        if (!event.online && event.wasHost) {
            std::cout << "Elector: host " << event.memberId << (event.removed ? " left" : " went offline") << std::endl;
            runElection(Clock::now());
            return;
        }

        if (event.online) {
            PartySnapshot party = registry.snapshot();
            if (party->hostId.empty() || !party->isOnline(party->hostId)) {
                runElection(Clock::now());
            }
        }
    }

    // ============================================================
    // Election
    // ============================================================
    MemberId Elector::electHost(const Party& party, Clock::time_point now, Clock::duration freshness,
                                const MemberId& excludeId) {
        const Member* best = nullptr;
        uint32_t bestScore = 0;

        for (const auto& [id, member] : party.members) {
            if (!member.isOnline || id == excludeId) continue;

            auto score = member.averageScore(now, freshness);
            if (!score) continue;

            bool better = best == nullptr ||
                *score < bestScore ||
                (*score == bestScore && member.lastSeen < best->lastSeen) ||
                (*score == bestScore && member.lastSeen == best->lastSeen && id < best->id);
            if (better) {
                best = &member;
                bestScore = *score;
            }
        }

        if (best != nullptr) {
            return best->id;
        }

        // nobody has fresh ping data: earliest join wins
        for (const auto& [id, member] : party.members) {
            if (!member.isOnline || id == excludeId) continue;

            bool better = best == nullptr ||
                member.joinOrder < best->joinOrder ||
                (member.joinOrder == best->joinOrder && id < best->id);
            if (better) {
                best = &member;
            }
        }

        return best != nullptr ? best->id : MemberId{};
    }

    HostClaim Elector::claimFor(const Party& party, const MemberId& memberId, uint64_t term,
                                Clock::time_point now, Clock::duration freshness) {
        HostClaim claim;
        claim.hostId = memberId;
        claim.term = term;

        if (const Member* member = party.find(memberId)) {
            claim.score = member->averageScore(now, freshness);
            claim.lastSeen = member->lastSeen;
            claim.joinOrder = member->joinOrder;
        }
        return claim;
    }

    void Elector::runElection(Clock::time_point now) {
        PartySnapshot party = registry.snapshot();
        if (!party->hostId.empty() && party->isOnline(party->hostId)) {
            setState(ElectorState::Stable);
            return;
        }

        setState(ElectorState::Electing);

        MemberId winner = electHost(*party, now, config.stalenessThreshold);
        if (winner.empty()) {
            std::cerr << "Elector: no online members, waiting for quorum" << std::endl;
            setState(ElectorState::NoQuorum);
            return;
        }

        HostClaim claim = claimFor(*party, winner, party->term + 1, now, config.stalenessThreshold);
        if (!install(claim)) {
            std::cerr << "Elector: failed to install host " << winner << std::endl;
        }
    }

    bool Elector::install(const HostClaim& claim) {
        if (!registry.setHost(claim.hostId, claim.term)) {
            return false;
        }

        MemberId previous;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            changed = announcedHost != claim.hostId;
            previous = announcedHost;
            announcedHost = claim.hostId;
        }

        setState(ElectorState::Stable);

        if (changed) {
            std::cout << "Elector: host is now " << claim.hostId << " (term " << claim.term << ")" << std::endl;
            if (onHostChanged) {
                onHostChanged(claim, previous);
            }
        }
        return true;
    }

    // ============================================================
    // Failure detection
    // ============================================================
    void Elector::healthCheck(Clock::time_point now) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            sweeping = true;
        }

        registry.touch(selfId, now);

        PartySnapshot party = registry.snapshot();
        const auto staleness = config.stalenessThreshold;
        for (const auto& [id, member] : party->members) {
            if (id == selfId || !member.isOnline) continue;

            auto silence = now - member.lastSeen;
            if (silence > staleness) {
                std::cerr << "Elector: " << id << " is stale ("
                          << std::chrono::duration_cast<std::chrono::seconds>(silence).count() << "s silent, "
                          << member.failedRounds << " failed round(s)), marking offline" << std::endl;
                registry.markOffline(id);
            }
        }

        size_t evicted = registry.evictStale(now, config.evictionAge);
        if (evicted > 0) {
            std::cout << "Elector: evicted " << evicted << " long-offline member(s)" << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mtx);
            sweeping = false;
        }

        party = registry.snapshot();
        if (party->hostId.empty() || !party->isOnline(party->hostId)) {
            runElection(now);
        }
    }

    // ============================================================
    // Challenges and claims
    // ============================================================
    void Elector::onProbeRoundComplete(Clock::time_point now) {
        checkChallenge(now);
    }

    void Elector::checkChallenge(Clock::time_point now) {
        PartySnapshot party = registry.snapshot();
        const MemberId host = party->hostId;
        if (host.empty() || !party->isOnline(host)) return;

        MemberId winner = electHost(*party, now, config.stalenessThreshold);
        if (winner.empty() || winner == host) return;

        auto winnerScore = party->find(winner)->averageScore(now, config.stalenessThreshold);
        auto hostScore = party->find(host)->averageScore(now, config.stalenessThreshold);
        if (!winnerScore || (hostScore && *winnerScore >= *hostScore)) return;

        HostClaim claim = claimFor(*party, winner, party->term + 1, now, config.stalenessThreshold);
        if (host == selfId) {
            std::cout << "Elector: yielding host role to " << winner << " (" << *winnerScore << "ms)" << std::endl;
            install(claim);
        } else if (sendChallenge) {
            std::cout << "Elector: challenging host " << host << " with " << winner << " (" << *winnerScore << "ms)" << std::endl;
            sendChallenge(claim);
        }
    }

    bool Elector::considerClaim(const HostClaim& claim, Clock::time_point now) {
        if (claim.empty()) return false;

        PartySnapshot party = registry.snapshot();
        if (!party->isOnline(claim.hostId)) {
            std::cerr << "Elector: rejecting claim for unknown or offline member " << claim.hostId << std::endl;
            return false;
        }

        const bool hostUsable = !party->hostId.empty() && party->isOnline(party->hostId);
        if (hostUsable && party->hostId != claim.hostId) {
            HostClaim installed = claimFor(*party, party->hostId, party->term, now, config.stalenessThreshold);
            if (!supersedes(claim, installed)) {
                return false;
            }
        }

        HostClaim accepted = claim;
        accepted.term = std::max(claim.term, party->term);
        return install(accepted);
    }

    bool Elector::considerChallenge(const HostClaim& claim, Clock::time_point now) {
        PartySnapshot party = registry.snapshot();
        if (party->hostId != selfId || claim.empty() || claim.hostId == selfId) return false;
        if (!party->isOnline(claim.hostId)) return false;

        const Member* self = party->find(selfId);
        auto own = self != nullptr ? self->averageScore(now, config.stalenessThreshold) : std::nullopt;
        if (!claim.score || (own && *claim.score >= *own)) {
            std::cout << "Elector: ignoring challenge for " << claim.hostId << std::endl;
            return false;
        }

        HostClaim accepted = claim;
        accepted.term = std::max(claim.term, party->term + 1);
        std::cout << "Elector: challenge accepted, handing over to " << claim.hostId << std::endl;
        return install(accepted);
    }

    MemberId Elector::yieldHost(Clock::time_point now) {
        PartySnapshot party = registry.snapshot();
        MemberId winner = electHost(*party, now, config.stalenessThreshold, selfId);
        if (winner.empty()) {
            return {};
        }

        HostClaim claim = claimFor(*party, winner, party->term + 1, now, config.stalenessThreshold);
        return install(claim) ? winner : MemberId{};
    }

    HostClaim Elector::currentClaim(Clock::time_point now) const {
        PartySnapshot party = registry.snapshot();
        if (party->hostId.empty()) {
            return HostClaim{};
        }
        return claimFor(*party, party->hostId, party->term, now, config.stalenessThreshold);
    }

    ElectorState Elector::state() const {
        std::lock_guard<std::mutex> lock(mtx);
        return currentState;
    }

    bool Elector::isLocalHost() const {
        return registry.snapshot()->hostId == selfId;
    }

    void Elector::setState(ElectorState next) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (currentState == next) return;
            currentState = next;
        }

        std::cout << "Elector: state " << electorStateToString(next) << std::endl;
        if (onStateChanged) {
            onStateChanged(next);
        }
    }

} // namespace shortgap
