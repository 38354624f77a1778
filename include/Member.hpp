#ifndef SHORTGAP_MEMBER_HPP
#define SHORTGAP_MEMBER_HPP

#include "Address.hpp"
#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shortgap {

    /** One latency measurement, consumed by PeerRegistry::recordPing and then discarded. */
    struct PingSample {
        MemberId peerId;
        TransportKind transport = TransportKind::Tcp;
        uint32_t roundTripMillis = 0;
        Clock::time_point measuredAt = Clock::now();
    };

    struct ScoreEntry {
        uint32_t roundTripMillis = 0;
        Clock::time_point measuredAt;
    };

    struct Member {
        MemberId id;
        std::string displayName;
        std::vector<PeerAddress> addresses; // most recently verified first
        bool isOnline = true;
        Clock::time_point lastSeen = Clock::now();
        std::map<TransportKind, ScoreEntry> pingScores;

        uint64_t joinOrder = 0;
        uint32_t failedRounds = 0;
        Clock::time_point offlineSince;

        /**
         * Mean of the pingScores entries measured within `freshness` of `now`.
         *
         * @return empty if no entry is fresh enough.
         */
        std::optional<uint32_t> averageScore(Clock::time_point now, Clock::duration freshness) const;

        /** First address of the given transport, in verification order. */
        std::optional<PeerAddress> preferredAddress(TransportKind transport) const;

        std::vector<PeerAddress> addressesFor(TransportKind transport) const;
    };

    struct Party {
        std::string partyId;
        MemberId hostId;
        uint64_t term = 0; // generation of the accepted host claim
        TransportKind activeTransport = TransportKind::WebSocket;
        std::unordered_map<MemberId, Member> members;
        Clock::time_point createdAt = Clock::now();
        std::vector<PeerAddress> bootstrap;
        uint64_t nextJoinOrder = 1;

        const Member* find(const MemberId& id) const;
        size_t onlineCount() const;
        bool isOnline(const MemberId& id) const;
    };

    using PartySnapshot = std::shared_ptr<const Party>;

    /**
     * A proposal that `hostId` hosts the party for generation `term`. Claims are exchanged in
     * handshakes, HOST_CHANGE and CHALLENGE messages and are totally ordered, so every node that
     * sees the same set of claims settles on the same host.
     */
    struct HostClaim {
        MemberId hostId;
        uint64_t term = 0;
        std::optional<uint32_t> score;
        Clock::time_point lastSeen;
        uint64_t joinOrder = 0;

        bool empty() const { return hostId.empty(); }
    };

    /**
     * Election ordering: scored before unscored; lower score, then earlier lastSeen for scored
     * claims; earlier joinOrder for unscored ones; member id as the final tie-break.
     * Terms are not compared here.
     */
    bool ranksBefore(const HostClaim& a, const HostClaim& b);

    /**
     * Claim reconciliation: a higher term wins, equal terms fall back to ranksBefore.
     */
    bool supersedes(const HostClaim& candidate, const HostClaim& current);

} // namespace shortgap

#endif // SHORTGAP_MEMBER_HPP
