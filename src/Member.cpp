#include "Member.hpp"
#include <algorithm>
#include <iterator>

namespace shortgap {

    std::optional<uint32_t> Member::averageScore(Clock::time_point now, Clock::duration freshness) const {
        uint64_t total = 0;
        uint32_t count = 0;

        for (const auto& [transport, entry] : pingScores) {
            (void)transport;
            if (now - entry.measuredAt > freshness) continue;
            total += entry.roundTripMillis;
            ++count;
        }

        if (count == 0) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(total / count);
    }

    std::optional<PeerAddress> Member::preferredAddress(TransportKind transport) const {
        auto it = std::find_if(addresses.begin(), addresses.end(),
                               [transport](const PeerAddress& a) { return a.transport == transport; });
        if (it == addresses.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<PeerAddress> Member::addressesFor(TransportKind transport) const {
        std::vector<PeerAddress> result;
        std::copy_if(addresses.begin(), addresses.end(), std::back_inserter(result),
                     [transport](const PeerAddress& a) { return a.transport == transport; });
        return result;
    }

    const Member* Party::find(const MemberId& id) const {
        auto it = members.find(id);
        return it == members.end() ? nullptr : &it->second;
    }

    size_t Party::onlineCount() const {
        return static_cast<size_t>(std::count_if(members.begin(), members.end(),
                                                 [](const auto& kv) { return kv.second.isOnline; }));
    }

    bool Party::isOnline(const MemberId& id) const {
        const Member* member = find(id);
        return member != nullptr && member->isOnline;
    }

    bool ranksBefore(const HostClaim& a, const HostClaim& b) {
        if (a.score.has_value() != b.score.has_value()) {
            return a.score.has_value();
        }

        if (a.score.has_value()) {
            if (*a.score != *b.score) return *a.score < *b.score;
            if (a.lastSeen != b.lastSeen) return a.lastSeen < b.lastSeen;
        } else {
            if (a.joinOrder != b.joinOrder) return a.joinOrder < b.joinOrder;
        }

        return a.hostId < b.hostId;
    }

    bool supersedes(const HostClaim& candidate, const HostClaim& current) {
        if (candidate.empty()) return false;
        if (current.empty()) return true;
        if (candidate.term != current.term) return candidate.term > current.term;
        if (candidate.hostId == current.hostId) return false;
        return ranksBefore(candidate, current);
    }

} // namespace shortgap
