#include "PeerRegistry.hpp"
#include "Identity.hpp"
#include "PartyError.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <cctype>
#include <limits>

namespace shortgap {

    namespace {

        RegistryEvent membershipEvent(const MemberId& id, bool online, bool removed, bool wasHost) {
            RegistryEvent event;
            event.kind = RegistryEvent::Kind::MembershipChanged;
            event.memberId = id;
            event.online = online;
            event.removed = removed;
            event.wasHost = wasHost;
            return event;
        }

        RegistryEvent scoreEvent(const MemberId& id, TransportKind transport) {
            RegistryEvent event;
            event.kind = RegistryEvent::Kind::ScoreUpdated;
            event.memberId = id;
            event.transport = transport;
            return event;
        }

    } // namespace

    PeerRegistry::PeerRegistry() : current(std::make_shared<const Party>()) {}

    // ============================================================
    // Mutation plumbing
    // ============================================================
    template <typename Fn>
    void PeerRegistry::update(Fn mutate) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto next = std::make_shared<Party>(*current);
            std::vector<RegistryEvent> events;

            if (mutate(*next, events)) {
                std::atomic_store(&current, std::shared_ptr<const Party>(std::move(next)));
            }

            if (!events.empty()) {
                // queued under the writer lock so the queue order is the application order
                std::lock_guard<std::mutex> eventLock(eventMtx);
                pending.insert(pending.end(), events.begin(), events.end());
            }
        }
        dispatchPending();
    }

    void PeerRegistry::dispatchPending() {
        std::unique_lock<std::mutex> lock(eventMtx);
        if (dispatching) {
            return; // the active dispatcher drains what we queued
        }
        dispatching = true;

        while (!pending.empty()) {
            RegistryEvent event = pending.front();
            pending.pop_front();
            lock.unlock();

            std::vector<EventCallback> callbacks;
            {
                std::lock_guard<std::mutex> subLock(subscriberMtx);
                callbacks.reserve(subscribers.size());
                for (const auto& [id, callback] : subscribers) {
                    (void)id;
                    callbacks.push_back(callback);
                }
            }

            for (const auto& callback : callbacks) {
                try {
                    callback(event);
                } catch (const std::exception& e) {
                    std::cerr << "PeerRegistry: subscriber error: " << e.what() << std::endl;
                }
            }

            lock.lock();
        }

        dispatching = false;
    }

    // ============================================================
    // Membership
    // ============================================================
    std::string PeerRegistry::uniqueName(const Party& party, const std::string& desired, const MemberId& selfId) {
        auto taken = [&party, &selfId](const std::string& name) {
            return std::any_of(party.members.begin(), party.members.end(), [&](const auto& kv) {
                return kv.first != selfId && kv.second.displayName == name;
            });
        };

        if (!taken(desired)) {
            return desired;
        }

        // next suffix is one past the highest "desired-N" already in use, at least 2
        const std::string prefix = desired + "-";
        uint64_t suffix = 2;
        for (const auto& [id, member] : party.members) {
            if (id == selfId) continue;
            const std::string& name = member.displayName;
            if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) continue;

            const std::string digits = name.substr(prefix.size());
            if (digits.size() > 10 || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) continue;

            uint64_t value = std::stoull(digits);
            if (value > std::numeric_limits<uint32_t>::max()) continue;
            suffix = std::max(suffix, value + 1);
        }

        while (suffix <= std::numeric_limits<uint32_t>::max()) {
            std::string candidate = prefix + std::to_string(suffix);
            if (!taken(candidate)) {
                return candidate;
            }
            ++suffix;
        }

        throw PartyError(PartyErrc::NameCollision, "no free suffix for display name '" + desired + "'");
    }

    MemberId PeerRegistry::join(const Member& candidate) {
        const MemberId assigned = candidate.id.empty() ? generateMemberId() : candidate.id;
        const auto now = Clock::now();

        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.find(assigned);
            if (it != party.members.end()) {
                Member& existing = it->second;
                if (!candidate.displayName.empty() && candidate.displayName != existing.displayName) {
                    existing.displayName = uniqueName(party, candidate.displayName, assigned);
                }

                std::vector<PeerAddress> addresses = candidate.addresses;
                for (const auto& address : existing.addresses) {
                    if (std::none_of(addresses.begin(), addresses.end(),
                                     [&](const PeerAddress& a) { return a == address; })) {
                        addresses.push_back(address);
                    }
                }
                existing.addresses = std::move(addresses);
                existing.failedRounds = 0;
                existing.lastSeen = std::max(existing.lastSeen, now);

                if (!existing.isOnline) {
                    existing.isOnline = true;
                    events.push_back(membershipEvent(assigned, true, false, false));
                }
                return true;
            }

            Member joined = candidate;
            joined.id = assigned;
            joined.displayName = uniqueName(party, candidate.displayName.empty() ? "member" : candidate.displayName, assigned);
            joined.joinOrder = party.nextJoinOrder++;
            joined.isOnline = true;
            joined.failedRounds = 0;
            joined.lastSeen = now;

            party.members.emplace(assigned, std::move(joined));
            events.push_back(membershipEvent(assigned, true, false, false));
            return true;
        });

        return assigned;
    }

    void PeerRegistry::leave(const MemberId& memberId) {
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.find(memberId);
            if (it == party.members.end()) {
                return false;
            }

            const bool wasHost = party.hostId == memberId;
            if (wasHost) {
                party.hostId.clear();
            }
            party.members.erase(it);
            events.push_back(membershipEvent(memberId, false, true, wasHost));
            return true;
        });
    }

    void PeerRegistry::markOffline(const MemberId& memberId) {
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.find(memberId);
            if (it == party.members.end() || !it->second.isOnline) {
                return false;
            }

            it->second.isOnline = false;
            it->second.offlineSince = Clock::now();

            const bool wasHost = party.hostId == memberId;
            if (wasHost) {
                party.hostId.clear();
            }
            events.push_back(membershipEvent(memberId, false, false, wasHost));
            return true;
        });
    }

    void PeerRegistry::markOnline(const MemberId& memberId) {
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.find(memberId);
            if (it == party.members.end() || it->second.isOnline) {
                return false;
            }

            it->second.isOnline = true;
            it->second.failedRounds = 0;
            it->second.lastSeen = std::max(it->second.lastSeen, Clock::now());
            events.push_back(membershipEvent(memberId, true, false, false));
            return true;
        });
    }

    // ============================================================
    // Liveness and scores
    // ============================================================
    void PeerRegistry::recordPing(const MemberId& memberId, TransportKind transport, const PingSample& sample) {
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.find(memberId);
            if (it == party.members.end()) {
                return false; // late sample after leave
            }

            Member& member = it->second;
            auto scoreIt = member.pingScores.find(transport);
            if (scoreIt != member.pingScores.end() && sample.measuredAt < scoreIt->second.measuredAt) {
                return false;
            }

            member.pingScores[transport] = ScoreEntry{sample.roundTripMillis, sample.measuredAt};
            member.lastSeen = std::max(member.lastSeen, sample.measuredAt);
            member.failedRounds = 0;
            events.push_back(scoreEvent(memberId, transport));
            return true;
        });
    }

    void PeerRegistry::recordProbeFailure(const MemberId& memberId) {
        update([&](Party& party, std::vector<RegistryEvent>&) {
            auto it = party.members.find(memberId);
            if (it == party.members.end()) {
                return false;
            }
            it->second.failedRounds++;
            return true;
        });
    }

    void PeerRegistry::touch(const MemberId& memberId, Clock::time_point when) {
        update([&](Party& party, std::vector<RegistryEvent>&) {
            auto it = party.members.find(memberId);
            if (it == party.members.end() || when <= it->second.lastSeen) {
                return false;
            }
            it->second.lastSeen = when;
            return true;
        });
    }

    void PeerRegistry::verifyAddress(const MemberId& memberId, const PeerAddress& address) {
        if (!address.isValid()) {
            return;
        }

        update([&](Party& party, std::vector<RegistryEvent>&) {
            auto it = party.members.find(memberId);
            if (it == party.members.end()) {
                return false;
            }

            auto& addresses = it->second.addresses;
            if (!addresses.empty() && addresses.front() == address) {
                return false;
            }
            addresses.erase(std::remove(addresses.begin(), addresses.end(), address), addresses.end());
            addresses.insert(addresses.begin(), address);
            return true;
        });
    }

    // ============================================================
    // Gossip
    // ============================================================
    void PeerRegistry::merge(const std::vector<Member>& members, const MemberId& selfId) {
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            bool changed = false;

            for (const auto& remote : members) {
                if (remote.id.empty()) continue;

                if (remote.joinOrder >= party.nextJoinOrder) {
                    party.nextJoinOrder = remote.joinOrder + 1;
                }

                auto it = party.members.find(remote.id);
                if (it == party.members.end()) {
                    if (remote.id == selfId) continue;
                    Member added = remote;
                    added.failedRounds = 0;
                    added.offlineSince = remote.isOnline ? Clock::time_point{} : Clock::now();
                    party.members.emplace(remote.id, std::move(added));
                    events.push_back(membershipEvent(remote.id, remote.isOnline, false, false));
                    changed = true;
                    continue;
                }

                Member& local = it->second;
                if (!remote.displayName.empty()) {
                    local.displayName = remote.displayName;
                }
                if (remote.joinOrder != 0) {
                    local.joinOrder = remote.joinOrder;
                }
                for (const auto& address : remote.addresses) {
                    if (std::find(local.addresses.begin(), local.addresses.end(), address) == local.addresses.end()) {
                        local.addresses.push_back(address);
                    }
                }
                for (const auto& [transport, entry] : remote.pingScores) {
                    auto scoreIt = local.pingScores.find(transport);
                    if (scoreIt == local.pingScores.end() || scoreIt->second.measuredAt < entry.measuredAt) {
                        local.pingScores[transport] = entry;
                        events.push_back(scoreEvent(remote.id, transport));
                    }
                }
                changed = true;

                if (remote.id == selfId) continue;

                local.lastSeen = std::max(local.lastSeen, remote.lastSeen);
                if (remote.isOnline != local.isOnline) {
                    local.isOnline = remote.isOnline;
                    local.failedRounds = 0;
                    bool wasHost = false;
                    if (!remote.isOnline) {
                        local.offlineSince = Clock::now();
                        if (party.hostId == remote.id) {
                            party.hostId.clear();
                            wasHost = true;
                        }
                    }
                    events.push_back(membershipEvent(remote.id, remote.isOnline, false, wasHost));
                }
            }

            return changed;
        });
    }

    // ============================================================
    // Party fields
    // ============================================================
    bool PeerRegistry::setHost(const MemberId& memberId, uint64_t term) {
        bool installed = false;
        update([&](Party& party, std::vector<RegistryEvent>&) {
            if (!party.isOnline(memberId)) {
                return false;
            }
            installed = true;
            if (party.hostId == memberId && party.term == term) {
                return false;
            }
            party.hostId = memberId;
            party.term = term;
            return true;
        });
        return installed;
    }

    void PeerRegistry::setActiveTransport(TransportKind transport) {
        update([&](Party& party, std::vector<RegistryEvent>&) {
            if (party.activeTransport == transport) {
                return false;
            }
            party.activeTransport = transport;
            return true;
        });
    }

    void PeerRegistry::setPartyId(const std::string& partyId, Clock::time_point createdAt) {
        update([&](Party& party, std::vector<RegistryEvent>&) {
            party.partyId = partyId;
            party.createdAt = createdAt;
            return true;
        });
    }

    void PeerRegistry::addBootstrapAddresses(const std::vector<PeerAddress>& addresses) {
        update([&](Party& party, std::vector<RegistryEvent>&) {
            bool changed = false;
            for (const auto& address : addresses) {
                if (!address.isValid()) continue;
                if (std::find(party.bootstrap.begin(), party.bootstrap.end(), address) != party.bootstrap.end()) continue;
                party.bootstrap.push_back(address);
                changed = true;
            }
            return changed;
        });
    }

    std::vector<PeerAddress> PeerRegistry::orderedAddresses(TransportKind transport, Clock::time_point now,
                                                            const MemberId& excludeId) const {
        PartySnapshot party = snapshot();

        std::vector<const Member*> candidates;
        for (const auto& [id, member] : party->members) {
            if (id == excludeId || !member.isOnline) continue;
            candidates.push_back(&member);
        }

        // same ordering as the election: scored by score, unscored by join order
        std::sort(candidates.begin(), candidates.end(), [now](const Member* a, const Member* b) {
            auto scoreA = a->averageScore(now, STALENESS_THRESHOLD);
            auto scoreB = b->averageScore(now, STALENESS_THRESHOLD);
            if (scoreA.has_value() != scoreB.has_value()) return scoreA.has_value();
            if (scoreA && *scoreA != *scoreB) return *scoreA < *scoreB;
            if (a->joinOrder != b->joinOrder) return a->joinOrder < b->joinOrder;
            return a->id < b->id;
        });

        std::vector<PeerAddress> result;
        auto add = [&result](const PeerAddress& address) {
            if (std::find(result.begin(), result.end(), address) == result.end()) {
                result.push_back(address);
            }
        };

        for (const Member* member : candidates) {
            for (const auto& address : member->addressesFor(transport)) add(address);
            for (const auto& address : member->addresses) add(address);
        }
        for (const auto& address : party->bootstrap) add(address);

        return result;
    }

    size_t PeerRegistry::evictStale(Clock::time_point now, Clock::duration maxAge) {
        size_t removed = 0;
        update([&](Party& party, std::vector<RegistryEvent>& events) {
            auto it = party.members.begin();
            while (it != party.members.end()) {
                const Member& member = it->second;
                if (!member.isOnline && now - member.offlineSince > maxAge) {
                    events.push_back(membershipEvent(it->first, false, true, false));
                    it = party.members.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            return removed > 0;
        });
        return removed;
    }

    // ============================================================
    // Readers
    // ============================================================
    PartySnapshot PeerRegistry::snapshot() const {
        return std::atomic_load(&current);
    }

    std::optional<Member> PeerRegistry::member(const MemberId& memberId) const {
        PartySnapshot party = snapshot();
        const Member* found = party->find(memberId);
        if (found == nullptr) {
            return std::nullopt;
        }
        return *found;
    }

    size_t PeerRegistry::size() const {
        return snapshot()->members.size();
    }

    PeerRegistry::SubscriptionId PeerRegistry::subscribe(EventCallback callback) {
        std::lock_guard<std::mutex> lock(subscriberMtx);
        SubscriptionId id = nextSubscription++;
        subscribers.emplace(id, std::move(callback));
        return id;
    }

    void PeerRegistry::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(subscriberMtx);
        subscribers.erase(id);
    }

} // namespace shortgap
