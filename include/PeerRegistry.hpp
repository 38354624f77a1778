#ifndef SHORTGAP_PEER_REGISTRY_HPP
#define SHORTGAP_PEER_REGISTRY_HPP

#include "Member.hpp"
#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shortgap {

    struct RegistryEvent {
        enum class Kind {
            MembershipChanged,
            ScoreUpdated
        };

        Kind kind = Kind::MembershipChanged;
        MemberId memberId;
        bool online = false;
        bool removed = false;
        bool wasHost = false; // the member held hostId when this mutation was applied
        TransportKind transport = TransportKind::Tcp;
    };

    /**
     * Sole owner of the Party. Writers are serialized by a mutex and publish a new immutable
     * snapshot per mutation; readers never block. Events are delivered in the order the
     * mutations were applied, outside the writer lock, so subscribers may call back into
     * the registry.
     */
    class PeerRegistry {
        public:
            using EventCallback = std::function<void(const RegistryEvent&)>;
            using SubscriptionId = uint64_t;

            PeerRegistry();
            ~PeerRegistry() = default;

            PeerRegistry(const PeerRegistry&) = delete;
            PeerRegistry& operator=(const PeerRegistry&) = delete;

            /**
             * Adds a member. An empty id is filled with a fresh one; an id already present is
             * re-activated (name and addresses refreshed) and returned unchanged. The display
             * name is made unique with a `-N` suffix.
             *
             * @throws PartyError(NameCollision) if no unique suffix is left.
             */
            MemberId join(const Member& member);

            /** Removes a member; unknown ids are ignored. Removing the host clears hostId. */
            void leave(const MemberId& memberId);

            /**
             * Stores a latency sample under `transport` and refreshes lastSeen. Unknown ids and
             * samples older than the stored entry are ignored.
             */
            void recordPing(const MemberId& memberId, TransportKind transport, const PingSample& sample);

            /** Counts a probe round in which every probe to the member failed. */
            void recordProbeFailure(const MemberId& memberId);

            void markOffline(const MemberId& memberId);
            void markOnline(const MemberId& memberId);

            /** Refreshes lastSeen after traffic from the member (never moves it backwards). */
            void touch(const MemberId& memberId, Clock::time_point when = Clock::now());

            /** Moves `address` to the front of the member's list, adding it if missing. */
            void verifyAddress(const MemberId& memberId, const PeerAddress& address);

            /**
             * Applies a peer list received from another node. Known members take the remote
             * name, join order and online flag, the newer lastSeen and the newer score per
             * transport; unknown members are added. `selfId` only takes the remote name.
             */
            void merge(const std::vector<Member>& members, const MemberId& selfId);

            /**
             * Installs a host for `term`.
             *
             * @return false if the member is unknown or offline.
             */
            bool setHost(const MemberId& memberId, uint64_t term);

            void setActiveTransport(TransportKind transport);
            void setPartyId(const std::string& partyId, Clock::time_point createdAt);
            void addBootstrapAddresses(const std::vector<PeerAddress>& addresses);

            /**
             * Reconnection fallback list: addresses of online members (lowest average score
             * first, unscored members after in join order), then the bootstrap list.
             * Addresses of `transport` come first within each member.
             */
            std::vector<PeerAddress> orderedAddresses(TransportKind transport, Clock::time_point now,
                                                      const MemberId& excludeId = "") const;

            /**
             * Removes members that have been offline for longer than `maxAge`.
             *
             * @return the number of members removed.
             */
            size_t evictStale(Clock::time_point now, Clock::duration maxAge);

            PartySnapshot snapshot() const;
            std::optional<Member> member(const MemberId& memberId) const;
            size_t size() const;

            SubscriptionId subscribe(EventCallback callback);
            void unsubscribe(SubscriptionId id);

        private:
            /**
             * Runs `mutate` on a private copy of the party under the writer lock, publishes the
             * copy if `mutate` returned true and queues the events it produced.
             */
            template <typename Fn>
            void update(Fn mutate);

            void dispatchPending();

            static std::string uniqueName(const Party& party, const std::string& desired, const MemberId& selfId);

            mutable std::mutex mtx;
            std::shared_ptr<const Party> current;

            std::mutex subscriberMtx;
            std::map<SubscriptionId, EventCallback> subscribers;
            SubscriptionId nextSubscription = 1;

            std::mutex eventMtx;
            std::deque<RegistryEvent> pending;
            bool dispatching = false;
    };

} // namespace shortgap

#endif // SHORTGAP_PEER_REGISTRY_HPP
