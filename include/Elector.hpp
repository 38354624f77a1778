#ifndef SHORTGAP_ELECTOR_HPP
#define SHORTGAP_ELECTOR_HPP

#include "Member.hpp"
#include "PartyConfig.hpp"
#include "PeerRegistry.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace shortgap {

    enum class ElectorState {
        Stable,   // a host is installed and online
        Electing, // host lost or never set
        NoQuorum  // no online member left
    };

    std::string electorStateToString(ElectorState state);

    /**
     * Host election and failure detection.
     *
     * The election itself is a pure function of a registry snapshot. Host changes are applied
     * through PeerRegistry::setHost and announced through the host-changed handler; the
     * transport layer reacts to that handler, the Elector never touches a connection.
     */
    class Elector : public std::enable_shared_from_this<Elector> {
        public:
            using Ptr = std::shared_ptr<Elector>;
            using HostChangedCallback = std::function<void(const HostClaim& claim, const MemberId& previousHost)>;
            using StateCallback = std::function<void(ElectorState)>;
            using ClaimCallback = std::function<void(const HostClaim& claim)>;

            Elector(boost::asio::io_context& ctx, PeerRegistry& registry, MemberId selfId, const PartyConfig& config);
            ~Elector() = default;

            /** Subscribes to registry events and arms the health-check timer. */
            void start();
            void stop();

            /**
             * Deterministic winner for a snapshot. Tier one: online members with a score
             * measured within `freshness`, lowest average score, then earliest lastSeen, then
             * lowest id. Tier two, when nobody has a fresh score: earliest joinOrder, then
             * lowest id. `excludeId` is skipped (a host that is leaving).
             *
             * @return empty when no member is online.
             */
            static MemberId electHost(const Party& party, Clock::time_point now, Clock::duration freshness,
                                      const MemberId& excludeId = "");

            /** The claim a node would make for `memberId` at `term`, from its own view. */
            static HostClaim claimFor(const Party& party, const MemberId& memberId, uint64_t term,
                                      Clock::time_point now, Clock::duration freshness);

            /**
             * Failure-detection sweep: refreshes the local member, marks stale peers offline,
             * evicts members offline past the eviction age and elects if the host is missing.
             */
            void healthCheck(Clock::time_point now);

            /** Elects a replacement for a missing or offline host (next term). */
            void runElection(Clock::time_point now);

            /**
             * Re-runs the election against the installed host. If a strictly better-scored
             * member wins, a local host yields to it; otherwise the challenge claim is handed
             * to the challenge sender for delivery to the host.
             */
            void checkChallenge(Clock::time_point now);

            /** Called once per completed probe round. */
            void onProbeRoundComplete(Clock::time_point now);

            /**
             * Reconciles a claim received from another node (handshake or HOST_CHANGE).
             * Accepted if no online host is installed, or if it supersedes the installed
             * host's claim. Claims naming an unknown or offline member are rejected.
             *
             * @return true if the claim was installed.
             */
            bool considerClaim(const HostClaim& claim, Clock::time_point now);

            /**
             * A CHALLENGE received by the local host. Accepted only if the challenger's score
             * is strictly better than the host's own.
             */
            bool considerChallenge(const HostClaim& claim, Clock::time_point now);

            /**
             * Hands the host role to the best other online member (leaving host).
             *
             * @return the new host, or empty if nobody else is online.
             */
            MemberId yieldHost(Clock::time_point now);

            /** Claim for the currently installed host. */
            HostClaim currentClaim(Clock::time_point now) const;

            ElectorState state() const;
            bool isLocalHost() const;

            void setHostChangedHandler(HostChangedCallback cb);
            void setStateHandler(StateCallback cb);
            void setChallengeSender(ClaimCallback cb);

        private:
            void onRegistryEvent(const RegistryEvent& event);
            void scheduleHealthCheck();
            bool install(const HostClaim& claim);
            void setState(ElectorState next);

            boost::asio::io_context& io;
            PeerRegistry& registry;
            MemberId selfId;
            PartyConfig config;

            boost::asio::steady_timer healthTimer;
            PeerRegistry::SubscriptionId subscription = 0;
            std::atomic<bool> running{false};

            mutable std::mutex mtx;
            ElectorState currentState = ElectorState::Electing;
            MemberId announcedHost;
            bool sweeping = false;

            HostChangedCallback onHostChanged;
            StateCallback onStateChanged;
            ClaimCallback sendChallenge;
    };

} // namespace shortgap

#endif // SHORTGAP_ELECTOR_HPP
