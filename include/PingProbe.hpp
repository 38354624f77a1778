#ifndef SHORTGAP_PING_PROBE_HPP
#define SHORTGAP_PING_PROBE_HPP

#include "Message.hpp"
#include "PartyConfig.hpp"
#include "PeerRegistry.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace shortgap {

    using tcp = boost::asio::ip::tcp;

    /**
     * Periodic latency rounds. Every cadence each online peer is probed in parallel: a TCP
     * connect to its listen address, a PROBE/PROBE_ECHO exchange on that socket and, when a
     * WebRTC data channel to it is already open, the channel's RTT. Each probe has its own
     * ceiling. The integer mean of the probes that succeeded is recorded in the registry;
     * a peer with no successful probe gets a probe failure instead.
     *
     * All round state lives on the io_context thread.
     */
    class PingProbe : public std::enable_shared_from_this<PingProbe> {
        public:
            using Ptr = std::shared_ptr<PingProbe>;
            using RttSource = std::function<std::optional<uint32_t>(const MemberId&)>;
            using RoundCallback = std::function<void(uint64_t roundId)>;

            PingProbe(boost::asio::io_context& ctx, PeerRegistry& registry, MemberId selfId, const PartyConfig& config);
            ~PingProbe() = default;

            /** Subscribes to the registry and arms the cadence timer. */
            void start();
            void stop();

            /**
             * Cadence tick. Starts a round unless one is in flight; a round older than twice
             * the cadence is abandoned first and its late results discarded.
             */
            void runRound();

            /** Drops the in-flight probe of a member that left; its result is discarded. */
            void cancelMember(const MemberId& memberId);

            void setRttSource(RttSource source);
            void setRoundCompleteHandler(RoundCallback cb);

            bool roundInFlight() const { return inFlight.load(); }
            uint64_t completedRounds() const { return completed.load(); }

            /** Integer mean of the successful probes; empty if all failed. */
            static std::optional<uint32_t> combine(const std::vector<std::optional<uint32_t>>& probes);

        private:
            struct Attempt {
                explicit Attempt(boost::asio::io_context& ctx) : resolver(ctx), socket(ctx), timer(ctx) {}

                MemberId peerId;
                PeerAddress address;
                tcp::resolver resolver;
                tcp::socket socket;
                boost::asio::steady_timer timer;
                std::chrono::steady_clock::time_point phaseStart;
                std::vector<uint8_t> headerBuf;
                std::vector<uint8_t> bodyBuf;
                uint64_t nonce = 0;
                std::optional<uint32_t> connectMillis;
                std::optional<uint32_t> echoMillis;
                bool cancelled = false;
                bool done = false;
            };

            struct Round {
                uint64_t id = 0;
                TransportKind transport = TransportKind::Tcp;
                std::chrono::steady_clock::time_point startedAt;
                size_t outstanding = 0;
                std::vector<uint32_t> scores;
                std::unordered_map<MemberId, std::shared_ptr<Attempt>> attempts;
                bool abandoned = false;
            };

            void scheduleTick();
            void onTick();
            void beginRound();
            void abandonRound();

            void probePeer(const std::shared_ptr<Round>& round, const Member& peer);
            void startConnect(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt,
                              const tcp::resolver::results_type& endpoints);
            void startEcho(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt);
            void readEcho(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt);
            void armTimer(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt);
            void finishAttempt(const std::shared_ptr<Round>& round, const std::shared_ptr<Attempt>& attempt);
            void finishRound(const std::shared_ptr<Round>& round);

            static uint32_t elapsedMillis(std::chrono::steady_clock::time_point since);

            boost::asio::io_context& io;
            PeerRegistry& registry;
            MemberId selfId;
            PartyConfig config;

            boost::asio::steady_timer cadenceTimer;
            std::shared_ptr<Round> current;
            uint64_t nextRoundId = 1;

            RttSource rttSource;
            RoundCallback onRoundComplete;
            PeerRegistry::SubscriptionId subscription = 0;

            std::atomic<bool> running{false};
            std::atomic<bool> inFlight{false};
            std::atomic<uint64_t> completed{0};
    };

} // namespace shortgap

#endif // SHORTGAP_PING_PROBE_HPP
