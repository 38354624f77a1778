#ifndef SHORTGAP_TRANSPORT_COORDINATOR_HPP
#define SHORTGAP_TRANSPORT_COORDINATOR_HPP

#include "Channel.hpp"
#include "Elector.hpp"
#include "PartyConfig.hpp"
#include "PartyError.hpp"
#include "Payloads.hpp"
#include "PeerRegistry.hpp"
#include "RtcNegotiator.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shortgap {

    enum class SwitchState {
        Idle,
        Preparing, // new links being opened, old ones still carry traffic
        Switching, // activeTransport being flipped, old links retiring
        Complete,
        Failed
    };

    std::string switchStateToString(SwitchState state);

    // ACK reason sent by a node that is not the host; the ACK carries the host's claim
    inline constexpr const char* REDIRECT_REASON = "redirect";

    /** Result of dialing the host. */
    struct DialOutcome {
        bool ok = false;
        bool becameHost = false; // a redirect named this node as host
        PartyErrc error = PartyErrc::TransportHandshakeFailed;
        std::string reason;
        HandshakeAckPayload ack;
    };

    /**
     * Owns every session channel of the node. The session is a star: the host keeps one link
     * per online member and relays traffic, every other member keeps a single uplink to the
     * host. Both TCP and WebSocket listeners run on every node, so any member can take over.
     *
     * All state lives on the io_context thread. Public methods may be called from any thread
     * and post their work, except start(), which must run before the io_context does.
     */
    class TransportCoordinator : public std::enable_shared_from_this<TransportCoordinator> {
        public:
            using Ptr = std::shared_ptr<TransportCoordinator>;
            using ChatCallback = std::function<void(const ChatPayload&)>;
            using TransportCallback = std::function<void(TransportKind)>;
            using SwitchStateCallback = std::function<void(SwitchState)>;
            using ConnectionLostCallback = std::function<void(const std::string& reason)>;
            using DialCallback = std::function<void(const DialOutcome&)>;

            TransportCoordinator(boost::asio::io_context& ctx, PeerRegistry& registry, Elector::Ptr elector,
                                 MemberId selfId, const PartyConfig& config);
            ~TransportCoordinator() = default;

            /**
             * Binds the TCP and WebSocket listeners and queues the accept loops.
             *
             * @throws boost::system::system_error if a listener cannot be bound.
             */
            void start();

            /** Closes listeners and every link without notifying peers. */
            void stop();

            uint16_t tcpPort() const { return boundTcpPort.load(); }
            uint16_t wsPort() const { return boundWsPort.load(); }

            /**
             * Joins through the bootstrap addresses: WebSocket addresses first, then TCP,
             * following redirects to the host. On success the host link becomes the uplink and
             * the host's peer list is merged; host claim reconciliation is left to the caller.
             */
            void join(const std::vector<PeerAddress>& bootstrap, DialCallback cb);

            /**
             * Opens the uplink to `memberId`: its addresses of `transport` first, then the
             * other transports in preference order, then the registry's reconnection list.
             * Each attempt has the connect timeout as ceiling.
             */
            void connect(TransportKind transport, const MemberId& memberId, DialCallback cb);

            /**
             * Host: announce, wait until every online member has a link of `kind`, then flip
             * activeTransport. Member: ask the host to do so.
             */
            void switchTransport(TransportKind kind);

            /**
             * Host: sends `msg` to every online member except `origin`; a member that cannot be
             * reached gets a probe failure. Member: sends on the uplink, or holds the message
             * until the next uplink opens.
             */
            void relay(const Message& msg, const MemberId& origin = "");

            /** Lower-level failure report: the member is marked offline. */
            void onPeerUnreachable(const MemberId& memberId);

            /** Sends the local score table: host to every member, member to the host. */
            void shareScores();

            /** Hands a challenge claim to the host. */
            void sendChallenge(const HostClaim& claim);

            /** Reaction to an elected host change. */
            void onHostChanged(const HostClaim& claim, const MemberId& previousHost);

            /**
             * Graceful exit: a host hands over first, DISCONNECT goes out on every link and
             * `done` runs once the links have flushed (or after the connect timeout).
             */
            void leave(std::function<void()> done);

            void setRtcNegotiator(RtcNegotiator::Ptr negotiator);

            /** RTT of an open WebRTC data channel, for the probe. */
            std::optional<uint32_t> rttFor(const MemberId& memberId) const;

            SwitchState switchState() const { return currentSwitch.load(); }
            bool hasUplink() const { return uplinkOpen.load(); }
            size_t memberLinkCount() const { return memberLinksOpen.load(); }

            void setChatHandler(ChatCallback cb);
            void setTransportChangedHandler(TransportCallback cb);
            void setSwitchStateHandler(SwitchStateCallback cb);
            void setConnectionLostHandler(ConnectionLostCallback cb);

        private:
            enum class LinkRole {
                Pending,  // accepted, waiting for HANDSHAKE or PROBE
                Dialing,  // outgoing, waiting for HANDSHAKE_ACK
                Member,   // host side, admitted member
                Uplink,   // member side, link to the host
                Retired   // flushing before close
            };

            struct Dial {
                enum class Purpose { Join, Reconnect, Switch };

                Purpose purpose = Purpose::Reconnect;
                MemberId target;
                TransportKind requested = TransportKind::WebSocket;
                std::vector<PeerAddress> candidates;
                size_t next = 0;
                bool tryRtc = false;
                bool rtcFirst = false;
                bool rtcTried = false;
                bool rtcPending = false;
                size_t redirects = 0;
                uint64_t linkId = 0;
                std::shared_ptr<boost::asio::steady_timer> rtcTimer;
                DialCallback done;
                bool finished = false;
            };

            struct Link {
                Channel channel;
                LinkRole role = LinkRole::Pending;
                MemberId peer;
                PeerAddress address; // dialed address, empty for accepted links
                std::shared_ptr<boost::asio::steady_timer> timer;
                std::shared_ptr<Dial> dial;
            };

            // accept side
            void doAcceptTcp();
            void doAcceptWs();
            void adoptPending(const Channel& channel);
            void attachHandlers(uint64_t id, const Channel& channel);
            void armLinkTimer(uint64_t id, std::chrono::milliseconds after, const std::string& what);

            // link dispatch
            void handleLinkMessage(uint64_t id, const Message& msg);
            void handleLinkClosed(uint64_t id, const std::string& reason);
            void handlePending(uint64_t id, const Message& msg);
            void handleFromMember(uint64_t id, const MemberId& peer, const Message& msg);
            void handleFromHost(const Message& msg);
            void handleRetired(const MemberId& peer, const Message& msg);

            // admission
            void admit(uint64_t id, const HandshakePayload& hs);
            void reject(uint64_t id, const std::string& reason);
            void echoProbe(uint64_t id, const Message& msg);
            HandshakeAckPayload makeAck(uint64_t id, bool accepted, const std::string& reason) const;

            // dialing
            void dialHost(TransportKind transport, const MemberId& memberId, DialCallback cb);
            void startDial(const std::shared_ptr<Dial>& dial);
            void dialNext(const std::shared_ptr<Dial>& dial);
            void openDialLink(const std::shared_ptr<Dial>& dial, const PeerAddress& address);
            void openRtcDial(const std::shared_ptr<Dial>& dial);
            void onRtcNegotiated(const std::shared_ptr<Dial>& dial, const RtcChannel::Ptr& channel);
            void beginHandshake(uint64_t id);
            void handleAck(uint64_t id, const HandshakeAckPayload& ack);
            void followRedirect(const std::shared_ptr<Dial>& dial, const HandshakeAckPayload& ack);
            void finishDial(const std::shared_ptr<Dial>& dial, const DialOutcome& outcome);
            void cancelHostDial();
            std::vector<PeerAddress> candidatesFor(const MemberId& memberId, TransportKind first, bool withFallback) const;
            static std::vector<PeerAddress> bootstrapCandidates(const std::vector<PeerAddress>& bootstrap);

            // links
            void promoteUplink(uint64_t id, const MemberId& hostId);
            void retireLink(uint64_t id);
            void dropLink(uint64_t id);
            void eraseLink(uint64_t id);
            void sendOn(uint64_t id, const Message& msg);
            void broadcast(const Message& msg, const MemberId& except = "");
            void sendToHost(const Message& msg);
            void updateCounters();

            // session behaviour
            void doRelay(const Message& msg, const MemberId& origin);
            bool deliverChat(const Message& msg);
            void applyScores(const ScoreTablePayload& table);
            void sendSignal(const RtcSignalPayload& signal);
            void routeSignal(const RtcSignalPayload& signal);
            void memberLeft(const MemberId& memberId);
            void onMembershipEvent(const RegistryEvent& event);
            void becomeHost();
            void handOver(const HostClaim& claim);
            void reconnectTo(const MemberId& hostId);
            bool isHost() const;

            // transport switch
            void startHostSwitch(TransportKind kind);
            void beginMemberSwitch(TransportKind kind);
            void checkSwitchProgress();
            void applyActiveTransport(TransportKind kind);
            void setSwitchState(SwitchState next);
            void finishLeave();

            boost::asio::io_context& io;
            PeerRegistry& registry;
            Elector::Ptr elector;
            MemberId selfId;
            PartyConfig config;

            tcp::acceptor tcpAcceptor;
            tcp::acceptor wsAcceptor;
            std::atomic<uint16_t> boundTcpPort{0};
            std::atomic<uint16_t> boundWsPort{0};

            std::unordered_map<uint64_t, Link> links;
            std::unordered_map<MemberId, uint64_t> memberLinks;
            uint64_t nextLinkId = 1;
            uint64_t uplinkId = 0;
            MemberId uplinkPeer;
            std::shared_ptr<Dial> hostDial;
            std::deque<Message> backlog;

            TransportKind switchTarget = TransportKind::WebSocket;
            boost::asio::steady_timer switchTimer;
            boost::asio::steady_timer leaveTimer;
            std::function<void()> leaveDone;
            bool leaving = false;

            RtcNegotiator::Ptr negotiator;
            PeerRegistry::SubscriptionId subscription = 0;

            std::atomic<bool> running{false};
            std::atomic<SwitchState> currentSwitch{SwitchState::Idle};
            std::atomic<bool> uplinkOpen{false};
            std::atomic<size_t> memberLinksOpen{0};

            ChatCallback onChat;
            TransportCallback onTransportChanged;
            SwitchStateCallback onSwitchState;
            ConnectionLostCallback onConnectionLost;
    };

} // namespace shortgap

#endif // SHORTGAP_TRANSPORT_COORDINATOR_HPP
