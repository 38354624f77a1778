#ifndef SHORTGAP_PARTY_NODE_HPP
#define SHORTGAP_PARTY_NODE_HPP

#include "Elector.hpp"
#include "PartyConfig.hpp"
#include "PartyError.hpp"
#include "PeerRegistry.hpp"
#include "PingProbe.hpp"
#include "RtcNegotiator.hpp"
#include "TransportCoordinator.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace shortgap {

    struct ChatMessage {
        MessageId id;
        MemberId senderId;
        std::string senderName;
        std::string content;
        Clock::time_point sentAt;
    };

    struct PartyEvent {
        enum class Kind {
            HostChanged,       // memberId: the new host
            TransportChanged,  // transport
            MembershipChanged, // memberId, online, removed
            StateChanged,      // state
            SwitchProgress,    // switchState
            ConnectionLost,    // reason
            MessageReceived    // message
        };

        Kind kind = Kind::StateChanged;
        MemberId memberId;
        bool online = false;
        bool removed = false;
        TransportKind transport = TransportKind::WebSocket;
        ElectorState state = ElectorState::Electing;
        SwitchState switchState = SwitchState::Idle;
        std::string reason;
        ChatMessage message;
    };

    std::string partyEventKindToString(PartyEvent::Kind kind);

    /**
     * One member of one party. Owns the registry, the probe, the elector and the transport
     * coordinator and runs them on a private io_context thread.
     *
     * Event callbacks run on the io thread (or on the caller's thread for changes the caller
     * made directly) and must not block.
     */
    class PartyNode {
        public:
            using EventCallback = std::function<void(const PartyEvent&)>;
            using SubscriptionId = uint64_t;

            explicit PartyNode(PartyConfig config = PartyConfig());
            ~PartyNode();

            PartyNode(const PartyNode&) = delete;
            PartyNode& operator=(const PartyNode&) = delete;

            /**
             * With an empty bootstrap list a new party is created and hosted by this node.
             * Otherwise the bootstrap addresses are dialed (WebSocket first, then TCP), the
             * host is followed through redirects and its peer list merged.
             *
             * A node joins at most one party in its lifetime.
             *
             * @throws PartyError(NameCollision) if the host cannot make the name unique.
             * @throws PartyError(ConnectionLost) if no host could be reached or the listeners
             *         cannot be bound.
             */
            PartySnapshot joinParty(const std::string& displayName, const std::vector<PeerAddress>& bootstrap = {});

            /** A host hands over first; DISCONNECT goes to every link, then everything stops. */
            void leaveParty();

            /** Stops every component without telling the peers, as if the process died. */
            void shutdown();

            /**
             * Sends a chat message to every other member.
             *
             * @throws std::logic_error if the node is not in a party.
             */
            MessageId sendMessage(const std::string& content);

            SubscriptionId subscribe(EventCallback cb);
            void unsubscribe(SubscriptionId id);

            void switchTransport(TransportKind kind);

            /** Must be called before joinParty. */
            void setRtcNegotiator(RtcNegotiator::Ptr negotiator);

            PartySnapshot snapshot() const { return peerRegistry.snapshot(); }
            const MemberId& selfId() const { return self; }
            bool isHost() const;
            bool isJoined() const { return joined.load(); }
            ElectorState electorState() const;
            SwitchState switchState() const;

            uint16_t tcpPort() const;
            uint16_t wsPort() const;

            /** Last-known addresses of the other members, best first, for the peers file. */
            std::vector<PeerAddress> knownAddresses() const;

            PeerRegistry& registry() { return peerRegistry; }

            /** The io_context every component runs on, for building a negotiator. */
            boost::asio::io_context& context() { return io; }

            /** Message ids currently held for de-duplication, at most dedupWindow. */
            size_t rememberedMessages() const;

        private:
            void wireComponents();
            void startIoThread();
            void stopIoThread();
            void runOnIo(std::function<void()> task);
            void onChat(const ChatPayload& chat);
            bool rememberMessage(const MessageId& id);
            void publish(const PartyEvent& event);

            PartyConfig config;
            PeerRegistry peerRegistry;
            MemberId self;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            std::thread ioThread;

            Elector::Ptr elector;
            PingProbe::Ptr probe;
            TransportCoordinator::Ptr coordinator;
            RtcNegotiator::Ptr negotiator;
            PeerRegistry::SubscriptionId registrySubscription = 0;

            std::atomic<bool> started{false};
            std::atomic<bool> joined{false};
            std::atomic<bool> stopped{false};

            std::mutex subscriberMtx;
            std::map<SubscriptionId, EventCallback> subscribers;
            SubscriptionId nextSubscription = 1;

            mutable std::mutex dedupMtx;
            std::unordered_set<MessageId> seen;
            std::deque<MessageId> seenOrder;
    };

} // namespace shortgap

#endif // SHORTGAP_PARTY_NODE_HPP
