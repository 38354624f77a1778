#include <gtest/gtest.h>
#include "PartyNode.hpp"
#include "RtcChannel.hpp"
#include "RtcNegotiator.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

using namespace shortgap;

static const MemberId PEER_ID(32, 'p');

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static bool eventually(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(8)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

static PartyConfig nodeConfig() {
    PartyConfig config;
    config.bindAddress = "127.0.0.1";
    config.tcpPort = 0;
    config.connectTimeout = std::chrono::milliseconds(1000);
    config.joinTimeout = std::chrono::seconds(8);
    config.switchTimeout = std::chrono::seconds(4);
    return config;
}

static PeerAddress wsOf(const PartyNode& node) {
    return PeerAddress{"127.0.0.1", node.wsPort(), TransportKind::WebSocket};
}

static std::vector<uint8_t> disconnectFrame() {
    DisconnectPayload bye;
    bye.senderId = PEER_ID;
    return serializeMessage(makeMessage(MessageType::DISCONNECT, bye));
}

namespace {

    // Both ends of every in-memory data channel, keyed by (owner, peer).
    class Switchboard {
        public:
            void add(const MemberId& owner, const MemberId& peer, const RtcChannel::Ptr& channel) {
                std::lock_guard<std::mutex> lock(mtx);
                ends[{owner, peer}] = channel;
            }

            RtcChannel::Ptr find(const MemberId& owner, const MemberId& peer) {
                std::lock_guard<std::mutex> lock(mtx);
                auto it = ends.find({owner, peer});
                return it == ends.end() ? nullptr : it->second.lock();
            }

            void remove(const MemberId& owner, const MemberId& peer) {
                std::lock_guard<std::mutex> lock(mtx);
                ends.erase({owner, peer});
            }

            std::vector<MemberId> peersOf(const MemberId& owner) {
                std::lock_guard<std::mutex> lock(mtx);
                std::vector<MemberId> out;
                for (const auto& [key, channel] : ends) {
                    (void)channel;
                    if (key.first == owner) out.push_back(key.second);
                }
                return out;
            }

        private:
            std::mutex mtx;
            std::map<std::pair<MemberId, MemberId>, std::weak_ptr<RtcChannel>> ends;
    };

    // Negotiates through real RTC_SIGNAL traffic: an "offer" travels to the host over the
    // uplink, the host opens its end and answers, the offerer opens its end on the answer.
    class LoopbackRtcNegotiator : public RtcNegotiator {
        public:
            static constexpr uint32_t RTT_MILLIS = 7;

            LoopbackRtcNegotiator(boost::asio::io_context& ctx, MemberId self, std::shared_ptr<Switchboard> board)
                : io(ctx), selfId(std::move(self)), switchboard(std::move(board)) {}

            void setSignalSender(SignalSender sender) override {
                std::lock_guard<std::mutex> lock(mtx);
                signalSender = std::move(sender);
            }

            void setIncomingHandler(ChannelCallback cb) override {
                std::lock_guard<std::mutex> lock(mtx);
                onIncoming = std::move(cb);
            }

            void negotiate(const MemberId& peer, ChannelCallback cb) override {
                SignalSender sender;
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    pending[peer] = std::move(cb);
                    sender = signalSender;
                }
                offers++;
                if (sender) sender(signal(peer, "offer"));
            }

            void onSignal(const RtcSignalPayload& incoming) override {
                if (incoming.kind == "offer") {
                    RtcChannel::Ptr channel = openEnd(incoming.senderId);
                    SignalSender sender;
                    ChannelCallback incomingHandler;
                    {
                        std::lock_guard<std::mutex> lock(mtx);
                        sender = signalSender;
                        incomingHandler = onIncoming;
                    }
                    if (sender) sender(signal(incoming.senderId, "answer"));
                    if (incomingHandler) incomingHandler(channel);
                } else if (incoming.kind == "answer") {
                    ChannelCallback cb;
                    {
                        std::lock_guard<std::mutex> lock(mtx);
                        auto it = pending.find(incoming.senderId);
                        if (it == pending.end()) return;
                        cb = std::move(it->second);
                        pending.erase(it);
                    }
                    cb(openEnd(incoming.senderId));
                }
            }

            std::optional<uint32_t> roundTripMillis(const MemberId& peer) const override {
                if (switchboard->find(selfId, peer)) return RTT_MILLIS;
                return std::nullopt;
            }

            void close(const MemberId& peer) override {
                if (auto channel = switchboard->find(selfId, peer)) channel->close();
            }

            void closeAll() override {
                for (const auto& peer : switchboard->peersOf(selfId)) {
                    close(peer);
                }
            }

            std::atomic<int> offers{0};

        private:
            RtcSignalPayload signal(const MemberId& target, const std::string& kind) const {
                RtcSignalPayload out;
                out.senderId = selfId;
                out.targetId = target;
                out.kind = kind;
                return out;
            }

            RtcChannel::Ptr openEnd(const MemberId& peer) {
                auto board = switchboard;
                const MemberId me = selfId;
                auto channel = std::make_shared<RtcChannel>(
                    io, peer,
                    [board, me, peer](const std::vector<uint8_t>& frame) {
                        auto other = board->find(peer, me);
                        if (!other) return false;
                        other->deliver(frame);
                        return true;
                    },
                    [board, me, peer] {
                        board->remove(me, peer);
                        if (auto other = board->find(peer, me)) other->remoteClosed("remote end closed");
                    });
                switchboard->add(me, peer, channel);
                return channel;
            }

            boost::asio::io_context& io;
            MemberId selfId;
            std::shared_ptr<Switchboard> switchboard;

            std::mutex mtx;
            SignalSender signalSender;
            ChannelCallback onIncoming;
            std::map<MemberId, ChannelCallback> pending;
    };

    class EventLog {
        public:
            explicit EventLog(PartyNode& node) : state(std::make_shared<State>()) {
                auto shared = state;
                node.subscribe([shared](const PartyEvent& event) {
                    std::lock_guard<std::mutex> lock(shared->mtx);
                    shared->events.push_back(event);
                });
            }

            size_t count(PartyEvent::Kind kind) {
                std::lock_guard<std::mutex> lock(state->mtx);
                size_t n = 0;
                for (const auto& event : state->events) {
                    if (event.kind == kind) ++n;
                }
                return n;
            }

            std::vector<std::string> contents() {
                std::lock_guard<std::mutex> lock(state->mtx);
                std::vector<std::string> out;
                for (const auto& event : state->events) {
                    if (event.kind == PartyEvent::Kind::MessageReceived) out.push_back(event.message.content);
                }
                return out;
            }

        private:
            struct State {
                std::mutex mtx;
                std::vector<PartyEvent> events;
            };
            std::shared_ptr<State> state;
    };

} // namespace

// -----------------------
// CHANNEL
// -----------------------
TEST(RtcChannelTest, FramesBeforeStartAreHeldUntilStart) {
    boost::asio::io_context io;
    auto channel = std::make_shared<RtcChannel>(io, PEER_ID,
        [](const std::vector<uint8_t>&) { return true; }, [] {});

    std::vector<MessageType> received;
    channel->setMessageHandler([&received](const Message& msg) { received.push_back(msg.type); });

    channel->deliver(disconnectFrame());
    io.run();
    io.restart();
    EXPECT_TRUE(received.empty());

    channel->start();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], MessageType::DISCONNECT);

    channel->deliver(disconnectFrame());
    io.run();
    EXPECT_EQ(received.size(), 2u);
}

TEST(RtcChannelTest, SendHandsOverOneFramePerMessage) {
    boost::asio::io_context io;
    std::vector<std::vector<uint8_t>> sent;
    auto channel = std::make_shared<RtcChannel>(io, PEER_ID,
        [&sent](const std::vector<uint8_t>& frame) { sent.push_back(frame); return true; }, [] {});

    DisconnectPayload bye;
    bye.senderId = PEER_ID;
    channel->send(makeMessage(MessageType::DISCONNECT, bye));

    ASSERT_EQ(sent.size(), 1u);
    Message parsed;
    ASSERT_TRUE(parseExactMessage(sent[0], parsed));
    EXPECT_EQ(parsed.type, MessageType::DISCONNECT);
    EXPECT_EQ(channel->kind(), TransportKind::WebRtc);
}

TEST(RtcChannelTest, FailedSendClosesAndReports) {
    boost::asio::io_context io;
    int closes = 0;
    auto channel = std::make_shared<RtcChannel>(io, PEER_ID,
        [](const std::vector<uint8_t>&) { return false; }, [&closes] { ++closes; });

    std::string reason;
    channel->setCloseHandler([&reason](const std::string& why) { reason = why; });
    channel->send(makeMessage(MessageType::DISCONNECT, DisconnectPayload{PEER_ID}));

    EXPECT_FALSE(channel->isOpen());
    EXPECT_EQ(reason, "data channel send failed");
    EXPECT_EQ(closes, 1);
}

TEST(RtcChannelTest, MalformedFrameClosesChannel) {
    boost::asio::io_context io;
    auto channel = std::make_shared<RtcChannel>(io, PEER_ID,
        [](const std::vector<uint8_t>&) { return true; }, [] {});

    std::string reason;
    channel->setCloseHandler([&reason](const std::string& why) { reason = why; });
    channel->start();
    channel->deliver({0x01, 0x02, 0x03});
    io.run();

    EXPECT_FALSE(channel->isOpen());
    EXPECT_EQ(reason, "malformed frame");
}

TEST(RtcChannelTest, ExplicitCloseDoesNotReport) {
    boost::asio::io_context io;
    auto channel = std::make_shared<RtcChannel>(io, PEER_ID,
        [](const std::vector<uint8_t>&) { return true; }, [] {});

    bool reported = false;
    channel->setCloseHandler([&reported](const std::string&) { reported = true; });
    channel->close();
    channel->remoteClosed("late");
    io.run();

    EXPECT_FALSE(channel->isOpen());
    EXPECT_FALSE(reported);
}

// -----------------------
// SWITCHING A PARTY TO WEBRTC
// -----------------------
TEST(RtcChannelTest, MemberSwitchesPartyToWebRtc) {
    auto board = std::make_shared<Switchboard>();

    PartyNode host(nodeConfig());
    auto hostRtc = std::make_shared<LoopbackRtcNegotiator>(host.context(), host.selfId(), board);
    host.setRtcNegotiator(hostRtc);
    EventLog hostLog(host);
    host.joinParty("alice");

    PartyNode member(nodeConfig());
    auto memberRtc = std::make_shared<LoopbackRtcNegotiator>(member.context(), member.selfId(), board);
    member.setRtcNegotiator(memberRtc);
    EventLog memberLog(member);
    member.joinParty("bob", {wsOf(host)});
    ASSERT_TRUE(eventually([&] { return member.snapshot()->hostId == host.selfId(); }));
    EXPECT_FALSE(memberRtc->roundTripMillis(host.selfId()).has_value());

    member.switchTransport(TransportKind::WebRtc);

    ASSERT_TRUE(eventually([&] { return host.switchState() == SwitchState::Complete; }));
    ASSERT_TRUE(eventually([&] { return member.switchState() == SwitchState::Complete; }));
    EXPECT_EQ(host.snapshot()->activeTransport, TransportKind::WebRtc);
    EXPECT_EQ(member.snapshot()->activeTransport, TransportKind::WebRtc);
    EXPECT_EQ(hostLog.count(PartyEvent::Kind::TransportChanged), 1u);
    EXPECT_EQ(memberLog.count(PartyEvent::Kind::TransportChanged), 1u);
    EXPECT_EQ(memberRtc->offers.load(), 1);

    // both ends of the data channel are open, so each side has an RTT sample source
    EXPECT_EQ(memberRtc->roundTripMillis(host.selfId()), std::optional<uint32_t>(LoopbackRtcNegotiator::RTT_MILLIS));
    EXPECT_EQ(hostRtc->roundTripMillis(member.selfId()), std::optional<uint32_t>(LoopbackRtcNegotiator::RTT_MILLIS));

    member.sendMessage("over the data channel");
    host.sendMessage("back over the data channel");
    ASSERT_TRUE(eventually([&] { return hostLog.contents().size() == 1 && memberLog.contents().size() == 1; }));
    EXPECT_EQ(hostLog.contents()[0], "over the data channel");
    EXPECT_EQ(memberLog.contents()[0], "back over the data channel");
}
