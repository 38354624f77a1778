#include <gtest/gtest.h>
#include "PartyNode.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

using namespace shortgap;

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

namespace {

    // Records every event a node publishes. The log outlives its subscription, so the node
    // may still publish while it is torn down.
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

            std::vector<ChatMessage> messages() {
                std::lock_guard<std::mutex> lock(state->mtx);
                std::vector<ChatMessage> out;
                for (const auto& event : state->events) {
                    if (event.kind == PartyEvent::Kind::MessageReceived) out.push_back(event.message);
                }
                return out;
            }

            bool sawMember(const MemberId& id, bool online) {
                std::lock_guard<std::mutex> lock(state->mtx);
                for (const auto& event : state->events) {
                    if (event.kind == PartyEvent::Kind::MembershipChanged && event.memberId == id &&
                        event.online == online) {
                        return true;
                    }
                }
                return false;
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
// CREATING A PARTY
// -----------------------
TEST(PartyNodeTest, CreatePartyMakesSelfHost) {
    PartyNode node(nodeConfig());
    PartySnapshot party = node.joinParty("alice");

    EXPECT_EQ(party->partyId.size(), 32u);
    EXPECT_EQ(party->hostId, node.selfId());
    ASSERT_EQ(party->members.size(), 1u);
    EXPECT_EQ(party->find(node.selfId())->displayName, "alice");
    EXPECT_EQ(party->activeTransport, TransportKind::WebSocket);
    EXPECT_TRUE(node.isHost());
    EXPECT_TRUE(node.isJoined());
    EXPECT_EQ(node.electorState(), ElectorState::Stable);
    EXPECT_NE(node.tcpPort(), 0);
    EXPECT_NE(node.wsPort(), 0);
}

TEST(PartyNodeTest, LongNamesAreTruncated) {
    PartyNode node(nodeConfig());
    PartySnapshot party = node.joinParty(std::string(100, 'n'));
    EXPECT_EQ(party->find(node.selfId())->displayName.size(), MAX_NAME_LENGTH);
}

TEST(PartyNodeTest, NodeJoinsOnlyOnce) {
    PartyNode node(nodeConfig());
    node.joinParty("alice");
    EXPECT_THROW(node.joinParty("alice"), std::logic_error);
}

TEST(PartyNodeTest, SendBeforeJoinThrows) {
    PartyNode node(nodeConfig());
    EXPECT_THROW(node.sendMessage("hi"), std::logic_error);
    EXPECT_THROW(node.switchTransport(TransportKind::Tcp), std::logic_error);
}

// -----------------------
// JOINING
// -----------------------
TEST(PartyNodeTest, MemberJoinsAndBothAgreeOnHost) {
    PartyNode host(nodeConfig());
    EventLog hostLog(host);
    host.joinParty("alice");

    PartyNode member(nodeConfig());
    PartySnapshot party = member.joinParty("bob", {wsOf(host)});

    EXPECT_EQ(party->partyId, host.snapshot()->partyId);
    EXPECT_EQ(party->members.size(), 2u);
    EXPECT_FALSE(member.isHost());
    ASSERT_TRUE(eventually([&] { return member.snapshot()->hostId == host.selfId(); }));
    ASSERT_TRUE(eventually([&] { return hostLog.sawMember(member.selfId(), true); }));
    EXPECT_EQ(host.snapshot()->find(member.selfId())->displayName, "bob");

    auto addresses = member.knownAddresses();
    ASSERT_FALSE(addresses.empty());
    EXPECT_EQ(addresses.front().host, "127.0.0.1");
}

TEST(PartyNodeTest, DuplicateNameIsSuffixed) {
    PartyNode host(nodeConfig());
    host.joinParty("sam");

    PartyNode member(nodeConfig());
    PartySnapshot party = member.joinParty("sam", {wsOf(host)});
    EXPECT_EQ(party->find(member.selfId())->displayName, "sam-2");
}

TEST(PartyNodeTest, UnreachableBootstrapThrowsConnectionLost) {
    uint16_t closedPort = 0;
    {
        boost::asio::io_context scratch;
        tcp::acceptor slot(scratch, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        closedPort = slot.local_endpoint().port();
    }

    PartyConfig config = nodeConfig();
    config.connectTimeout = std::chrono::milliseconds(300);
    PartyNode node(config);

    try {
        node.joinParty("lonely", {PeerAddress{"127.0.0.1", closedPort, TransportKind::Tcp}});
        FAIL() << "joinParty should have thrown";
    } catch (const PartyError& e) {
        EXPECT_EQ(e.code(), PartyErrc::ConnectionLost);
    }
    EXPECT_FALSE(node.isJoined());
}

// -----------------------
// CHAT
// -----------------------
TEST(PartyNodeTest, ChatReachesEveryOtherMemberOnce) {
    PartyNode alice(nodeConfig());
    EventLog aliceLog(alice);
    alice.joinParty("alice");

    PartyNode bob(nodeConfig());
    EventLog bobLog(bob);
    bob.joinParty("bob", {wsOf(alice)});

    PartyNode carol(nodeConfig());
    EventLog carolLog(carol);
    carol.joinParty("carol", {wsOf(alice)});
    ASSERT_TRUE(eventually([&] { return bob.snapshot()->isOnline(carol.selfId()); }));

    MessageId id = bob.sendMessage("hello from bob");

    ASSERT_TRUE(eventually([&] { return aliceLog.messages().size() == 1 && carolLog.messages().size() == 1; }));
    auto received = carolLog.messages()[0];
    EXPECT_EQ(received.id, id);
    EXPECT_EQ(received.senderId, bob.selfId());
    EXPECT_EQ(received.senderName, "bob");
    EXPECT_EQ(received.content, "hello from bob");

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(aliceLog.messages().size(), 1u);
    EXPECT_EQ(carolLog.messages().size(), 1u);
    EXPECT_TRUE(bobLog.messages().empty());
}

TEST(PartyNodeTest, HostMessagesReachMembers) {
    PartyNode alice(nodeConfig());
    alice.joinParty("alice");
    PartyNode bob(nodeConfig());
    EventLog bobLog(bob);
    bob.joinParty("bob", {wsOf(alice)});

    alice.sendMessage("welcome");
    ASSERT_TRUE(eventually([&] { return bobLog.messages().size() == 1; }));
    EXPECT_EQ(bobLog.messages()[0].senderName, "alice");
}

TEST(PartyNodeTest, SentIdsStayWithinDedupWindow) {
    PartyConfig config = nodeConfig();
    config.dedupWindow = 16;
    PartyNode host(config);
    host.joinParty("alice");

    for (int i = 0; i < 1000; ++i) {
        host.sendMessage("note " + std::to_string(i));
    }
    EXPECT_EQ(host.rememberedMessages(), 16u);
}

TEST(PartyNodeTest, UnsubscribedCallbackGetsNothing) {
    PartyNode alice(nodeConfig());
    alice.joinParty("alice");
    PartyNode bob(nodeConfig());
    bob.joinParty("bob", {wsOf(alice)});

    std::atomic<int> calls{0};
    auto id = bob.subscribe([&calls](const PartyEvent&) { calls.fetch_add(1); });
    bob.unsubscribe(id);
    EventLog bobLog(bob);

    alice.sendMessage("ping");
    ASSERT_TRUE(eventually([&] { return bobLog.messages().size() == 1; }));
    EXPECT_EQ(calls.load(), 0);
}

// -----------------------
// HOST CHANGES
// -----------------------
TEST(PartyNodeTest, LeavingHostHandsOver) {
    auto host = std::make_unique<PartyNode>(nodeConfig());
    host->joinParty("alice");
    const MemberId oldHost = host->selfId();

    PartyNode member(nodeConfig());
    EventLog memberLog(member);
    member.joinParty("bob", {wsOf(*host)});
    ASSERT_TRUE(eventually([&] { return member.snapshot()->hostId == oldHost; }));

    host->leaveParty();
    EXPECT_FALSE(host->isJoined());

    ASSERT_TRUE(eventually([&] { return member.isHost(); }));
    ASSERT_TRUE(eventually([&] { return member.snapshot()->find(oldHost) == nullptr; }));
    EXPECT_GE(memberLog.count(PartyEvent::Kind::HostChanged), 2u);
    EXPECT_EQ(member.electorState(), ElectorState::Stable);
}

TEST(PartyNodeTest, HostFailureElectsEarliestMember) {
    auto host = std::make_unique<PartyNode>(nodeConfig());
    host->joinParty("alice");

    PartyNode bob(nodeConfig());
    EventLog bobLog(bob);
    bob.joinParty("bob", {wsOf(*host)});
    PartyNode carol(nodeConfig());
    carol.joinParty("carol", {wsOf(*host)});
    ASSERT_TRUE(eventually([&] {
        return bob.snapshot()->isOnline(carol.selfId()) && carol.snapshot()->hostId == host->selfId();
    }));

    host->shutdown();

    ASSERT_TRUE(eventually([&] { return bob.isHost(); }));
    ASSERT_TRUE(eventually([&] { return carol.snapshot()->hostId == bob.selfId(); }));

    // held by carol until her uplink to the new host opens
    carol.sendMessage("still here");
    ASSERT_TRUE(eventually([&] { return bobLog.messages().size() == 1; }));
    EXPECT_EQ(bobLog.messages()[0].content, "still here");
}

// -----------------------
// TRANSPORT SWITCH
// -----------------------
TEST(PartyNodeTest, HostSwitchesPartyToTcp) {
    PartyNode host(nodeConfig());
    EventLog hostLog(host);
    host.joinParty("alice");
    PartyNode member(nodeConfig());
    EventLog memberLog(member);
    member.joinParty("bob", {wsOf(host)});
    ASSERT_TRUE(eventually([&] { return member.snapshot()->hostId == host.selfId(); }));

    host.switchTransport(TransportKind::Tcp);

    ASSERT_TRUE(eventually([&] { return host.switchState() == SwitchState::Complete; }));
    ASSERT_TRUE(eventually([&] { return member.switchState() == SwitchState::Complete; }));
    EXPECT_EQ(host.snapshot()->activeTransport, TransportKind::Tcp);
    EXPECT_EQ(member.snapshot()->activeTransport, TransportKind::Tcp);
    EXPECT_EQ(hostLog.count(PartyEvent::Kind::TransportChanged), 1u);
    EXPECT_EQ(memberLog.count(PartyEvent::Kind::TransportChanged), 1u);

    host.sendMessage("over tcp");
    ASSERT_TRUE(eventually([&] { return memberLog.messages().size() == 1; }));
}

TEST(PartyNodeTest, MessagesSentDuringSwitchArriveOnce) {
    PartyNode alice(nodeConfig());
    EventLog aliceLog(alice);
    alice.joinParty("alice");
    PartyNode bob(nodeConfig());
    EventLog bobLog(bob);
    bob.joinParty("bob", {wsOf(alice)});
    PartyNode carol(nodeConfig());
    EventLog carolLog(carol);
    carol.joinParty("carol", {wsOf(alice)});
    ASSERT_TRUE(eventually([&] {
        return bob.snapshot()->isOnline(carol.selfId()) && carol.snapshot()->hostId == alice.selfId();
    }));

    // queued on the io thread behind the switch, so they go out while it is still preparing
    alice.switchTransport(TransportKind::Tcp);
    alice.sendMessage("from alice");
    bob.sendMessage("from bob");
    carol.sendMessage("from carol");

    for (PartyNode* node : {&alice, &bob, &carol}) {
        ASSERT_TRUE(eventually([&] { return node->switchState() == SwitchState::Complete; }));
    }
    ASSERT_TRUE(eventually([&] {
        return aliceLog.messages().size() == 2 && bobLog.messages().size() == 2 && carolLog.messages().size() == 2;
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto contents = [](EventLog& log) {
        std::multiset<std::string> out;
        for (const auto& message : log.messages()) out.insert(message.content);
        return out;
    };
    EXPECT_EQ(contents(aliceLog), (std::multiset<std::string>{"from bob", "from carol"}));
    EXPECT_EQ(contents(bobLog), (std::multiset<std::string>{"from alice", "from carol"}));
    EXPECT_EQ(contents(carolLog), (std::multiset<std::string>{"from alice", "from bob"}));
}
