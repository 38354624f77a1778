#include <gtest/gtest.h>
#include "Payloads.hpp"
#include <string>

using namespace shortgap;

static const std::string ID_A(32, 'a');
static const std::string ID_B(32, 'b');

static Member makeMember(const std::string& id, const std::string& name, uint64_t joinOrder) {
    Member m;
    m.id = id;
    m.displayName = name;
    m.joinOrder = joinOrder;
    m.lastSeen = fromMillis(1700000000000ULL);
    m.addresses.push_back(PeerAddress{"10.0.0.1", 47800, TransportKind::Tcp});
    m.pingScores[TransportKind::WebSocket] = ScoreEntry{42, fromMillis(1700000000500ULL)};
    return m;
}

// -----------------------
// BYTE CODEC
// -----------------------
TEST(ByteCodecTest, ReaderFailsOnShortBufferAndStaysFailed) {
    ByteWriter w;
    w.u16(0xBEEF);
    auto data = w.take();

    ByteReader r(data);
    uint32_t big = 0;
    EXPECT_FALSE(r.u32(big));

    uint8_t small = 0;
    EXPECT_FALSE(r.u8(small));
}

TEST(ByteCodecTest, StringLengthLimit) {
    ByteWriter w;
    w.str("abcdef");
    auto data = w.take();

    std::string out;
    ByteReader strict(data);
    EXPECT_FALSE(strict.str(out, 5));

    ByteReader relaxed(data);
    ASSERT_TRUE(relaxed.str(out, 6));
    EXPECT_EQ(out, "abcdef");
    EXPECT_TRUE(relaxed.atEnd());
}

TEST(ByteCodecTest, BooleanRejectsValuesAboveOne) {
    std::vector<uint8_t> data = {2};
    ByteReader r(data);
    bool flag = false;
    EXPECT_FALSE(r.boolean(flag));
}

TEST(ByteCodecTest, TransportRejectsUnknownKinds) {
    std::vector<uint8_t> data = {0, 4};
    ByteReader r(data);
    TransportKind kind;
    EXPECT_FALSE(r.transport(kind));
}

// -----------------------
// PAYLOADS
// -----------------------
TEST(PayloadTest, ProbeEchoesVerbatim) {
    ProbePayload probe{ID_A, 1700000000123ULL, 0xDEADBEEFCAFEULL};
    Message msg = makeMessage(MessageType::PROBE, probe);
    EXPECT_EQ(msg.type, MessageType::PROBE);

    ProbePayload back;
    ASSERT_TRUE(decode(msg.payload, back));
    EXPECT_EQ(back.senderId, ID_A);
    EXPECT_EQ(back.sentAtMs, 1700000000123ULL);
    EXPECT_EQ(back.nonce, 0xDEADBEEFCAFEULL);
}

TEST(PayloadTest, HandshakeAckCarriesPeerListAndPorts) {
    Party party;
    party.partyId = std::string(32, 'p');
    party.hostId = ID_A;
    party.term = 3;
    party.activeTransport = TransportKind::Tcp;
    party.members[ID_A] = makeMember(ID_A, "alice", 1);
    party.members[ID_B] = makeMember(ID_B, "bob", 2);

    HandshakeAckPayload ack;
    ack.partyId = party.partyId;
    ack.senderId = ID_A;
    ack.transport = TransportKind::WebSocket;
    ack.accepted = true;
    ack.assignedName = "bob-2";
    ack.tcpPort = 47800;
    ack.wsPort = 47801;
    ack.claim.hostId = ID_A;
    ack.claim.term = 3;
    ack.claim.score = 17;
    ack.peers = toPeerList(party);

    HandshakeAckPayload back;
    ASSERT_TRUE(decode(encode(ack), back));
    EXPECT_TRUE(back.accepted);
    EXPECT_EQ(back.assignedName, "bob-2");
    EXPECT_EQ(back.tcpPort, 47800);
    EXPECT_EQ(back.wsPort, 47801);
    EXPECT_EQ(back.claim.hostId, ID_A);
    ASSERT_TRUE(back.claim.score.has_value());
    EXPECT_EQ(*back.claim.score, 17u);
    EXPECT_EQ(back.peers.term, 3u);
    EXPECT_EQ(back.peers.activeTransport, TransportKind::Tcp);

    auto members = membersOf(back.peers);
    ASSERT_EQ(members.size(), 2u);
    for (const auto& m : members) {
        const Member& expected = party.members.at(m.id);
        EXPECT_EQ(m.displayName, expected.displayName);
        EXPECT_EQ(m.joinOrder, expected.joinOrder);
        EXPECT_EQ(m.addresses, expected.addresses);
        EXPECT_EQ(toMillis(m.lastSeen), toMillis(expected.lastSeen));
        ASSERT_EQ(m.pingScores.count(TransportKind::WebSocket), 1u);
        EXPECT_EQ(m.pingScores.at(TransportKind::WebSocket).roundTripMillis, 42u);
    }
}

TEST(PayloadTest, ClaimWithoutScore) {
    HostClaim claim;
    claim.hostId = ID_B;
    claim.term = 9;
    claim.joinOrder = 4;

    HostClaim back;
    ASSERT_TRUE(decode(encode(claim), back));
    EXPECT_EQ(back.hostId, ID_B);
    EXPECT_EQ(back.term, 9u);
    EXPECT_FALSE(back.score.has_value());
    EXPECT_EQ(back.joinOrder, 4u);
}

TEST(PayloadTest, DecodeRejectsTrailingBytes) {
    auto data = encode(DisconnectPayload{ID_A});
    data.push_back(0);

    DisconnectPayload out;
    EXPECT_FALSE(decode(data, out));
}

TEST(PayloadTest, DecodeRejectsOverlongIds) {
    DisconnectPayload bye{std::string(33, 'x')};
    DisconnectPayload out;
    EXPECT_FALSE(decode(encode(bye), out));
}

TEST(PayloadTest, FailedDecodeLeavesOutputUntouched) {
    ChatPayload chat{std::string(32, 'm'), ID_A, "hello", 5};
    auto data = encode(chat);
    data.resize(data.size() - 1);

    ChatPayload out;
    out.content = "unchanged";
    EXPECT_FALSE(decode(data, out));
    EXPECT_EQ(out.content, "unchanged");
}

TEST(PayloadTest, TransportChangeRejectsUnknownKind) {
    auto data = encode(TransportChangePayload{TransportKind::WebRtc, ID_A});
    data[0] = 7;

    TransportChangePayload out;
    EXPECT_FALSE(decode(data, out));
}

TEST(PayloadTest, ScoreRowsFlattenEveryMember) {
    Party party;
    party.members[ID_A] = makeMember(ID_A, "alice", 1);
    party.members[ID_B] = makeMember(ID_B, "bob", 2);
    party.members[ID_B].pingScores[TransportKind::Tcp] = ScoreEntry{7, fromMillis(1000)};

    auto rows = scoreRowsOf(party);
    EXPECT_EQ(rows.size(), 3u);

    ScoreTablePayload table{ID_A, rows};
    ScoreTablePayload back;
    ASSERT_TRUE(decode(encode(table), back));
    EXPECT_EQ(back.rows.size(), 3u);
}
