#include <gtest/gtest.h>
#include "Address.hpp"
#include <cstdio>
#include <fstream>

using namespace shortgap;

// -----------------------
// PARSING
// -----------------------
TEST(AddressTest, ParsesPlainHostPortAsTcp) {
    PeerAddress address;
    ASSERT_TRUE(parseAddress("192.168.1.20:47800", address));
    EXPECT_EQ(address.host, "192.168.1.20");
    EXPECT_EQ(address.port, 47800);
    EXPECT_EQ(address.transport, TransportKind::Tcp);
}

TEST(AddressTest, ParsesSchemes) {
    PeerAddress address;
    ASSERT_TRUE(parseAddress("ws://example.org:9000", address));
    EXPECT_EQ(address.transport, TransportKind::WebSocket);
    EXPECT_EQ(address.host, "example.org");

    ASSERT_TRUE(parseAddress("tcp://10.0.0.1:1", address));
    EXPECT_EQ(address.transport, TransportKind::Tcp);
    EXPECT_EQ(address.port, 1);
}

TEST(AddressTest, ParsesBracketedIpv6) {
    PeerAddress address;
    ASSERT_TRUE(parseAddress("[::1]:47800", address));
    EXPECT_EQ(address.host, "::1");
    EXPECT_EQ(address.port, 47800);
    EXPECT_EQ(formatAddress(address), "[::1]:47800");
}

TEST(AddressTest, RejectsMalformed) {
    PeerAddress address;
    EXPECT_FALSE(parseAddress("", address));
    EXPECT_FALSE(parseAddress("host", address));
    EXPECT_FALSE(parseAddress("host:", address));
    EXPECT_FALSE(parseAddress(":80", address));
    EXPECT_FALSE(parseAddress("host:0", address));
    EXPECT_FALSE(parseAddress("host:70000", address));
    EXPECT_FALSE(parseAddress("host:12ab", address));
    EXPECT_FALSE(parseAddress("udp://host:80", address));
    EXPECT_FALSE(parseAddress("[::1]80", address));
}

TEST(AddressTest, FormatMatchesNotation) {
    EXPECT_EQ(formatAddress(PeerAddress{"h", 5, TransportKind::Tcp}), "h:5");
    EXPECT_EQ(formatAddress(PeerAddress{"h", 6, TransportKind::WebSocket}), "ws://h:6");
}

TEST(AddressTest, WebSocketCompanionUsesNextPort) {
    PeerAddress ws = webSocketCompanion(PeerAddress{"10.1.1.1", 47800, TransportKind::Tcp});
    EXPECT_EQ(ws.host, "10.1.1.1");
    EXPECT_EQ(ws.port, 47801);
    EXPECT_EQ(ws.transport, TransportKind::WebSocket);
}

TEST(AddressTest, TransportNames) {
    TransportKind kind;
    ASSERT_TRUE(parseTransport("WS", kind));
    EXPECT_EQ(kind, TransportKind::WebSocket);
    ASSERT_TRUE(parseTransport("rtc", kind));
    EXPECT_EQ(kind, TransportKind::WebRtc);
    EXPECT_FALSE(parseTransport("udp", kind));
    EXPECT_EQ(transportToString(TransportKind::Tcp), "TCP");
}

// -----------------------
// PEERS FILE
// -----------------------
TEST(AddressTest, SaveAndLoadPeersFile) {
    const std::string filename = "test_shortgap_peers.txt";
    std::vector<PeerAddress> addresses = {
        {"127.0.0.1", 47800, TransportKind::Tcp},
        {"127.0.0.1", 47801, TransportKind::WebSocket},
        {"127.0.0.1", 1, TransportKind::WebRtc}, // not persisted
    };
    ASSERT_TRUE(saveAddressFile(filename, addresses));

    std::vector<PeerAddress> loaded;
    ASSERT_TRUE(loadAddressFile(filename, loaded));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0], addresses[0]);
    EXPECT_EQ(loaded[1], addresses[1]);

    std::remove(filename.c_str());
}

TEST(AddressTest, LoadSkipsCommentsAndGarbage) {
    const std::string filename = "test_shortgap_peers_comments.txt";
    {
        std::ofstream out(filename);
        out << "# bootstrap\n\nhost-a:100\r\nnot an address\nws://host-b:101  \n";
    }

    std::vector<PeerAddress> loaded;
    ASSERT_TRUE(loadAddressFile(filename, loaded));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].host, "host-a");
    EXPECT_EQ(loaded[1].transport, TransportKind::WebSocket);

    std::remove(filename.c_str());
}

TEST(AddressTest, LoadMissingFileFails) {
    std::vector<PeerAddress> loaded;
    EXPECT_FALSE(loadAddressFile("does_not_exist_shortgap.txt", loaded));
}
