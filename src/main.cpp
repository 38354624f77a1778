#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <cstdlib>
#include <string>
#include <vector>

#include "Address.hpp"
#include "PartyNode.hpp"
#ifdef SHORTGAP_WITH_DATACHANNEL
#include "DataChannelNegotiator.hpp"
#endif

using namespace std;

static atomic<bool> g_running(true);

void signal_handler(int signum){
    (void)signum;
    g_running = false;
}

static void printEvent(const shortgap::PartyEvent& event) {
    using Kind = shortgap::PartyEvent::Kind;
    switch (event.kind) {
        case Kind::MessageReceived:
            cout << "<" << (event.message.senderName.empty() ? event.message.senderId : event.message.senderName)
                 << "> " << event.message.content << endl;
            break;
        case Kind::HostChanged:
            cout << "* host is now " << event.memberId << endl;
            break;
        case Kind::TransportChanged:
            cout << "* transport is now " << shortgap::transportToString(event.transport) << endl;
            break;
        case Kind::MembershipChanged:
            cout << "* " << event.memberId << (event.removed ? " left" : event.online ? " is online" : " is offline") << endl;
            break;
        case Kind::StateChanged:
            cout << "* election state " << shortgap::electorStateToString(event.state) << endl;
            break;
        case Kind::SwitchProgress:
            cout << "* transport switch " << shortgap::switchStateToString(event.switchState) << endl;
            break;
        case Kind::ConnectionLost:
            cout << "* connection lost: " << event.reason << endl;
            break;
    }
}

static void printMembers(const shortgap::PartyNode& node) {
    shortgap::PartySnapshot party = node.snapshot();
    for (const auto& [id, member] : party->members) {
        cout << "  " << member.displayName << " (" << id << ")"
             << (id == party->hostId ? " [host]" : "")
             << (member.isOnline ? "" : " [offline]") << endl;
    }
}

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);

    if (argc < 2) {
        cerr << "usage: " << argv[0] << " <displayName> [tcpPort] [peersFile]" << endl;
        return 1;
    }

    string displayName = argv[1];
    shortgap::PartyConfig config;
    string peersFile;

    if (argc > 2) config.tcpPort = static_cast<uint16_t>(atoi(argv[2]));
    if (argc > 3) peersFile = argv[3];

    vector<shortgap::PeerAddress> bootstrap;
    if (!peersFile.empty() && !shortgap::loadAddressFile(peersFile, bootstrap)) {
        cerr << "Peers file " << peersFile << " not found, creating a new party" << endl;
    }

    cout << "shortgap node starting. name=" << displayName << " port=" << config.tcpPort
         << " bootstrap=" << bootstrap.size() << endl;

    try {
        shortgap::PartyNode node(config);
        node.subscribe(printEvent);
#ifdef SHORTGAP_WITH_DATACHANNEL
        node.setRtcNegotiator(std::make_shared<shortgap::DataChannelNegotiator>(node.context(), node.selfId()));
#endif

        try {
            node.joinParty(displayName, bootstrap);
        } catch (const shortgap::PartyError& e) {
            cerr << "Failed to join: " << e.what() << endl;
            return 1;
        }

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        cout << "Party running. Type to chat, /who, /switch <tcp|ws|webrtc>, /quit." << endl;
        string line;
        while (g_running && getline(cin, line)) {
            if (line.empty()) continue;

            if (line == "/quit") break;
            if (line == "/who") {
                printMembers(node);
                continue;
            }
            if (line.rfind("/switch ", 0) == 0) {
                shortgap::TransportKind kind;
                if (!shortgap::parseTransport(line.substr(8), kind)) {
                    cerr << "Unknown transport " << line.substr(8) << endl;
                    continue;
                }
                node.switchTransport(kind);
                continue;
            }
            node.sendMessage(line);
        }

        cout << "Shutting down..." << endl;
        vector<shortgap::PeerAddress> known = node.knownAddresses();
        node.leaveParty();

        if (!peersFile.empty() && !known.empty() && !shortgap::saveAddressFile(peersFile, known)) {
            cerr << "Failed to write peers file " << peersFile << endl;
        }
    } catch (const std::exception& e) {
        cerr << "Fatal: " << e.what() << endl;
        return 1;
    }
    return 0;
}
