#ifndef SHORTGAP_ADDRESS_HPP
#define SHORTGAP_ADDRESS_HPP

#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace shortgap {

    struct PeerAddress {
        std::string host;   // ip or hostname
        uint16_t port = 0;
        TransportKind transport = TransportKind::Tcp;

        std::string key() const {
            return host + ":" + std::to_string(port);
        }

        bool isValid() const {
            return !host.empty() && port > 0;
        }

        bool operator==(const PeerAddress& other) const {
            return host == other.host && port == other.port && transport == other.transport;
        }

        bool operator!=(const PeerAddress& other) const {
            return !(*this == other);
        }
    };

    /**
     * Parses "host:port" (TCP), "tcp://host:port" or "ws://host:port". IPv6 hosts go in
     * brackets: "[::1]:47800".
     *
     * @return false if the text is not a valid address.
     */
    bool parseAddress(const std::string& text, PeerAddress& out);

    /** Inverse of parseAddress; TCP addresses are written without a scheme. */
    std::string formatAddress(const PeerAddress& address);

    /**
     * Derives the WebSocket address a node listens on from its TCP address, following the
     * default port convention (TCP port + WEBSOCKET_PORT_OFFSET).
     */
    PeerAddress webSocketCompanion(const PeerAddress& tcpAddress);

    /**
     * Loads one address per line; blank lines and lines starting with '#' are skipped,
     * malformed lines are ignored.
     *
     * @return false if the file cannot be opened.
     */
    bool loadAddressFile(const std::string& filename, std::vector<PeerAddress>& out);

    /** Writes the addresses one per line, replacing the file. */
    bool saveAddressFile(const std::string& filename, const std::vector<PeerAddress>& addresses);

} // namespace shortgap

#endif // SHORTGAP_ADDRESS_HPP
