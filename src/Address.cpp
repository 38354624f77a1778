#include "Address.hpp"
#include <fstream>
#include <iostream>

namespace shortgap {

    bool parseAddress(const std::string& text, PeerAddress& out) {
        std::string rest = text;
        PeerAddress parsed;

        // optional scheme
        size_t schemeEnd = rest.find("://");
        if (schemeEnd != std::string::npos) {
            std::string scheme = rest.substr(0, schemeEnd);
            if (scheme == "tcp") {
                parsed.transport = TransportKind::Tcp;
            } else if (scheme == "ws") {
                parsed.transport = TransportKind::WebSocket;
            } else {
                return false;
            }
            rest = rest.substr(schemeEnd + 3);
        }

        size_t portSep = std::string::npos;
        if (!rest.empty() && rest.front() == '[') {
            size_t close = rest.find(']');
            if (close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':') {
                return false;
            }
            parsed.host = rest.substr(1, close - 1);
            portSep = close + 1;
        } else {
            portSep = rest.rfind(':');
            if (portSep == std::string::npos) {
                return false;
            }
            parsed.host = rest.substr(0, portSep);
        }

        std::string portText = rest.substr(portSep + 1);
        if (portText.empty() || portText.size() > 5) {
            return false;
        }

        unsigned long port = 0;
        try {
            size_t consumed = 0;
            port = std::stoul(portText, &consumed);
            if (consumed != portText.size()) {
                return false;
            }
        } catch (const std::exception&) {
            return false;
        }

        if (port == 0 || port > 65535) {
            return false;
        }
        parsed.port = static_cast<uint16_t>(port);

        if (!parsed.isValid()) {
            return false;
        }

        out = parsed;
        return true;
    }

    std::string formatAddress(const PeerAddress& address) {
        std::string host = address.host.find(':') != std::string::npos
            ? "[" + address.host + "]"
            : address.host;
        std::string hostPort = host + ":" + std::to_string(address.port);

        switch (address.transport) {
            case TransportKind::WebSocket: return "ws://" + hostPort;
            case TransportKind::Tcp:       return hostPort;
            default:                       return transportToString(address.transport) + "://" + hostPort;
        }
    }

    PeerAddress webSocketCompanion(const PeerAddress& tcpAddress) {
        PeerAddress ws = tcpAddress;
        ws.transport = TransportKind::WebSocket;
        ws.port = static_cast<uint16_t>(tcpAddress.port + WEBSOCKET_PORT_OFFSET);
        return ws;
    }

    bool loadAddressFile(const std::string& filename, std::vector<PeerAddress>& out) {
        std::ifstream in(filename);
        if (!in) {
            return false;
        }

        std::string line;
        while (std::getline(in, line)) {
            // trim trailing CR / spaces
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
                line.pop_back();
            }
            if (line.empty() || line.front() == '#') continue;

            PeerAddress address;
            if (parseAddress(line, address)) {
                out.push_back(address);
            } else {
                std::cerr << "Address: ignoring malformed line in " << filename << ": " << line << std::endl;
            }
        }

        return true;
    }

    bool saveAddressFile(const std::string& filename, const std::vector<PeerAddress>& addresses) {
        std::ofstream out(filename, std::ios::trunc);
        if (!out) {
            return false;
        }

        for (const auto& address : addresses) {
            if (!address.isValid() || address.transport == TransportKind::WebRtc) continue;
            out << formatAddress(address) << "\n";
        }

        return static_cast<bool>(out);
    }

} // namespace shortgap
