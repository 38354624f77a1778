#include "Types.hpp"
#include <algorithm>
#include <cctype>

namespace shortgap {

    std::string transportToString(TransportKind kind) {
        switch (kind) {
            case TransportKind::Tcp:       return "TCP";
            case TransportKind::WebSocket: return "WebSocket";
            case TransportKind::WebRtc:    return "WebRTC";
            default:                       return "UNKNOWN";
        }
    }

    bool parseTransport(const std::string& text, TransportKind& out) {
        std::string lower(text);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "tcp") {
            out = TransportKind::Tcp;
        } else if (lower == "ws" || lower == "websocket") {
            out = TransportKind::WebSocket;
        } else if (lower == "webrtc" || lower == "rtc") {
            out = TransportKind::WebRtc;
        } else {
            return false;
        }
        return true;
    }

    bool isValidTransport(uint8_t raw) {
        return raw >= static_cast<uint8_t>(TransportKind::Tcp) &&
               raw <= static_cast<uint8_t>(TransportKind::WebRtc);
    }

} // namespace shortgap
