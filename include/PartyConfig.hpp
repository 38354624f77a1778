#ifndef SHORTGAP_PARTY_CONFIG_HPP
#define SHORTGAP_PARTY_CONFIG_HPP

#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace shortgap {

    /**
     * Node settings. Defaults come from Types.hpp; tests shrink the timings.
     */
    struct PartyConfig {
        std::string bindAddress = "0.0.0.0";
        std::string advertisedHost;   // empty: peers use the address they saw us connect from
        uint16_t tcpPort = DEFAULT_TCP_PORT; // 0: ephemeral TCP and WebSocket ports
        uint16_t wsPort = 0;          // 0: tcpPort + WEBSOCKET_PORT_OFFSET

        TransportKind initialTransport = TransportKind::WebSocket;

        std::chrono::milliseconds probeCadence = PROBE_CADENCE;
        std::chrono::milliseconds probeTimeout = PROBE_TIMEOUT;
        std::chrono::milliseconds stalenessThreshold = STALENESS_THRESHOLD;
        std::chrono::milliseconds healthCheckInterval = HEALTH_CHECK_INTERVAL;
        std::chrono::milliseconds connectTimeout = CONNECT_TIMEOUT;
        std::chrono::milliseconds evictionAge = EVICTION_AGE;
        std::chrono::milliseconds switchTimeout = std::chrono::seconds(10);
        std::chrono::milliseconds joinTimeout = std::chrono::seconds(30);

        size_t dedupWindow = DEDUP_WINDOW;

        uint16_t webSocketPort() const {
            if (wsPort != 0 || tcpPort == 0) return wsPort;
            return static_cast<uint16_t>(tcpPort + WEBSOCKET_PORT_OFFSET);
        }
    };

} // namespace shortgap

#endif // SHORTGAP_PARTY_CONFIG_HPP
