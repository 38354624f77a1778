#ifndef SHORTGAP_TYPES_HPP
#define SHORTGAP_TYPES_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shortgap {

    using Clock = std::chrono::system_clock;
    using MemberId = std::string;
    using MessageId = std::string;

    // ============================================================
    //  PROTOCOL
    // ============================================================
    inline constexpr uint32_t NETWORK_MAGIC = 0x53474150; // "SGAP"
    inline constexpr uint8_t  PROTOCOL_VERSION = 1;
    inline constexpr size_t   MAX_PAYLOAD_SIZE = 1024 * 1024; // 1 MB
    inline constexpr size_t   MESSAGE_HEADER_SIZE = 4 + 1 + 1 + 8; // magic + version + type + payload_len
    inline constexpr size_t   CHECKSUM_SIZE = 4; // CRC32

    inline constexpr size_t   ID_BYTES = 16; // member, message and party ids (hex encoded)
    inline constexpr size_t   MAX_NAME_LENGTH = 64;

    // ============================================================
    //  TIMING
    // ============================================================
    inline constexpr std::chrono::milliseconds PROBE_CADENCE = std::chrono::minutes(5);
    inline constexpr std::chrono::milliseconds PROBE_TIMEOUT = std::chrono::seconds(3);
    inline constexpr std::chrono::milliseconds STALENESS_THRESHOLD = std::chrono::minutes(5);
    inline constexpr std::chrono::milliseconds HEALTH_CHECK_INTERVAL = PROBE_CADENCE / 2;
    inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT = std::chrono::seconds(5);
    inline constexpr std::chrono::milliseconds EVICTION_AGE = std::chrono::minutes(15);

    // ============================================================
    //  LIMITS
    // ============================================================
    inline constexpr size_t   DEDUP_WINDOW = 1024;
    inline constexpr size_t   MAX_HOST_REDIRECTS = 4;
    inline constexpr uint16_t DEFAULT_TCP_PORT = 47800;
    inline constexpr uint16_t WEBSOCKET_PORT_OFFSET = 1;

    // ============================================================
    //  TRANSPORTS
    // ============================================================
    enum class TransportKind : uint8_t {
        Tcp       = 1,
        WebSocket = 2,
        WebRtc    = 3
    };

    // Connect fallback order: WebSocket and TCP need no signaling, WebRTC needs an open session.
    inline constexpr std::array<TransportKind, 3> TRANSPORT_PREFERENCE = {
        TransportKind::WebSocket, TransportKind::Tcp, TransportKind::WebRtc
    };

    std::string transportToString(TransportKind kind);

    /** Parses "tcp", "ws"/"websocket" and "webrtc"/"rtc" (case-insensitive). Returns false if unknown. */
    bool parseTransport(const std::string& text, TransportKind& out);

    bool isValidTransport(uint8_t raw);

    /** Milliseconds since epoch, the wire representation of every timestamp. */
    inline uint64_t toMillis(Clock::time_point tp) {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
    }

    inline Clock::time_point fromMillis(uint64_t ms) {
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }

} // namespace shortgap

#endif // SHORTGAP_TYPES_HPP
