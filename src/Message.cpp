#include "Message.hpp"
#include <stdexcept>
#include <zlib.h>

namespace shortgap {

    // ------------------------------------------------------------
    // Big-endian helpers
    // ------------------------------------------------------------
    void putBE32(std::vector<uint8_t>& out, uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    void putBE64(std::vector<uint8_t>& out, uint64_t value) {
        putBE32(out, static_cast<uint32_t>(value >> 32));
        putBE32(out, static_cast<uint32_t>(value & 0xFFFFFFFFULL));
    }

    uint32_t getBE32(const uint8_t* data) {
        return (static_cast<uint32_t>(data[0]) << 24) |
               (static_cast<uint32_t>(data[1]) << 16) |
               (static_cast<uint32_t>(data[2]) << 8)  |
                static_cast<uint32_t>(data[3]);
    }

    uint64_t getBE64(const uint8_t* data) {
        return (static_cast<uint64_t>(getBE32(data)) << 32) | getBE32(data + 4);
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeMessage(const Message& message) {
        const uint64_t payloadLength = message.payload.size();

        if (payloadLength > MAX_PAYLOAD_SIZE) {
            throw std::length_error("Payload size exceeds maximum allowed");
        }

        std::vector<uint8_t> buffer;
        buffer.reserve(MESSAGE_HEADER_SIZE + payloadLength + CHECKSUM_SIZE);

        putBE32(buffer, message.magic);
        buffer.push_back(message.version);
        buffer.push_back(static_cast<uint8_t>(message.type));
        putBE64(buffer, payloadLength);

        if (!message.payload.empty()) {
            buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());
        }

        // checksum over everything above
        putBE32(buffer, crc32_buf(buffer.data(), buffer.size()));

        return buffer;
    }

    // ------------------------------------------------------------
    // HEADER ONLY
    // ------------------------------------------------------------
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuffer, Message& outputHeader, uint64_t& payloadLength) {
        if (headerBuffer.size() < MESSAGE_HEADER_SIZE) return false;

        const uint8_t* data = headerBuffer.data();
        outputHeader.magic = getBE32(data);
        outputHeader.version = data[4];
        uint8_t rawType = data[5];
        payloadLength = getBE64(data + 6);

        if (outputHeader.magic != NETWORK_MAGIC) return false;
        if (outputHeader.version != PROTOCOL_VERSION) return false;
        if (!isKnownMessageType(rawType)) return false;
        if (payloadLength > MAX_PAYLOAD_SIZE) return false;

        outputHeader.type = static_cast<MessageType>(rawType);
        return true;
    }

    // ------------------------------------------------------------
    // FULL FRAME (header + payload + checksum)
    // ------------------------------------------------------------
    bool parseFullMessage(const std::vector<uint8_t>& buffer, Message& outputMessage) {
        if (buffer.size() < MESSAGE_HEADER_SIZE + CHECKSUM_SIZE) return false;

        Message header;
        uint64_t payloadLength = 0;
        if (!parseMessageHeader(buffer, header, payloadLength)) return false;

        const size_t totalLength = MESSAGE_HEADER_SIZE + static_cast<size_t>(payloadLength) + CHECKSUM_SIZE;
        if (buffer.size() < totalLength) return false; // incomplete

        const size_t checksumOffset = MESSAGE_HEADER_SIZE + static_cast<size_t>(payloadLength);
        uint32_t receivedChecksum = getBE32(buffer.data() + checksumOffset);
        uint32_t calculatedChecksum = crc32_buf(buffer.data(), checksumOffset);
        if (calculatedChecksum != receivedChecksum) return false; // corrupted

        outputMessage = header;
        outputMessage.payload.assign(
            buffer.begin() + MESSAGE_HEADER_SIZE,
            buffer.begin() + static_cast<std::ptrdiff_t>(checksumOffset));

        return true;
    }

    bool parseExactMessage(const std::vector<uint8_t>& buffer, Message& outputMessage) {
        Message parsed;
        if (!parseFullMessage(buffer, parsed)) return false;
        if (buffer.size() != MESSAGE_HEADER_SIZE + parsed.payload.size() + CHECKSUM_SIZE) return false;

        outputMessage = std::move(parsed);
        return true;
    }

    bool isKnownMessageType(uint8_t raw) {
        return (raw >= static_cast<uint8_t>(MessageType::HANDSHAKE) &&
                raw <= static_cast<uint8_t>(MessageType::RTC_SIGNAL)) ||
               raw == static_cast<uint8_t>(MessageType::DISCONNECT);
    }

    std::string messageTypeToString(MessageType type) {
        switch (type) {
            case MessageType::HANDSHAKE:        return "HANDSHAKE";
            case MessageType::HANDSHAKE_ACK:    return "HANDSHAKE_ACK";
            case MessageType::PROBE:            return "PROBE";
            case MessageType::PROBE_ECHO:       return "PROBE_ECHO";
            case MessageType::PEER_LIST:        return "PEER_LIST";
            case MessageType::SCORE_TABLE:      return "SCORE_TABLE";
            case MessageType::CHAT:             return "CHAT";
            case MessageType::MEMBER_JOINED:    return "MEMBER_JOINED";
            case MessageType::MEMBER_STATUS:    return "MEMBER_STATUS";
            case MessageType::HOST_CHANGE:      return "HOST_CHANGE";
            case MessageType::CHALLENGE:        return "CHALLENGE";
            case MessageType::TRANSPORT_CHANGE: return "TRANSPORT_CHANGE";
            case MessageType::RTC_SIGNAL:       return "RTC_SIGNAL";
            case MessageType::DISCONNECT:       return "DISCONNECT";
            default:                            return "UNKNOWN";
        }
    }

    Message makeMessage(MessageType type, std::vector<uint8_t> payload) {
        Message message;
        message.type = type;
        message.payload = std::move(payload);
        return message;
    }

} // namespace shortgap
