#ifndef SHORTGAP_MESSAGE_HPP
#define SHORTGAP_MESSAGE_HPP

#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace shortgap {

    // Big-endian helpers shared by the frame and payload codecs
    void putBE32(std::vector<uint8_t>& out, uint32_t value);
    void putBE64(std::vector<uint8_t>& out, uint64_t value);
    uint32_t getBE32(const uint8_t* data);
    uint64_t getBE64(const uint8_t* data);

    // ============================================================
    //  MESSAGE TYPES
    // ============================================================
    enum class MessageType : uint8_t {
        HANDSHAKE        = 1,
        HANDSHAKE_ACK    = 2,
        PROBE            = 3,
        PROBE_ECHO       = 4,
        PEER_LIST        = 5,
        SCORE_TABLE      = 6,
        CHAT             = 7,
        MEMBER_JOINED    = 8,
        MEMBER_STATUS    = 9,
        HOST_CHANGE      = 10,
        CHALLENGE        = 11,
        TRANSPORT_CHANGE = 12,
        RTC_SIGNAL       = 13,
        DISCONNECT       = 255
    };

    // ============================================================
    //  MESSAGE
    // ============================================================
    struct Message {
        uint32_t magic   = NETWORK_MAGIC;
        uint8_t  version = PROTOCOL_VERSION;
        MessageType type = MessageType::PROBE;
        std::vector<uint8_t> payload;
    };

    /** Serializes a Message to its wire form:
     * [magic(4) big-endian] [version(1)] [type(1)] [payload_len(8) big-endian]
     * [payload] [crc32(4) big-endian]
     *
     * @throws std::length_error if the payload exceeds MAX_PAYLOAD_SIZE.
     */
    std::vector<uint8_t> serializeMessage(const Message& msg);

    /** Parses only the header to get magic, version, type and payload size.
     * Returns false if the buffer is short or any field is invalid.
     */
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuf, Message& outHeader, uint64_t& payloadLen);

    /** CRC32 (zlib) of a buffer */
    uint32_t crc32_buf(const void* data, size_t len);

    /** Parses a COMPLETE frame (header + payload + checksum).
     *  Validates magic, version, maximum size, message type and CRC32.
     */
    bool parseFullMessage(const std::vector<uint8_t>& buf, Message& outMsg);

    /** Frame sizes must match exactly: no trailing bytes allowed. */
    bool parseExactMessage(const std::vector<uint8_t>& buf, Message& outMsg);

    bool isKnownMessageType(uint8_t raw);

    std::string messageTypeToString(MessageType t);

    Message makeMessage(MessageType type, std::vector<uint8_t> payload);

} // namespace shortgap

#endif // SHORTGAP_MESSAGE_HPP
