#ifndef SHORTGAP_PAYLOADS_HPP
#define SHORTGAP_PAYLOADS_HPP

#include "Member.hpp"
#include "Message.hpp"
#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace shortgap {

    // ============================================================
    //  BYTE CODEC
    // ============================================================

    /**
     * Appends big-endian integers and length-prefixed (u32) strings to a buffer.
     */
    class ByteWriter {
        public:
            void u8(uint8_t value);
            void u16(uint16_t value);
            void u32(uint32_t value);
            void u64(uint64_t value);
            void boolean(bool value);
            void str(const std::string& value);

            std::vector<uint8_t> take() { return std::move(buf); }

        private:
            std::vector<uint8_t> buf;
    };

    /**
     * Reads what ByteWriter writes. Every accessor returns false once the buffer runs
     * short; the reader stays failed afterwards.
     */
    class ByteReader {
        public:
            explicit ByteReader(const std::vector<uint8_t>& data) : buf(data) {}

            bool u8(uint8_t& out);
            bool u16(uint16_t& out);
            bool u32(uint32_t& out);
            bool u64(uint64_t& out);
            bool boolean(bool& out);
            bool str(std::string& out, size_t maxLength = MAX_PAYLOAD_SIZE);
            bool transport(TransportKind& out);

            bool atEnd() const { return pos == buf.size(); }

        private:
            bool need(size_t count);

            const std::vector<uint8_t>& buf;
            size_t pos = 0;
            bool failed = false;
    };

    // ============================================================
    //  PAYLOADS
    // ============================================================

    // PROBE and PROBE_ECHO; the echo returns the probe unchanged
    struct ProbePayload {
        MemberId senderId;
        uint64_t sentAtMs = 0;
        uint64_t nonce = 0;
    };

    struct HandshakePayload {
        std::string partyId;
        MemberId senderId;
        TransportKind transport = TransportKind::Tcp;
        std::string displayName;
        uint16_t tcpPort = 0;
        uint16_t wsPort = 0;
        std::string advertisedHost; // empty: use the address the connection came from
        HostClaim claim;            // the sender's current view of the host
    };

    struct ScoreRow {
        MemberId memberId;
        TransportKind transport = TransportKind::Tcp;
        uint32_t millis = 0;
        uint64_t measuredAtMs = 0;
    };

    /** Wire form of a Member; timestamps in milliseconds since epoch. */
    struct MemberRecord {
        MemberId id;
        std::string displayName;
        std::vector<PeerAddress> addresses;
        bool online = true;
        uint64_t lastSeenMs = 0;
        uint64_t joinOrder = 0;
        std::vector<ScoreRow> scores;
    };

    struct PeerListPayload {
        std::string partyId;
        MemberId hostId;
        uint64_t term = 0;
        TransportKind activeTransport = TransportKind::WebSocket;
        uint64_t createdAtMs = 0;
        std::vector<MemberRecord> members;
    };

    struct HandshakeAckPayload {
        std::string partyId;
        MemberId senderId;
        TransportKind transport = TransportKind::Tcp;
        bool accepted = false;
        std::string reason;       // set when rejected
        std::string assignedName; // display name after collision resolution
        uint16_t tcpPort = 0;     // responder's listen ports
        uint16_t wsPort = 0;
        HostClaim claim;
        PeerListPayload peers;
    };

    struct ScoreTablePayload {
        MemberId senderId;
        std::vector<ScoreRow> rows;
    };

    struct ChatPayload {
        MessageId messageId;
        MemberId senderId;
        std::string content;
        uint64_t sentAtMs = 0;
    };

    struct MemberStatusPayload {
        MemberId memberId;
        bool online = false;
        bool removed = false;
    };

    struct TransportChangePayload {
        TransportKind kind = TransportKind::Tcp;
        MemberId senderId;
    };

    // Session description or ICE candidate relayed through the host
    struct RtcSignalPayload {
        MemberId senderId;
        MemberId targetId;
        std::string kind; // "offer", "answer", "candidate"
        std::string data;
        std::string mid;
    };

    struct DisconnectPayload {
        MemberId senderId;
    };

    std::vector<uint8_t> encode(const ProbePayload& payload);
    std::vector<uint8_t> encode(const HandshakePayload& payload);
    std::vector<uint8_t> encode(const HandshakeAckPayload& payload);
    std::vector<uint8_t> encode(const PeerListPayload& payload);
    std::vector<uint8_t> encode(const MemberRecord& payload);
    std::vector<uint8_t> encode(const ScoreTablePayload& payload);
    std::vector<uint8_t> encode(const ChatPayload& payload);
    std::vector<uint8_t> encode(const MemberStatusPayload& payload);
    std::vector<uint8_t> encode(const HostClaim& payload);
    std::vector<uint8_t> encode(const TransportChangePayload& payload);
    std::vector<uint8_t> encode(const RtcSignalPayload& payload);
    std::vector<uint8_t> encode(const DisconnectPayload& payload);

    /**
     * Decoders return false on truncated input, trailing bytes or out-of-range enum values;
     * `out` is left untouched in that case.
     */
    bool decode(const std::vector<uint8_t>& data, ProbePayload& out);
    bool decode(const std::vector<uint8_t>& data, HandshakePayload& out);
    bool decode(const std::vector<uint8_t>& data, HandshakeAckPayload& out);
    bool decode(const std::vector<uint8_t>& data, PeerListPayload& out);
    bool decode(const std::vector<uint8_t>& data, MemberRecord& out);
    bool decode(const std::vector<uint8_t>& data, ScoreTablePayload& out);
    bool decode(const std::vector<uint8_t>& data, ChatPayload& out);
    bool decode(const std::vector<uint8_t>& data, MemberStatusPayload& out);
    bool decode(const std::vector<uint8_t>& data, HostClaim& out);
    bool decode(const std::vector<uint8_t>& data, TransportChangePayload& out);
    bool decode(const std::vector<uint8_t>& data, RtcSignalPayload& out);
    bool decode(const std::vector<uint8_t>& data, DisconnectPayload& out);

    // ------------------------------------------------------------
    // Conversions between registry state and wire records
    // ------------------------------------------------------------
    MemberRecord toRecord(const Member& member);
    Member fromRecord(const MemberRecord& record);
    PeerListPayload toPeerList(const Party& party);
    std::vector<Member> membersOf(const PeerListPayload& list);

    /** Flattens every member's pingScores into rows. */
    std::vector<ScoreRow> scoreRowsOf(const Party& party);

    /** Convenience: typed payload into a ready-to-send Message. */
    template <typename Payload>
    Message makeMessage(MessageType type, const Payload& payload) {
        return makeMessage(type, encode(payload));
    }

} // namespace shortgap

#endif // SHORTGAP_PAYLOADS_HPP
