#include "Payloads.hpp"

namespace shortgap {

    // ============================================================
    // ByteWriter
    // ============================================================
    void ByteWriter::u8(uint8_t value) {
        buf.push_back(value);
    }

    void ByteWriter::u16(uint16_t value) {
        buf.push_back(static_cast<uint8_t>(value >> 8));
        buf.push_back(static_cast<uint8_t>(value));
    }

    void ByteWriter::u32(uint32_t value) {
        putBE32(buf, value);
    }

    void ByteWriter::u64(uint64_t value) {
        putBE64(buf, value);
    }

    void ByteWriter::boolean(bool value) {
        buf.push_back(value ? 1 : 0);
    }

    void ByteWriter::str(const std::string& value) {
        putBE32(buf, static_cast<uint32_t>(value.size()));
        buf.insert(buf.end(), value.begin(), value.end());
    }

    // ============================================================
    // ByteReader
    // ============================================================
    bool ByteReader::need(size_t count) {
        if (failed || buf.size() - pos < count) {
            failed = true;
            return false;
        }
        return true;
    }

    bool ByteReader::u8(uint8_t& out) {
        if (!need(1)) return false;
        out = buf[pos++];
        return true;
    }

    bool ByteReader::u16(uint16_t& out) {
        if (!need(2)) return false;
        out = static_cast<uint16_t>((buf[pos] << 8) | buf[pos + 1]);
        pos += 2;
        return true;
    }

    bool ByteReader::u32(uint32_t& out) {
        if (!need(4)) return false;
        out = getBE32(buf.data() + pos);
        pos += 4;
        return true;
    }

    bool ByteReader::u64(uint64_t& out) {
        if (!need(8)) return false;
        out = getBE64(buf.data() + pos);
        pos += 8;
        return true;
    }

    bool ByteReader::boolean(bool& out) {
        uint8_t raw = 0;
        if (!u8(raw) || raw > 1) {
            failed = true;
            return false;
        }
        out = raw == 1;
        return true;
    }

    bool ByteReader::str(std::string& out, size_t maxLength) {
        uint32_t length = 0;
        if (!u32(length)) return false;
        if (length > maxLength || !need(length)) {
            failed = true;
            return false;
        }
        out.assign(reinterpret_cast<const char*>(buf.data() + pos), length);
        pos += length;
        return true;
    }

    bool ByteReader::transport(TransportKind& out) {
        uint8_t raw = 0;
        if (!u8(raw) || !isValidTransport(raw)) {
            failed = true;
            return false;
        }
        out = static_cast<TransportKind>(raw);
        return true;
    }

    // ============================================================
    // Shared pieces
    // ============================================================
    namespace {

        void writeClaim(ByteWriter& w, const HostClaim& claim) {
            w.str(claim.hostId);
            w.u64(claim.term);
            w.boolean(claim.score.has_value());
            w.u32(claim.score.value_or(0));
            w.u64(toMillis(claim.lastSeen));
            w.u64(claim.joinOrder);
        }

        bool readClaim(ByteReader& r, HostClaim& claim) {
            bool hasScore = false;
            uint32_t score = 0;
            uint64_t lastSeenMs = 0;
            if (!r.str(claim.hostId, ID_BYTES * 2) || !r.u64(claim.term) ||
                !r.boolean(hasScore) || !r.u32(score) ||
                !r.u64(lastSeenMs) || !r.u64(claim.joinOrder)) {
                return false;
            }
            claim.score = hasScore ? std::optional<uint32_t>(score) : std::nullopt;
            claim.lastSeen = fromMillis(lastSeenMs);
            return true;
        }

        void writeScoreRow(ByteWriter& w, const ScoreRow& row) {
            w.str(row.memberId);
            w.u8(static_cast<uint8_t>(row.transport));
            w.u32(row.millis);
            w.u64(row.measuredAtMs);
        }

        bool readScoreRow(ByteReader& r, ScoreRow& row) {
            return r.str(row.memberId, ID_BYTES * 2) && r.transport(row.transport) &&
                   r.u32(row.millis) && r.u64(row.measuredAtMs);
        }

        void writeAddress(ByteWriter& w, const PeerAddress& address) {
            w.str(address.host);
            w.u16(address.port);
            w.u8(static_cast<uint8_t>(address.transport));
        }

        bool readAddress(ByteReader& r, PeerAddress& address) {
            return r.str(address.host, 255) && r.u16(address.port) && r.transport(address.transport);
        }

        void writeRecord(ByteWriter& w, const MemberRecord& record) {
            w.str(record.id);
            w.str(record.displayName);
            w.u32(static_cast<uint32_t>(record.addresses.size()));
            for (const auto& address : record.addresses) writeAddress(w, address);
            w.boolean(record.online);
            w.u64(record.lastSeenMs);
            w.u64(record.joinOrder);
            w.u32(static_cast<uint32_t>(record.scores.size()));
            for (const auto& row : record.scores) writeScoreRow(w, row);
        }

        bool readRecord(ByteReader& r, MemberRecord& record) {
            uint32_t addressCount = 0;
            if (!r.str(record.id, ID_BYTES * 2) || !r.str(record.displayName, MAX_NAME_LENGTH + 16) ||
                !r.u32(addressCount)) {
                return false;
            }
            record.addresses.clear();
            for (uint32_t i = 0; i < addressCount; ++i) {
                PeerAddress address;
                if (!readAddress(r, address)) return false;
                record.addresses.push_back(address);
            }

            uint32_t scoreCount = 0;
            if (!r.boolean(record.online) || !r.u64(record.lastSeenMs) ||
                !r.u64(record.joinOrder) || !r.u32(scoreCount)) {
                return false;
            }
            record.scores.clear();
            for (uint32_t i = 0; i < scoreCount; ++i) {
                ScoreRow row;
                if (!readScoreRow(r, row)) return false;
                record.scores.push_back(row);
            }
            return true;
        }

        void writePeerList(ByteWriter& w, const PeerListPayload& list) {
            w.str(list.partyId);
            w.str(list.hostId);
            w.u64(list.term);
            w.u8(static_cast<uint8_t>(list.activeTransport));
            w.u64(list.createdAtMs);
            w.u32(static_cast<uint32_t>(list.members.size()));
            for (const auto& record : list.members) writeRecord(w, record);
        }

        bool readPeerList(ByteReader& r, PeerListPayload& list) {
            uint32_t count = 0;
            if (!r.str(list.partyId, ID_BYTES * 2) || !r.str(list.hostId, ID_BYTES * 2) ||
                !r.u64(list.term) || !r.transport(list.activeTransport) ||
                !r.u64(list.createdAtMs) || !r.u32(count)) {
                return false;
            }
            list.members.clear();
            for (uint32_t i = 0; i < count; ++i) {
                MemberRecord record;
                if (!readRecord(r, record)) return false;
                list.members.push_back(std::move(record));
            }
            return true;
        }

        // Decodes into a scratch value so `out` only changes on success
        template <typename T, typename ReadFn>
        bool decodeWith(const std::vector<uint8_t>& data, T& out, ReadFn read) {
            ByteReader r(data);
            T parsed;
            if (!read(r, parsed) || !r.atEnd()) {
                return false;
            }
            out = std::move(parsed);
            return true;
        }

    } // namespace

    // ============================================================
    // PROBE
    // ============================================================
    std::vector<uint8_t> encode(const ProbePayload& payload) {
        ByteWriter w;
        w.str(payload.senderId);
        w.u64(payload.sentAtMs);
        w.u64(payload.nonce);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, ProbePayload& out) {
        return decodeWith(data, out, [](ByteReader& r, ProbePayload& p) {
            return r.str(p.senderId, ID_BYTES * 2) && r.u64(p.sentAtMs) && r.u64(p.nonce);
        });
    }

    // ============================================================
    // HANDSHAKE
    // ============================================================
    std::vector<uint8_t> encode(const HandshakePayload& payload) {
        ByteWriter w;
        w.str(payload.partyId);
        w.str(payload.senderId);
        w.u8(static_cast<uint8_t>(payload.transport));
        w.str(payload.displayName);
        w.u16(payload.tcpPort);
        w.u16(payload.wsPort);
        w.str(payload.advertisedHost);
        writeClaim(w, payload.claim);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, HandshakePayload& out) {
        return decodeWith(data, out, [](ByteReader& r, HandshakePayload& p) {
            return r.str(p.partyId, ID_BYTES * 2) && r.str(p.senderId, ID_BYTES * 2) &&
                   r.transport(p.transport) && r.str(p.displayName, MAX_NAME_LENGTH) &&
                   r.u16(p.tcpPort) && r.u16(p.wsPort) && r.str(p.advertisedHost, 255) &&
                   readClaim(r, p.claim);
        });
    }

    std::vector<uint8_t> encode(const HandshakeAckPayload& payload) {
        ByteWriter w;
        w.str(payload.partyId);
        w.str(payload.senderId);
        w.u8(static_cast<uint8_t>(payload.transport));
        w.boolean(payload.accepted);
        w.str(payload.reason);
        w.str(payload.assignedName);
        w.u16(payload.tcpPort);
        w.u16(payload.wsPort);
        writeClaim(w, payload.claim);
        writePeerList(w, payload.peers);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, HandshakeAckPayload& out) {
        return decodeWith(data, out, [](ByteReader& r, HandshakeAckPayload& p) {
            return r.str(p.partyId, ID_BYTES * 2) && r.str(p.senderId, ID_BYTES * 2) &&
                   r.transport(p.transport) && r.boolean(p.accepted) && r.str(p.reason, 1024) &&
                   r.str(p.assignedName, MAX_NAME_LENGTH + 16) && r.u16(p.tcpPort) && r.u16(p.wsPort) &&
                   readClaim(r, p.claim) &&
                   readPeerList(r, p.peers);
        });
    }

    // ============================================================
    // PEER LIST / MEMBER RECORD
    // ============================================================
    std::vector<uint8_t> encode(const PeerListPayload& payload) {
        ByteWriter w;
        writePeerList(w, payload);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, PeerListPayload& out) {
        return decodeWith(data, out, readPeerList);
    }

    std::vector<uint8_t> encode(const MemberRecord& payload) {
        ByteWriter w;
        writeRecord(w, payload);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, MemberRecord& out) {
        return decodeWith(data, out, readRecord);
    }

    // ============================================================
    // SCORE TABLE
    // ============================================================
    std::vector<uint8_t> encode(const ScoreTablePayload& payload) {
        ByteWriter w;
        w.str(payload.senderId);
        w.u32(static_cast<uint32_t>(payload.rows.size()));
        for (const auto& row : payload.rows) writeScoreRow(w, row);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, ScoreTablePayload& out) {
        return decodeWith(data, out, [](ByteReader& r, ScoreTablePayload& p) {
            uint32_t count = 0;
            if (!r.str(p.senderId, ID_BYTES * 2) || !r.u32(count)) return false;
            for (uint32_t i = 0; i < count; ++i) {
                ScoreRow row;
                if (!readScoreRow(r, row)) return false;
                p.rows.push_back(std::move(row));
            }
            return true;
        });
    }

    // ============================================================
    // CHAT
    // ============================================================
    std::vector<uint8_t> encode(const ChatPayload& payload) {
        ByteWriter w;
        w.str(payload.messageId);
        w.str(payload.senderId);
        w.str(payload.content);
        w.u64(payload.sentAtMs);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, ChatPayload& out) {
        return decodeWith(data, out, [](ByteReader& r, ChatPayload& p) {
            return r.str(p.messageId, ID_BYTES * 2) && r.str(p.senderId, ID_BYTES * 2) &&
                   r.str(p.content) && r.u64(p.sentAtMs);
        });
    }

    // ============================================================
    // CONTROL
    // ============================================================
    std::vector<uint8_t> encode(const MemberStatusPayload& payload) {
        ByteWriter w;
        w.str(payload.memberId);
        w.boolean(payload.online);
        w.boolean(payload.removed);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, MemberStatusPayload& out) {
        return decodeWith(data, out, [](ByteReader& r, MemberStatusPayload& p) {
            return r.str(p.memberId, ID_BYTES * 2) && r.boolean(p.online) && r.boolean(p.removed);
        });
    }

    std::vector<uint8_t> encode(const HostClaim& payload) {
        ByteWriter w;
        writeClaim(w, payload);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, HostClaim& out) {
        return decodeWith(data, out, readClaim);
    }

    std::vector<uint8_t> encode(const TransportChangePayload& payload) {
        ByteWriter w;
        w.u8(static_cast<uint8_t>(payload.kind));
        w.str(payload.senderId);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, TransportChangePayload& out) {
        return decodeWith(data, out, [](ByteReader& r, TransportChangePayload& p) {
            return r.transport(p.kind) && r.str(p.senderId, ID_BYTES * 2);
        });
    }

    std::vector<uint8_t> encode(const RtcSignalPayload& payload) {
        ByteWriter w;
        w.str(payload.senderId);
        w.str(payload.targetId);
        w.str(payload.kind);
        w.str(payload.data);
        w.str(payload.mid);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, RtcSignalPayload& out) {
        return decodeWith(data, out, [](ByteReader& r, RtcSignalPayload& p) {
            return r.str(p.senderId, ID_BYTES * 2) && r.str(p.targetId, ID_BYTES * 2) &&
                   r.str(p.kind, 16) && r.str(p.data) && r.str(p.mid, 256);
        });
    }

    std::vector<uint8_t> encode(const DisconnectPayload& payload) {
        ByteWriter w;
        w.str(payload.senderId);
        return w.take();
    }

    bool decode(const std::vector<uint8_t>& data, DisconnectPayload& out) {
        return decodeWith(data, out, [](ByteReader& r, DisconnectPayload& p) {
            return r.str(p.senderId, ID_BYTES * 2);
        });
    }

    // ============================================================
    // Registry <-> wire
    // ============================================================
    MemberRecord toRecord(const Member& member) {
        MemberRecord record;
        record.id = member.id;
        record.displayName = member.displayName;
        record.addresses = member.addresses;
        record.online = member.isOnline;
        record.lastSeenMs = toMillis(member.lastSeen);
        record.joinOrder = member.joinOrder;
        for (const auto& [transport, entry] : member.pingScores) {
            record.scores.push_back(ScoreRow{member.id, transport, entry.roundTripMillis, toMillis(entry.measuredAt)});
        }
        return record;
    }

    Member fromRecord(const MemberRecord& record) {
        Member member;
        member.id = record.id;
        member.displayName = record.displayName;
        member.addresses = record.addresses;
        member.isOnline = record.online;
        member.lastSeen = fromMillis(record.lastSeenMs);
        member.joinOrder = record.joinOrder;
        for (const auto& row : record.scores) {
            member.pingScores[row.transport] = ScoreEntry{row.millis, fromMillis(row.measuredAtMs)};
        }
        return member;
    }

    PeerListPayload toPeerList(const Party& party) {
        PeerListPayload list;
        list.partyId = party.partyId;
        list.hostId = party.hostId;
        list.term = party.term;
        list.activeTransport = party.activeTransport;
        list.createdAtMs = toMillis(party.createdAt);
        list.members.reserve(party.members.size());
        for (const auto& [id, member] : party.members) {
            (void)id;
            list.members.push_back(toRecord(member));
        }
        return list;
    }

    std::vector<Member> membersOf(const PeerListPayload& list) {
        std::vector<Member> members;
        members.reserve(list.members.size());
        for (const auto& record : list.members) {
            members.push_back(fromRecord(record));
        }
        return members;
    }

    std::vector<ScoreRow> scoreRowsOf(const Party& party) {
        std::vector<ScoreRow> rows;
        for (const auto& [id, member] : party.members) {
            for (const auto& [transport, entry] : member.pingScores) {
                rows.push_back(ScoreRow{id, transport, entry.roundTripMillis, toMillis(entry.measuredAt)});
            }
        }
        return rows;
    }

} // namespace shortgap
