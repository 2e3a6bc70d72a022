#include "packet_parser.hpp"

#include <limits>
#include <utility>

// Body layouts:
// DATA  [0x01] file_id(2) seq(2) checksum(1) payload(...)
// END   [0xFF] file_id(2) total_chunks(2)
// NACK  [0xDD] file_id(2) missing_count(2) missing_seq(2) x missing_count
// ACK   [0xAA] file_id(2) reserved(2)

namespace {

void put_be16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t get_be16(const uint8_t* in) {
    return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) | in[1]);
}

void require_len(std::size_t len, std::size_t min_len, const char* kind) {
    if (len < min_len) {
        throw MalformedPacket(std::string("[parse_packet] ") + kind + " body too short: " +
                              std::to_string(len) + " < " + std::to_string(min_len));
    }
}

} // namespace

ProtocolPacket make_data_packet(uint16_t file_id, uint16_t seq, uint8_t checksum,
                                std::vector<uint8_t> payload) {
    ProtocolPacket pkt;
    pkt.kind = PacketKind::Data;
    pkt.file_id = file_id;
    pkt.seq = seq;
    pkt.checksum = checksum;
    pkt.payload = std::move(payload);
    return pkt;
}

ProtocolPacket make_end_packet(uint16_t file_id, uint16_t total_chunks) {
    ProtocolPacket pkt;
    pkt.kind = PacketKind::End;
    pkt.file_id = file_id;
    pkt.total_chunks = total_chunks;
    return pkt;
}

ProtocolPacket make_nack_packet(uint16_t file_id, std::vector<uint16_t> missing) {
    ProtocolPacket pkt;
    pkt.kind = PacketKind::Nack;
    pkt.file_id = file_id;
    pkt.missing = std::move(missing);
    return pkt;
}

ProtocolPacket make_ack_packet(uint16_t file_id) {
    ProtocolPacket pkt;
    pkt.kind = PacketKind::Ack;
    pkt.file_id = file_id;
    return pkt;
}

std::vector<uint8_t> serialize_packet(const ProtocolPacket& pkt) {
    std::vector<uint8_t> buffer;

    switch (pkt.kind) {
    case PacketKind::Data:
        buffer.reserve(DATA_HEADER_LEN + pkt.payload.size());
        buffer.push_back(static_cast<uint8_t>(PacketKind::Data));
        put_be16(buffer, pkt.file_id);
        put_be16(buffer, pkt.seq);
        buffer.push_back(pkt.checksum);
        buffer.insert(buffer.end(), pkt.payload.begin(), pkt.payload.end());
        break;
    case PacketKind::End:
        buffer.reserve(END_LEN);
        buffer.push_back(static_cast<uint8_t>(PacketKind::End));
        put_be16(buffer, pkt.file_id);
        put_be16(buffer, pkt.total_chunks);
        break;
    case PacketKind::Nack:
        if (pkt.missing.size() > std::numeric_limits<uint16_t>::max()) {
            throw std::invalid_argument("[serialize_packet] NACK list does not fit a 16-bit count");
        }
        buffer.reserve(NACK_HEADER_LEN + pkt.missing.size() * sizeof(uint16_t));
        buffer.push_back(static_cast<uint8_t>(PacketKind::Nack));
        put_be16(buffer, pkt.file_id);
        put_be16(buffer, static_cast<uint16_t>(pkt.missing.size()));
        for (uint16_t seq : pkt.missing) {
            put_be16(buffer, seq);
        }
        break;
    case PacketKind::Ack:
        buffer.reserve(ACK_LEN);
        buffer.push_back(static_cast<uint8_t>(PacketKind::Ack));
        put_be16(buffer, pkt.file_id);
        put_be16(buffer, 0x0000);
        break;
    }

    return buffer;
}

ProtocolPacket parse_packet(const uint8_t* data, std::size_t len) {
    if (data == nullptr || len == 0) {
        throw MalformedPacket("[parse_packet] empty body");
    }

    ProtocolPacket pkt;

    switch (data[0]) {
    case static_cast<uint8_t>(PacketKind::Data):
        require_len(len, DATA_HEADER_LEN, "DATA");
        pkt.kind = PacketKind::Data;
        pkt.file_id = get_be16(data + 1);
        pkt.seq = get_be16(data + 3);
        pkt.checksum = data[5];
        pkt.payload.assign(data + DATA_HEADER_LEN, data + len);
        break;
    case static_cast<uint8_t>(PacketKind::End):
        require_len(len, END_LEN, "END");
        pkt.kind = PacketKind::End;
        pkt.file_id = get_be16(data + 1);
        pkt.total_chunks = get_be16(data + 3);
        break;
    case static_cast<uint8_t>(PacketKind::Nack): {
        require_len(len, NACK_HEADER_LEN, "NACK");
        pkt.kind = PacketKind::Nack;
        pkt.file_id = get_be16(data + 1);
        uint16_t count = get_be16(data + 3);
        std::size_t remaining = len - NACK_HEADER_LEN;
        if (remaining != static_cast<std::size_t>(count) * sizeof(uint16_t)) {
            throw MalformedPacket("[parse_packet] NACK declares " + std::to_string(count) +
                                  " entries but carries " + std::to_string(remaining) + " bytes");
        }
        pkt.missing.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            pkt.missing.push_back(get_be16(data + NACK_HEADER_LEN + i * sizeof(uint16_t)));
        }
        break;
    }
    case static_cast<uint8_t>(PacketKind::Ack):
        require_len(len, ACK_LEN, "ACK");
        pkt.kind = PacketKind::Ack;
        pkt.file_id = get_be16(data + 1);
        break;
    default:
        throw MalformedPacket("[parse_packet] unknown tag " + std::to_string(data[0]));
    }

    return pkt;
}

ProtocolPacket parse_packet(const std::vector<uint8_t>& body) {
    return parse_packet(body.data(), body.size());
}

const char* packet_kind_name(PacketKind kind) {
    switch (kind) {
    case PacketKind::Data: return "DATA";
    case PacketKind::End:  return "END";
    case PacketKind::Nack: return "NACK";
    case PacketKind::Ack:  return "ACK";
    }
    return "?";
}
