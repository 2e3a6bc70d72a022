#ifndef LORAXFER_PACKET_PARSER_HPP
#define LORAXFER_PACKET_PARSER_HPP

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class PacketKind : uint8_t {
    Data = 0x01,
    Nack = 0xDD,
    Ack = 0xAA,
    End = 0xFF
};

// Fixed-field sizes of each body, tag included
constexpr std::size_t DATA_HEADER_LEN = 6;   // tag(1) file_id(2) seq(2) checksum(1)
constexpr std::size_t END_LEN = 5;           // tag(1) file_id(2) total_chunks(2)
constexpr std::size_t NACK_HEADER_LEN = 5;   // tag(1) file_id(2) missing_count(2)
constexpr std::size_t ACK_LEN = 5;           // tag(1) file_id(2) reserved(2)

constexpr uint16_t MAX_CHUNK_SIZE = MAX_BODY_LEN - DATA_HEADER_LEN;
constexpr std::size_t MAX_NACK_ENTRIES = (MAX_BODY_LEN - NACK_HEADER_LEN) / sizeof(uint16_t);

class MalformedPacket : public std::runtime_error {
public:
    explicit MalformedPacket(const std::string& what) : std::runtime_error(what) {}
};

// One decoded body. Only the fields of `kind` are meaningful.
struct ProtocolPacket {
    PacketKind kind = PacketKind::Data;
    uint16_t file_id = 0;
    uint16_t seq = 0;               // DATA
    uint8_t checksum = 0;           // DATA
    std::vector<uint8_t> payload;   // DATA
    uint16_t total_chunks = 0;      // END
    std::vector<uint16_t> missing;  // NACK
};

ProtocolPacket make_data_packet(uint16_t file_id, uint16_t seq, uint8_t checksum,
                                std::vector<uint8_t> payload);
ProtocolPacket make_end_packet(uint16_t file_id, uint16_t total_chunks);
ProtocolPacket make_nack_packet(uint16_t file_id, std::vector<uint16_t> missing);
ProtocolPacket make_ack_packet(uint16_t file_id);

// ProtocolPacket -> body bytes (big endian)
std::vector<uint8_t> serialize_packet(const ProtocolPacket& pkt);

// Body bytes -> ProtocolPacket, throws MalformedPacket
ProtocolPacket parse_packet(const uint8_t* data, std::size_t len);
ProtocolPacket parse_packet(const std::vector<uint8_t>& body);

const char* packet_kind_name(PacketKind kind);

#endif // LORAXFER_PACKET_PARSER_HPP
