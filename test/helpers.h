#ifndef HELPERS_H
#define HELPERS_H

#include <stdint.h>
#include <vector>

#include "config.hpp"
#include "packet_parser.hpp"
#include "transport.hpp"

const uint16_t SENDER_ADDR = 0x0001;
const uint16_t RECEIVER_ADDR = 0x0002;
const uint16_t OTHER_ADDR = 0x0003;

const uint16_t SAMPLE_FILE_ID = 0x1234;

// Deterministic non-repeating-looking bytes
std::vector<uint8_t> sampleData(size_t len, uint8_t salt = 0);

// No pacing and short timeouts so state machines run in milliseconds
ProtocolConfig fastConfig(void);

// Every frame already waiting on the session, without blocking
std::vector<Frame> drainFrames(Session& session);
std::vector<ProtocolPacket> drainPackets(Session& session);

size_t countKind(const std::vector<ProtocolPacket>& packets, PacketKind kind);

// DATA packet for seq of `data`, as the sender would slice it
ProtocolPacket dataPacket(const std::vector<uint8_t>& data, uint16_t file_id,
                          uint16_t chunk_size, uint16_t seq);

#endif
