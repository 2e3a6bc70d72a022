#include "helpers.h"
#include "slicer.hpp"

#include <algorithm>
#include <chrono>

std::vector<uint8_t> sampleData(size_t len, uint8_t salt) {
  std::vector<uint8_t> data(len);
  for (size_t i = 0; i < len; i++) {
    data[i] = static_cast<uint8_t>((i * 31 + (i >> 8) * 7 + salt) & 0xFF);
  }
  return data;
}

ProtocolConfig fastConfig(void) {
  ProtocolConfig config;
  config.inter_chunk_delay = std::chrono::milliseconds(0);
  config.nack_timeout = std::chrono::milliseconds(300);
  config.recv_timeout = std::chrono::milliseconds(150);
  config.nack_ack_timeout = std::chrono::milliseconds(100);
  config.ack_linger = std::chrono::milliseconds(500);
  config.poll_interval = std::chrono::milliseconds(5);
  return config;
}

std::vector<Frame> drainFrames(Session& session) {
  std::vector<Frame> frames;
  while (auto frame = session.receive(std::chrono::milliseconds(0))) {
    frames.push_back(std::move(*frame));
  }
  return frames;
}

std::vector<ProtocolPacket> drainPackets(Session& session) {
  std::vector<ProtocolPacket> packets;
  for (const Frame& frame : drainFrames(session)) {
    packets.push_back(parse_packet(frame.payload));
  }
  return packets;
}

size_t countKind(const std::vector<ProtocolPacket>& packets, PacketKind kind) {
  return static_cast<size_t>(std::count_if(packets.begin(), packets.end(),
      [kind](const ProtocolPacket& pkt) { return pkt.kind == kind; }));
}

ProtocolPacket dataPacket(const std::vector<uint8_t>& data, uint16_t file_id,
                          uint16_t chunk_size, uint16_t seq) {
  size_t offset = static_cast<size_t>(seq) * chunk_size;
  size_t len = std::min(static_cast<size_t>(chunk_size), data.size() - offset);
  std::vector<uint8_t> payload(data.begin() + offset, data.begin() + offset + len);
  uint8_t checksum = chunk_checksum(payload);
  return make_data_packet(file_id, seq, checksum, std::move(payload));
}
