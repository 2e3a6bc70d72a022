#ifndef LORAXFER_CONFIG_HPP
#define LORAXFER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

// Radio link limits (SX126x UART modules, 240 byte sub-packet buffer)
constexpr std::size_t LINK_BUFFER_SIZE = 240;
constexpr std::size_t ADDRESS_HEADER_LEN = 6;   // dest(2) + offset(1) + src(2) + offset(1)
constexpr std::size_t MAX_BODY_LEN = LINK_BUFFER_SIZE - ADDRESS_HEADER_LEN;

constexpr uint16_t BROADCAST_ADDRESS = 0xFFFF;

// total_chunks is 16 bits, so seqs run 0..65534
constexpr uint32_t MAX_TOTAL_CHUNKS = 0xFFFF;

// file_id range, keeps clear of 0x00xx and 0xFFFF
constexpr uint16_t FILE_ID_MIN = 0x0100;
constexpr uint16_t FILE_ID_MAX = 0xFFFE;

struct ProtocolConfig {
    uint16_t chunk_size = 200;
    std::chrono::milliseconds inter_chunk_delay{50};   // pacing only, never an ACK wait
    std::chrono::milliseconds nack_timeout{10000};     // sender: wait for NACK/ACK after END
    unsigned max_retry_rounds = 3;
    std::chrono::milliseconds recv_timeout{5000};      // receiver: silence before assuming END lost
    std::chrono::milliseconds nack_ack_timeout{3000};  // receiver: wait after sending a NACK
    unsigned max_nack_retries = 3;
    std::chrono::milliseconds ack_linger{15000};       // receiver: re-ACK window after completion, > nack_timeout
    std::chrono::milliseconds poll_interval{100};
    std::size_t max_nack_entries;

    ProtocolConfig();
};

// Throws std::invalid_argument
void validate_config(const ProtocolConfig& config);

#endif // LORAXFER_CONFIG_HPP
