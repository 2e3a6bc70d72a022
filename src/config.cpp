#include "config.hpp"
#include "packet_parser.hpp"

#include <stdexcept>
#include <string>

ProtocolConfig::ProtocolConfig() : max_nack_entries(MAX_NACK_ENTRIES) {}

void validate_config(const ProtocolConfig& config) {
    if (config.chunk_size == 0 || config.chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk_size must be in 1.." + std::to_string(MAX_CHUNK_SIZE) +
                                    " (got " + std::to_string(config.chunk_size) + ")");
    }
    if (config.max_nack_entries == 0 || config.max_nack_entries > MAX_NACK_ENTRIES) {
        throw std::invalid_argument("max_nack_entries must be in 1.." + std::to_string(MAX_NACK_ENTRIES));
    }
    if (config.poll_interval.count() <= 0) {
        throw std::invalid_argument("poll_interval must be positive");
    }
    if (config.inter_chunk_delay.count() < 0 || config.nack_timeout.count() < 0 ||
        config.recv_timeout.count() < 0 || config.nack_ack_timeout.count() < 0 ||
        config.ack_linger.count() < 0) {
        throw std::invalid_argument("timeouts must not be negative");
    }
    // A sender that lost our final ACK repeats END after nack_timeout, the
    // receiver has to still be listening then
    if (config.ack_linger <= config.nack_timeout) {
        throw std::invalid_argument("ack_linger (" + std::to_string(config.ack_linger.count()) +
                                    " ms) must exceed nack_timeout (" +
                                    std::to_string(config.nack_timeout.count()) + " ms)");
    }
}
