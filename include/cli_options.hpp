#pragma once

#include "config.hpp"
#include "sender_receiver.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct CliOptions {
    LinkOptions link;
    ProtocolConfig protocol;
    uint16_t own_address = 0;
    std::string optimize_preset;
    std::string expect_md5;
};

// All parsers throw std::invalid_argument on malformed or out-of-range input

// Decimal or 0x-prefixed node address
uint16_t parse_address(const std::string& text);

// Whole-string decimal integer in [min, max]
long long parse_number(const std::string& flag, const std::string& text, long long min, long long max);

// <local_port>:<peer_host>:<peer_port>
UdpConfig parse_udp(const std::string& endpoints);

// `--flag value` pairs following the positional arguments. Without --linger-ms
// the ACK linger is stretched past a raised --nack-timeout-ms.
CliOptions parse_options(const std::vector<std::string>& args);

void set_own_address(CliOptions& opts, uint16_t address);
