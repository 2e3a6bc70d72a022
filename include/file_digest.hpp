#pragma once

#include "reassembler.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Lowercase hex MD5 of the whole buffer
std::string md5_hex(const std::vector<uint8_t>& data);

// DigestCheck comparing against a known MD5 (hex, case-insensitive).
// Throws std::invalid_argument if `hex` is not 32 hex digits.
Reassembler::DigestCheck expect_md5(const std::string& hex);
