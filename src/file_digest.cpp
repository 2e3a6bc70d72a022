#include "file_digest.hpp"

extern "C" {
#include <libavutil/md5.h>
}

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

std::string md5_hex(const std::vector<uint8_t>& data) {
    uint8_t digest[16];
    av_md5_sum(digest, data.data(), data.size());

    std::string hex;
    hex.reserve(32);
    char byte_hex[3];
    for (uint8_t b : digest) {
        std::snprintf(byte_hex, sizeof(byte_hex), "%02x", b);
        hex += byte_hex;
    }
    return hex;
}

Reassembler::DigestCheck expect_md5(const std::string& hex) {
    if (hex.size() != 32 ||
        !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("expected MD5 must be 32 hex digits: '" + hex + "'");
    }

    std::string expected(hex);
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return [expected](const std::vector<uint8_t>& data) {
        return md5_hex(data) == expected;
    };
}
