#include "transport.hpp"
#include "config.hpp"

std::vector<uint8_t> frame_with_address(uint16_t destination, uint16_t source, uint8_t offset,
                                        const std::vector<uint8_t>& body) {
    std::vector<uint8_t> raw;
    raw.reserve(ADDRESS_HEADER_LEN + body.size());

    raw.push_back(static_cast<uint8_t>((destination >> 8) & 0xFF));
    raw.push_back(static_cast<uint8_t>(destination & 0xFF));
    raw.push_back(offset);
    raw.push_back(static_cast<uint8_t>((source >> 8) & 0xFF));
    raw.push_back(static_cast<uint8_t>(source & 0xFF));
    raw.push_back(offset);
    raw.insert(raw.end(), body.begin(), body.end());

    return raw;
}

std::optional<AddressedFrame> strip_address(const uint8_t* raw, std::size_t len) {
    if (raw == nullptr || len < ADDRESS_HEADER_LEN) {
        return std::nullopt;
    }

    AddressedFrame out;
    out.destination = static_cast<uint16_t>((raw[0] << 8) | raw[1]);
    // raw[2] and raw[5] are channel offsets, passed through untouched
    out.source = static_cast<uint16_t>((raw[3] << 8) | raw[4]);
    out.frame.source = out.source;
    out.frame.payload.assign(raw + ADDRESS_HEADER_LEN, raw + len);
    return out;
}
