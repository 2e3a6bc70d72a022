#include "slicer.hpp"
#include "config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

uint8_t chunk_checksum(const uint8_t* data, std::size_t len) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < len; ++i) {
        sum += data[i];
    }
    return static_cast<uint8_t>(sum & 0xFF);
}

uint8_t chunk_checksum(const std::vector<uint8_t>& data) {
    return chunk_checksum(data.data(), data.size());
}

uint16_t count_chunks(std::size_t size, uint16_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must not be zero");
    }

    std::size_t total = (size + chunk_size - 1) / chunk_size;
    if (total > MAX_TOTAL_CHUNKS) {
        throw std::invalid_argument("file of " + std::to_string(size) + " bytes needs " +
                                    std::to_string(total) + " chunks (max " +
                                    std::to_string(MAX_TOTAL_CHUNKS) + ")");
    }
    return static_cast<uint16_t>(total);
}

std::vector<Chunk> slice_file(const std::vector<uint8_t>& file_data,
                              uint16_t file_id,
                              uint16_t chunk_size) {
    uint16_t total_chunks = count_chunks(file_data.size(), chunk_size);

    std::vector<Chunk> chunks;
    chunks.reserve(total_chunks);

    for (std::size_t i = 0; i < total_chunks; ++i) {
        std::size_t offset = i * chunk_size;
        std::size_t len = std::min(static_cast<std::size_t>(chunk_size), file_data.size() - offset);

        Chunk c;
        c.file_id = file_id;
        c.seq = static_cast<uint16_t>(i);
        c.payload.assign(file_data.begin() + offset, file_data.begin() + offset + len);
        c.checksum = chunk_checksum(c.payload);

        chunks.push_back(std::move(c));
    }

    return chunks;
}
