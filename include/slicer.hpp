#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

struct Chunk {
    uint16_t file_id;
    uint16_t seq;
    uint8_t checksum;
    std::vector<uint8_t> payload;
};

// Sum of all bytes modulo 256
uint8_t chunk_checksum(const uint8_t* data, std::size_t len);
uint8_t chunk_checksum(const std::vector<uint8_t>& data);

// ceil(size / chunk_size), throws std::invalid_argument when it does not fit 16 bits
uint16_t count_chunks(std::size_t size, uint16_t chunk_size);

// Slice file data into checksummed chunks, the last one may be shorter
std::vector<Chunk> slice_file(const std::vector<uint8_t>& file_data,
                              uint16_t file_id,
                              uint16_t chunk_size);
