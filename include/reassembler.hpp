#pragma once

#include "chunk_store.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class IncompleteChunkSet : public std::runtime_error {
public:
    explicit IncompleteChunkSet(const std::string& what) : std::runtime_error(what) {}
};

class DigestMismatch : public std::runtime_error {
public:
    explicit DigestMismatch(const std::string& what) : std::runtime_error(what) {}
};

class Reassembler {
public:
    // Whole-buffer check run after assembly, e.g. expect_md5()
    using DigestCheck = std::function<bool(const std::vector<uint8_t>&)>;

    explicit Reassembler(DigestCheck digest_check = nullptr);

    void set_digest_check(DigestCheck digest_check);
    bool has_digest_check() const { return static_cast<bool>(digest_check_); }

    // Concatenates seq 0..total_chunks-1 in order.
    // Throws IncompleteChunkSet if any seq is absent, DigestMismatch if the check fails.
    std::vector<uint8_t> assemble(const ChunkStore& store, uint16_t total_chunks) const;

    // Concatenates whatever is present below total_chunks; gaps are skipped
    std::vector<uint8_t> assemble_partial(const ChunkStore& store, uint16_t total_chunks) const;

private:
    DigestCheck digest_check_;
};
