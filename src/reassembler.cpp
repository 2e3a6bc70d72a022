#include "reassembler.hpp"

#include <utility>

Reassembler::Reassembler(DigestCheck digest_check)
    : digest_check_(std::move(digest_check)) {}

void Reassembler::set_digest_check(DigestCheck digest_check) {
    digest_check_ = std::move(digest_check);
}

std::vector<uint8_t> Reassembler::assemble(const ChunkStore& store, uint16_t total_chunks) const {
    std::size_t missing = store.missing_count(total_chunks);
    if (missing > 0) {
        throw IncompleteChunkSet("file_id " + std::to_string(store.file_id()) + ": " +
                                 std::to_string(missing) + " of " + std::to_string(total_chunks) +
                                 " chunks missing");
    }

    std::vector<uint8_t> file_data;
    file_data.reserve(store.stored_bytes());

    for (uint32_t seq = 0; seq < total_chunks; ++seq) {
        const std::vector<uint8_t>* payload = store.find(static_cast<uint16_t>(seq));
        file_data.insert(file_data.end(), payload->begin(), payload->end());
    }

    if (digest_check_ && !digest_check_(file_data)) {
        throw DigestMismatch("reassembled buffer of " + std::to_string(file_data.size()) +
                             " bytes failed the digest check");
    }

    return file_data;
}

std::vector<uint8_t> Reassembler::assemble_partial(const ChunkStore& store, uint16_t total_chunks) const {
    std::vector<uint8_t> file_data;
    file_data.reserve(store.stored_bytes());

    // std::map iterates in ascending seq order
    for (const auto& [seq, payload] : store.chunks()) {
        if (seq >= total_chunks) break;
        file_data.insert(file_data.end(), payload.begin(), payload.end());
    }

    return file_data;
}
