#include "chunk_store.hpp"

#include <utility>

ChunkStore::ChunkStore(uint16_t file_id) : file_id_(file_id) {}

void ChunkStore::reset(uint16_t file_id) {
    file_id_ = file_id;
    chunks_.clear();
    corrupt_.clear();
    stored_bytes_ = 0;
    highest_seq_ = -1;
}

void ChunkStore::note_seq(uint16_t seq) {
    if (static_cast<int32_t>(seq) > highest_seq_) {
        highest_seq_ = seq;
    }
}

bool ChunkStore::put(uint16_t seq, std::vector<uint8_t> payload) {
    note_seq(seq);

    if (chunks_.count(seq) != 0) {
        return false;
    }

    corrupt_.erase(seq);
    stored_bytes_ += payload.size();
    chunks_.emplace(seq, std::move(payload));
    return true;
}

void ChunkStore::mark_corrupt(uint16_t seq) {
    note_seq(seq);

    if (chunks_.count(seq) == 0) {
        corrupt_.insert(seq);
    }
}

bool ChunkStore::contains(uint16_t seq) const {
    return chunks_.count(seq) != 0;
}

bool ChunkStore::is_corrupt(uint16_t seq) const {
    return corrupt_.count(seq) != 0;
}

const std::vector<uint8_t>* ChunkStore::find(uint16_t seq) const {
    auto it = chunks_.find(seq);
    return it == chunks_.end() ? nullptr : &it->second;
}

std::vector<uint16_t> ChunkStore::missing(uint16_t total_chunks) const {
    std::vector<uint16_t> result;

    for (uint32_t seq = 0; seq < total_chunks; ++seq) {
        if (chunks_.count(static_cast<uint16_t>(seq)) == 0) {
            result.push_back(static_cast<uint16_t>(seq));
        }
    }

    return result;
}

std::size_t ChunkStore::missing_count(uint16_t total_chunks) const {
    std::size_t present = 0;
    for (const auto& [seq, payload] : chunks_) {
        if (seq < total_chunks) {
            ++present;
        }
    }
    return total_chunks - present;
}
