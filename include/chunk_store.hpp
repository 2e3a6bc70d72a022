#ifndef LORAXFER_CHUNK_STORE_HPP
#define LORAXFER_CHUNK_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

// Verified chunks of the one transfer the receiver is collecting.
// Keyed by seq, so arrival order and duplicates do not matter.
class ChunkStore {
public:
    explicit ChunkStore(uint16_t file_id = 0);

    void reset(uint16_t file_id);
    uint16_t file_id() const { return file_id_; }

    // Stores a checksum-valid payload. An already stored seq keeps its first
    // value; returns false in that case.
    bool put(uint16_t seq, std::vector<uint8_t> payload);

    // A corrupt copy of a seq that is already stored is ignored
    void mark_corrupt(uint16_t seq);

    bool contains(uint16_t seq) const;
    bool is_corrupt(uint16_t seq) const;
    const std::vector<uint8_t>* find(uint16_t seq) const;

    std::size_t size() const { return chunks_.size(); }
    std::size_t stored_bytes() const { return stored_bytes_; }

    // Highest seq seen so far, valid or corrupt; -1 when nothing arrived
    int32_t highest_seq() const { return highest_seq_; }

    // Ascending seqs in [0, total_chunks) that are absent or corrupt
    std::vector<uint16_t> missing(uint16_t total_chunks) const;
    std::size_t missing_count(uint16_t total_chunks) const;

    const std::map<uint16_t, std::vector<uint8_t>>& chunks() const { return chunks_; }

private:
    uint16_t file_id_;
    std::map<uint16_t, std::vector<uint8_t>> chunks_;
    std::set<uint16_t> corrupt_;
    std::size_t stored_bytes_ = 0;
    int32_t highest_seq_ = -1;

    void note_seq(uint16_t seq);
};

#endif // LORAXFER_CHUNK_STORE_HPP
