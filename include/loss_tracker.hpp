#ifndef LORAXFER_LOSS_TRACKER_HPP
#define LORAXFER_LOSS_TRACKER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Sender-side ledger of one transfer: which chunks the receiver has
// confirmed through NACK cycles, and how much was (re)transmitted.
class LossTracker {
public:
    LossTracker() = default;

    void reset(uint16_t total_chunks);

    void chunk_sent();
    void chunk_resent();

    // A complete NACK confirms every chunk it does not list.
    // A possibly truncated one (complete_list == false) confirms nothing.
    void nack_received(const std::vector<uint16_t>& missing, bool complete_list);

    // ACK or empty NACK
    void all_confirmed();

    bool is_confirmed(uint16_t seq) const;
    std::vector<uint16_t> unconfirmed() const;
    std::size_t unconfirmed_count() const;

    uint64_t packets_sent() const { return packets_sent_; }
    uint64_t retransmissions() const { return retransmissions_; }
    std::size_t last_nack_size() const { return last_nack_size_; }

    // Retransmitted DATA packets per original chunk
    double retransmit_ratio() const;

private:
    uint16_t total_chunks_ = 0;
    std::vector<bool> confirmed_;
    uint64_t packets_sent_ = 0;
    uint64_t retransmissions_ = 0;
    std::size_t last_nack_size_ = 0;
};

#endif // LORAXFER_LOSS_TRACKER_HPP
