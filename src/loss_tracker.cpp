#include "loss_tracker.hpp"
#include <algorithm>

void LossTracker::reset(uint16_t total_chunks) {
    total_chunks_ = total_chunks;
    confirmed_.assign(total_chunks, false);
    packets_sent_ = 0;
    retransmissions_ = 0;
    last_nack_size_ = 0;
}

void LossTracker::chunk_sent() {
    packets_sent_++;
}

void LossTracker::chunk_resent() {
    packets_sent_++;
    retransmissions_++;
}

void LossTracker::nack_received(const std::vector<uint16_t>& missing, bool complete_list) {
    last_nack_size_ = missing.size();

    if (!complete_list) return;

    std::vector<bool> listed(total_chunks_, false);
    for (uint16_t seq : missing) {
        if (seq < total_chunks_) listed[seq] = true;
    }

    for (std::size_t seq = 0; seq < total_chunks_; ++seq) {
        if (!listed[seq]) confirmed_[seq] = true;
    }
}

void LossTracker::all_confirmed() {
    std::fill(confirmed_.begin(), confirmed_.end(), true);
    last_nack_size_ = 0;
}

bool LossTracker::is_confirmed(uint16_t seq) const {
    return seq < total_chunks_ && confirmed_[seq];
}

std::vector<uint16_t> LossTracker::unconfirmed() const {
    std::vector<uint16_t> result;

    for (std::size_t seq = 0; seq < total_chunks_; ++seq) {
        if (!confirmed_[seq]) result.push_back(static_cast<uint16_t>(seq));
    }

    return result;
}

std::size_t LossTracker::unconfirmed_count() const {
    return static_cast<std::size_t>(std::count(confirmed_.begin(), confirmed_.end(), false));
}

double LossTracker::retransmit_ratio() const {
    if (total_chunks_ == 0) return 0.0;

    return static_cast<double>(retransmissions_) / total_chunks_;
}
