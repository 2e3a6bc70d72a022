#ifndef LORAXFER_SENDER_HPP
#define LORAXFER_SENDER_HPP

#include "config.hpp"
#include "loss_tracker.hpp"
#include "packet_parser.hpp"
#include "slicer.hpp"
#include "transport.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

enum class SenderState {
    Init,
    BulkSend,       // every DATA in seq order, then END
    AwaitFeedback,  // END sent, waiting for NACK/ACK
    Retransmit,     // resending the chunks a NACK (or a lost round) asked for
    Done,
    Failed
};

const char* sender_state_name(SenderState state);

struct SendResult {
    bool success = false;
    bool interrupted = false;
    uint16_t file_id = 0;
    uint16_t total_chunks = 0;
    unsigned rounds = 0;
    std::size_t residual_missing = 0;
    uint64_t packets_sent = 0;
    uint64_t retransmissions = 0;
};

// Bulk-send then selective-retry side of one transfer.
// send() drives the whole exchange; begin()/transmit_all()/on_packet()/
// on_timeout() expose the individual transitions.
class FileSender {
public:
    FileSender(Session& session, uint16_t destination, const ProtocolConfig& config = ProtocolConfig());

    // Blocks until Done or Failed. TransportError is rethrown after the
    // transfer has moved to Failed.
    SendResult send(const std::vector<uint8_t>& file_data, const std::atomic<bool>* stop = nullptr);

    // Init: slice the buffer under the given file_id
    void begin(const std::vector<uint8_t>& file_data, uint16_t file_id);

    // BulkSend -> AwaitFeedback
    void transmit_all();

    // Returns true if the frame was feedback for this transfer
    bool on_frame(const Frame& frame);
    bool on_packet(uint16_t source, const ProtocolPacket& pkt);

    // nack_timeout elapsed without feedback
    void on_timeout();

    SenderState state() const { return state_; }
    bool finished() const { return state_ == SenderState::Done || state_ == SenderState::Failed; }
    unsigned rounds() const { return rounds_; }
    uint16_t file_id() const { return file_id_; }
    uint16_t total_chunks() const { return static_cast<uint16_t>(chunks_.size()); }
    const LossTracker& tracker() const { return tracker_; }
    SendResult result() const;

    static uint16_t random_file_id();

private:
    Session& session_;
    uint16_t destination_;
    ProtocolConfig config_;

    SenderState state_ = SenderState::Init;
    std::vector<Chunk> chunks_;
    uint16_t file_id_ = 0;
    unsigned rounds_ = 0;
    bool end_resent_ = false;
    bool interrupted_ = false;
    const std::atomic<bool>* stop_ = nullptr;
    LossTracker tracker_;

    bool stop_requested() const { return stop_ != nullptr && stop_->load(); }
    void set_state(SenderState state);
    void send_chunk(uint16_t seq, bool retransmit);
    void send_end();
    void retransmit(const std::vector<uint16_t>& seqs);
};

#endif // LORAXFER_SENDER_HPP
