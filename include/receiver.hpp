#ifndef LORAXFER_RECEIVER_HPP
#define LORAXFER_RECEIVER_HPP

#include "chunk_store.hpp"
#include "config.hpp"
#include "packet_parser.hpp"
#include "reassembler.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

enum class ReceiverState {
    Idle,
    Collecting,
    Finalizing,
    ReportingNack,
    AwaitingNackAck,
    Done
};

enum class ReceiveStatus {
    Complete,
    Partial,   // gave up after max_nack_retries, data holds what arrived
    Failed     // complete chunk set rejected by the digest check, or interrupted
};

const char* receiver_state_name(ReceiverState state);
const char* receive_status_name(ReceiveStatus status);

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::Failed;
    bool interrupted = false;
    uint16_t file_id = 0;
    uint16_t sender = 0;
    uint16_t total_chunks = 0;
    std::size_t missing = 0;
    unsigned nack_rounds = 0;
    std::vector<uint8_t> data;
};

// Collects one transfer at a time and reports gaps with NACKs until the
// chunk set is complete.
class FileReceiver {
public:
    using CompletionHook = std::function<void(const ReceiveResult&)>;

    explicit FileReceiver(Session& session,
                          const ProtocolConfig& config = ProtocolConfig(),
                          CompletionHook on_complete = nullptr);

    // Blocks until one transfer is finalized (or stop is raised), then
    // lingers for ack_linger answering repeated ENDs.
    ReceiveResult receive(const std::atomic<bool>* stop = nullptr);

    void set_digest_check(Reassembler::DigestCheck check);

    // Returns true if the frame was traffic for the active (or just
    // completed) transfer; malformed frames are dropped.
    bool on_frame(const Frame& frame);
    bool on_packet(uint16_t source, const ProtocolPacket& pkt);

    // silence_timeout() elapsed with no traffic for the active transfer
    void on_silence();
    std::chrono::milliseconds silence_timeout() const;

    ReceiverState state() const { return state_; }
    bool finished() const { return state_ == ReceiverState::Done; }
    const ChunkStore& store() const { return store_; }
    uint16_t sender() const { return sender_; }
    bool total_known() const { return total_known_; }
    uint16_t total_chunks() const { return total_chunks_; }
    unsigned nack_rounds() const { return nack_rounds_; }
    const std::vector<uint16_t>& last_nack() const { return last_nack_; }
    const ReceiveResult& result() const { return result_; }

private:
    Session& session_;
    ProtocolConfig config_;
    CompletionHook on_complete_;
    Reassembler reassembler_;

    ReceiverState state_ = ReceiverState::Idle;
    ChunkStore store_;
    uint16_t sender_ = 0;
    uint16_t total_chunks_ = 0;
    bool total_known_ = false;

    unsigned nack_retries_ = 0;     // silences since the last NACK or DATA
    unsigned nack_rounds_ = 0;      // distinct NACKs sent for this transfer
    int32_t nack_cursor_ = -1;      // last seq reported, rotation point
    std::vector<uint16_t> last_nack_;

    // last finalized transfer, for answering a repeated END
    bool has_finished_ = false;
    uint16_t finished_file_id_ = 0;
    bool finished_acked_ = false;

    ReceiveResult result_;

    void set_state(ReceiverState state);
    void start_transfer(uint16_t source, uint16_t file_id);
    bool replay_ack(uint16_t source, const ProtocolPacket& pkt);
    void handle_data(const ProtocolPacket& pkt);
    uint16_t effective_total() const;

    void finalize();
    std::vector<uint16_t> build_nack_list(const std::vector<uint16_t>& missing);
    void report_missing(const std::vector<uint16_t>& missing);
    void send_ack();
    void give_up();
    void complete(ReceiveStatus status, std::vector<uint8_t> data, std::size_t missing);
    void linger(const std::atomic<bool>* stop);
};

#endif // LORAXFER_RECEIVER_HPP
