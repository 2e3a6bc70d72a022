#include "receiver.hpp"
#include "slicer.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

using Clock = std::chrono::steady_clock;

constexpr std::size_t MISSING_LOG_LIMIT = 10;

const char* receiver_state_name(ReceiverState state) {
    switch (state) {
    case ReceiverState::Idle:            return "Idle";
    case ReceiverState::Collecting:      return "Collecting";
    case ReceiverState::Finalizing:      return "Finalizing";
    case ReceiverState::ReportingNack:   return "ReportingNack";
    case ReceiverState::AwaitingNackAck: return "AwaitingNackAck";
    case ReceiverState::Done:            return "Done";
    }
    return "?";
}

const char* receive_status_name(ReceiveStatus status) {
    switch (status) {
    case ReceiveStatus::Complete: return "complete";
    case ReceiveStatus::Partial:  return "partial";
    case ReceiveStatus::Failed:   return "failed";
    }
    return "?";
}

static void log_missing(const std::vector<uint16_t>& missing) {
    std::cout << "[receiver] missing " << missing.size() << ":";
    for (std::size_t i = 0; i < missing.size() && i < MISSING_LOG_LIMIT; ++i) {
        std::cout << " " << missing[i];
    }
    if (missing.size() > MISSING_LOG_LIMIT) std::cout << " ...";
    std::cout << std::endl;
}

FileReceiver::FileReceiver(Session& session, const ProtocolConfig& config, CompletionHook on_complete)
    : session_(session), config_(config), on_complete_(std::move(on_complete)) {
    validate_config(config_);
}

void FileReceiver::set_digest_check(Reassembler::DigestCheck check) {
    reassembler_.set_digest_check(std::move(check));
}

void FileReceiver::set_state(ReceiverState state) {
    if (state == state_) return;

    std::cout << "[receiver] state " << receiver_state_name(state_) << " -> "
              << receiver_state_name(state) << std::endl;
    state_ = state;
}

std::chrono::milliseconds FileReceiver::silence_timeout() const {
    if (state_ == ReceiverState::AwaitingNackAck) return config_.nack_ack_timeout;
    return config_.recv_timeout;
}

uint16_t FileReceiver::effective_total() const {
    if (total_known_) return total_chunks_;

    // END never arrived: everything up to the highest seq seen, capped at
    // the largest total END can announce
    uint32_t inferred = static_cast<uint32_t>(store_.highest_seq() + 1);
    return static_cast<uint16_t>(std::min<uint32_t>(inferred, MAX_TOTAL_CHUNKS));
}

void FileReceiver::start_transfer(uint16_t source, uint16_t file_id) {
    store_.reset(file_id);
    sender_ = source;
    total_chunks_ = 0;
    total_known_ = false;
    nack_retries_ = 0;
    nack_rounds_ = 0;
    nack_cursor_ = -1;
    last_nack_.clear();
    result_ = ReceiveResult();

    std::cout << "[receiver] new transfer file_id=0x" << std::hex << file_id
              << " from 0x" << source << std::dec << std::endl;
    set_state(ReceiverState::Collecting);
}

bool FileReceiver::replay_ack(uint16_t source, const ProtocolPacket& pkt) {
    if (!has_finished_ || pkt.file_id != finished_file_id_) return false;

    // The sender missed our ACK and is still repeating END
    if (pkt.kind == PacketKind::End && finished_acked_) {
        std::cout << "[receiver] repeated END for finished file_id=0x" << std::hex
                  << pkt.file_id << std::dec << ", re-sending ACK" << std::endl;
        session_.send(source, serialize_packet(make_ack_packet(pkt.file_id)));
    }
    return true;
}

bool FileReceiver::on_frame(const Frame& frame) {
    ProtocolPacket pkt;
    try {
        pkt = parse_packet(frame.payload);
    } catch (const MalformedPacket& e) {
        std::cerr << "[receiver] dropped: " << e.what() << std::endl;
        return false;
    }
    return on_packet(frame.source, pkt);
}

bool FileReceiver::on_packet(uint16_t source, const ProtocolPacket& pkt) {
    if (state_ == ReceiverState::Idle || state_ == ReceiverState::Done) {
        if (replay_ack(source, pkt)) return true;
        if (pkt.kind != PacketKind::Data && pkt.kind != PacketKind::End) return false;
        if (pkt.kind == PacketKind::Data && pkt.seq >= MAX_TOTAL_CHUNKS) return false;

        start_transfer(source, pkt.file_id);
    }

    if (pkt.file_id != store_.file_id() || source != sender_) {
        std::cerr << "[receiver] ignoring " << packet_kind_name(pkt.kind) << " for file_id=0x"
                  << std::hex << pkt.file_id << " from 0x" << source << std::dec
                  << " during transfer 0x" << std::hex << store_.file_id() << std::dec << std::endl;
        return false;
    }

    switch (pkt.kind) {
    case PacketKind::Data:
        handle_data(pkt);
        nack_retries_ = 0;
        set_state(ReceiverState::Collecting);
        return true;
    case PacketKind::End:
        total_chunks_ = pkt.total_chunks;
        total_known_ = true;
        finalize();
        return true;
    case PacketKind::Ack:
        if (state_ != ReceiverState::AwaitingNackAck) return false;
        // NACK delivered, retransmissions follow
        nack_retries_ = 0;
        set_state(ReceiverState::Collecting);
        return true;
    default:
        return false;
    }
}

void FileReceiver::handle_data(const ProtocolPacket& pkt) {
    uint32_t limit = total_known_ ? total_chunks_ : MAX_TOTAL_CHUNKS;
    if (pkt.seq >= limit) {
        std::cerr << "[receiver] dropping seq " << pkt.seq << " beyond total "
                  << limit << std::endl;
        return;
    }

    if (chunk_checksum(pkt.payload) != pkt.checksum) {
        std::cerr << "[receiver] checksum mismatch on seq " << pkt.seq << std::endl;
        store_.mark_corrupt(pkt.seq);
        return;
    }

    store_.put(pkt.seq, pkt.payload);
}

void FileReceiver::on_silence() {
    if (state_ == ReceiverState::Collecting) {
        std::cerr << "[receiver] silence, finalizing with " << store_.size() << "/"
                  << effective_total() << " chunks" << (total_known_ ? "" : " (END not seen)")
                  << std::endl;
        finalize();
        return;
    }

    if (state_ == ReceiverState::AwaitingNackAck) {
        if (nack_retries_ >= config_.max_nack_retries) {
            give_up();
            return;
        }
        nack_retries_++;
        std::cerr << "[receiver] no reply to NACK, resending (" << nack_retries_ << "/"
                  << config_.max_nack_retries << ")" << std::endl;
        session_.send(sender_, serialize_packet(make_nack_packet(store_.file_id(), last_nack_)));
    }
}

void FileReceiver::finalize() {
    set_state(ReceiverState::Finalizing);

    uint16_t total = effective_total();
    std::vector<uint16_t> missing = store_.missing(total);

    std::cout << "[receiver] file_id=0x" << std::hex << store_.file_id() << std::dec
              << ": received " << store_.size() << "/" << total << std::endl;

    if (!missing.empty()) {
        report_missing(missing);
        return;
    }

    send_ack();

    try {
        std::vector<uint8_t> data = reassembler_.assemble(store_, total);
        complete(ReceiveStatus::Complete, std::move(data), 0);
    } catch (const DigestMismatch& e) {
        std::cerr << "[receiver] " << e.what() << std::endl;
        complete(ReceiveStatus::Failed, reassembler_.assemble_partial(store_, total), 0);
    }
}

std::vector<uint16_t> FileReceiver::build_nack_list(const std::vector<uint16_t>& missing) {
    std::size_t cap = config_.max_nack_entries;
    if (missing.size() <= cap) {
        nack_cursor_ = -1;
        return missing;
    }

    // Start just after the last seq reported and wrap, so a truncated list
    // never leaves the tail of the missing set unreported
    auto start = std::upper_bound(missing.begin(), missing.end(), nack_cursor_,
                                  [](int32_t cursor, uint16_t seq) { return cursor < static_cast<int32_t>(seq); });
    std::size_t first = static_cast<std::size_t>(start - missing.begin()) % missing.size();

    std::vector<uint16_t> list;
    list.reserve(cap);
    for (std::size_t i = 0; i < cap; ++i) {
        list.push_back(missing[(first + i) % missing.size()]);
    }
    nack_cursor_ = list.back();
    return list;
}

void FileReceiver::report_missing(const std::vector<uint16_t>& missing) {
    set_state(ReceiverState::ReportingNack);
    log_missing(missing);

    last_nack_ = build_nack_list(missing);
    session_.send(sender_, serialize_packet(make_nack_packet(store_.file_id(), last_nack_)));
    nack_rounds_++;
    nack_retries_ = 0;

    std::cout << "[receiver] NACK " << nack_rounds_ << " sent with " << last_nack_.size()
              << " entries" << std::endl;
    set_state(ReceiverState::AwaitingNackAck);
}

void FileReceiver::send_ack() {
    session_.send(sender_, serialize_packet(make_ack_packet(store_.file_id())));
    finished_acked_ = true;
}

void FileReceiver::give_up() {
    uint16_t total = effective_total();
    std::size_t missing = store_.missing_count(total);

    std::cerr << "[receiver] giving up on file_id=0x" << std::hex << store_.file_id() << std::dec
              << " after " << config_.max_nack_retries << " unanswered retries" << std::endl;

    complete(ReceiveStatus::Partial, reassembler_.assemble_partial(store_, total), missing);
}

void FileReceiver::complete(ReceiveStatus status, std::vector<uint8_t> data, std::size_t missing) {
    if (status == ReceiveStatus::Partial) finished_acked_ = false;

    result_.status = status;
    result_.interrupted = false;
    result_.file_id = store_.file_id();
    result_.sender = sender_;
    result_.total_chunks = effective_total();
    result_.missing = missing;
    result_.nack_rounds = nack_rounds_;
    result_.data = std::move(data);

    has_finished_ = true;
    finished_file_id_ = store_.file_id();
    set_state(ReceiverState::Done);

    std::cout << "[receiver] transfer " << receive_status_name(status) << ": "
              << result_.data.size() << " bytes, " << nack_rounds_ << " NACK rounds" << std::endl;

    if (on_complete_) on_complete_(result_);
}

void FileReceiver::linger(const std::atomic<bool>* stop) {
    auto until = Clock::now() + config_.ack_linger;

    while (Clock::now() < until) {
        if (stop != nullptr && stop->load()) return;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        auto frame = session_.receive(std::max(std::chrono::milliseconds(0),
                                               std::min(remaining, config_.poll_interval)));
        if (!frame) continue;

        try {
            replay_ack(frame->source, parse_packet(frame->payload));
        } catch (const MalformedPacket& e) {
            std::cerr << "[receiver] dropped: " << e.what() << std::endl;
        }
    }
}

ReceiveResult FileReceiver::receive(const std::atomic<bool>* stop) {
    if (state_ == ReceiverState::Done) state_ = ReceiverState::Idle;

    auto last_activity = Clock::now();
    while (state_ != ReceiverState::Done) {
        if (stop != nullptr && stop->load()) {
            std::cerr << "[receiver] interrupted" << std::endl;

            bool active = state_ != ReceiverState::Idle;
            uint16_t total = effective_total();
            result_ = ReceiveResult();
            result_.interrupted = true;
            if (active) {
                result_.status = ReceiveStatus::Partial;
                result_.file_id = store_.file_id();
                result_.sender = sender_;
                result_.total_chunks = total;
                result_.missing = store_.missing_count(total);
                result_.nack_rounds = nack_rounds_;
                result_.data = reassembler_.assemble_partial(store_, total);
            }
            state_ = ReceiverState::Idle;
            return result_;
        }

        auto frame = session_.receive(config_.poll_interval);
        if (frame && on_frame(*frame)) {
            last_activity = Clock::now();
            continue;
        }

        bool waiting = state_ == ReceiverState::Collecting || state_ == ReceiverState::AwaitingNackAck;
        if (waiting && Clock::now() - last_activity >= silence_timeout()) {
            on_silence();
            last_activity = Clock::now();
        }
    }

    ReceiveResult finished = result_;
    if (finished_acked_) linger(stop);
    return finished;
}
