#include "sender.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>

using Clock = std::chrono::steady_clock;

const char* sender_state_name(SenderState state) {
    switch (state) {
    case SenderState::Init:          return "Init";
    case SenderState::BulkSend:      return "BulkSend";
    case SenderState::AwaitFeedback: return "AwaitFeedback";
    case SenderState::Retransmit:    return "Retransmit";
    case SenderState::Done:          return "Done";
    case SenderState::Failed:        return "Failed";
    }
    return "?";
}

FileSender::FileSender(Session& session, uint16_t destination, const ProtocolConfig& config)
    : session_(session), destination_(destination), config_(config) {
    validate_config(config_);
}

uint16_t FileSender::random_file_id() {
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(FILE_ID_MIN, FILE_ID_MAX);
    return static_cast<uint16_t>(dist(rng));
}

void FileSender::set_state(SenderState state) {
    if (state == state_) return;

    std::cout << "[sender] state " << sender_state_name(state_) << " -> "
              << sender_state_name(state) << std::endl;
    state_ = state;
}

void FileSender::begin(const std::vector<uint8_t>& file_data, uint16_t file_id) {
    chunks_ = slice_file(file_data, file_id, config_.chunk_size);
    file_id_ = file_id;
    rounds_ = 0;
    end_resent_ = false;
    interrupted_ = false;
    tracker_.reset(total_chunks());
    state_ = SenderState::Init;

    std::cout << "[sender] file_id=0x" << std::hex << file_id_ << std::dec << ": "
              << file_data.size() << " bytes -> " << chunks_.size() << " chunks of "
              << config_.chunk_size << " bytes" << std::endl;
}

void FileSender::send_chunk(uint16_t seq, bool retransmit) {
    const Chunk& chunk = chunks_[seq];
    session_.send(destination_, serialize_packet(
        make_data_packet(file_id_, chunk.seq, chunk.checksum, chunk.payload)));

    if (retransmit) {
        tracker_.chunk_resent();
    } else {
        tracker_.chunk_sent();
    }

    // pacing only, keeps the receiver's module buffer from overrunning
    if (config_.inter_chunk_delay.count() > 0) {
        std::this_thread::sleep_for(config_.inter_chunk_delay);
    }
}

void FileSender::send_end() {
    session_.send(destination_, serialize_packet(make_end_packet(file_id_, total_chunks())));
}

void FileSender::transmit_all() {
    set_state(SenderState::BulkSend);

    for (std::size_t seq = 0; seq < chunks_.size(); ++seq) {
        if (stop_requested()) return;
        send_chunk(static_cast<uint16_t>(seq), false);
    }
    send_end();

    std::cout << "[sender] bulk send complete: " << chunks_.size() << " chunks + END" << std::endl;
    set_state(SenderState::AwaitFeedback);
}

void FileSender::retransmit(const std::vector<uint16_t>& seqs) {
    set_state(SenderState::Retransmit);

    std::vector<bool> queued(chunks_.size(), false);
    std::size_t sent = 0;
    for (uint16_t seq : seqs) {
        if (stop_requested()) return;
        if (seq >= chunks_.size() || queued[seq]) continue;
        queued[seq] = true;
        send_chunk(seq, true);
        sent++;
    }
    send_end();
    end_resent_ = false;

    std::cout << "[sender] round " << rounds_ << ": retransmitted " << sent << " chunks" << std::endl;
    set_state(SenderState::AwaitFeedback);
}

bool FileSender::on_frame(const Frame& frame) {
    ProtocolPacket pkt;
    try {
        pkt = parse_packet(frame.payload);
    } catch (const MalformedPacket& e) {
        std::cerr << "[sender] dropped: " << e.what() << std::endl;
        return false;
    }
    return on_packet(frame.source, pkt);
}

bool FileSender::on_packet(uint16_t source, const ProtocolPacket& pkt) {
    if (state_ != SenderState::AwaitFeedback) return false;
    if (destination_ != BROADCAST_ADDRESS && source != destination_) return false;

    if (pkt.file_id != file_id_) {
        std::cerr << "[sender] ignoring " << packet_kind_name(pkt.kind) << " for file_id=0x"
                  << std::hex << pkt.file_id << std::dec << std::endl;
        return false;
    }

    switch (pkt.kind) {
    case PacketKind::Ack:
        tracker_.all_confirmed();
        set_state(SenderState::Done);
        return true;
    case PacketKind::Nack: {
        if (pkt.missing.empty()) {
            tracker_.all_confirmed();
            set_state(SenderState::Done);
            return true;
        }

        tracker_.nack_received(pkt.missing, pkt.missing.size() < config_.max_nack_entries);
        std::cout << "[sender] NACK: " << pkt.missing.size() << " missing chunks" << std::endl;

        if (rounds_ >= config_.max_retry_rounds) {
            std::cerr << "[sender] retry budget of " << config_.max_retry_rounds
                      << " rounds exhausted" << std::endl;
            set_state(SenderState::Failed);
            return true;
        }

        // tell the receiver its NACK arrived before the retransmission starts
        session_.send(destination_, serialize_packet(make_ack_packet(file_id_)));
        rounds_++;
        retransmit(pkt.missing);
        return true;
    }
    default:
        return false;
    }
}

void FileSender::on_timeout() {
    if (state_ != SenderState::AwaitFeedback) return;

    if (!end_resent_) {
        std::cerr << "[sender] no feedback, resending END" << std::endl;
        send_end();
        end_resent_ = true;
        return;
    }

    if (rounds_ >= config_.max_retry_rounds) {
        std::cerr << "[sender] receiver silent, retry budget of " << config_.max_retry_rounds
                  << " rounds exhausted" << std::endl;
        set_state(SenderState::Failed);
        return;
    }

    std::vector<uint16_t> pending = tracker_.unconfirmed();
    std::cerr << "[sender] receiver silent, treating round as lost (" << pending.size()
              << " unconfirmed chunks)" << std::endl;
    rounds_++;
    retransmit(pending);
}

SendResult FileSender::result() const {
    SendResult r;
    r.success = state_ == SenderState::Done;
    r.interrupted = interrupted_;
    r.file_id = file_id_;
    r.total_chunks = total_chunks();
    r.rounds = rounds_;
    r.residual_missing = r.success ? 0 : tracker_.unconfirmed_count();
    r.packets_sent = tracker_.packets_sent();
    r.retransmissions = tracker_.retransmissions();
    return r;
}

SendResult FileSender::send(const std::vector<uint8_t>& file_data, const std::atomic<bool>* stop) {
    begin(file_data, random_file_id());
    stop_ = stop;

    try {
        transmit_all();

        auto deadline = Clock::now() + config_.nack_timeout;
        while (!finished()) {
            if (stop_requested()) {
                std::cerr << "[sender] interrupted" << std::endl;
                interrupted_ = true;
                set_state(SenderState::Failed);
                break;
            }

            auto now = Clock::now();
            if (now >= deadline) {
                on_timeout();
                deadline = Clock::now() + config_.nack_timeout;
                continue;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            auto frame = session_.receive(std::min(remaining, config_.poll_interval));
            if (frame && on_frame(*frame)) {
                deadline = Clock::now() + config_.nack_timeout;
            }
        }
    } catch (const TransportError& e) {
        std::cerr << "[sender] transport failure: " << e.what() << std::endl;
        set_state(SenderState::Failed);
        stop_ = nullptr;
        throw;
    }
    stop_ = nullptr;

    SendResult r = result();
    if (r.success) {
        std::cout << "[sender] transfer complete: " << r.total_chunks << " chunks, "
                  << r.rounds << " retry rounds, retransmit ratio "
                  << tracker_.retransmit_ratio() << std::endl;
    } else {
        std::cerr << "[sender] transfer failed after " << r.rounds << " rounds, "
                  << r.residual_missing << " chunks unconfirmed" << std::endl;
    }
    return r;
}
