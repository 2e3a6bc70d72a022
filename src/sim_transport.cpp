#include "sim_transport.hpp"
#include "config.hpp"

#include <string>
#include <utility>

SimLink::SimLink() : SimLink(Faults{}) {}

SimLink::SimLink(Faults faults) : faults_(std::move(faults)), rng_(faults_.seed) {}

std::unique_ptr<Session> SimLink::open(uint16_t address) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inboxes_.count(address) != 0) {
            throw TransportError("[sim] address " + std::to_string(address) + " already open");
        }
        inboxes_[address];
    }
    return std::make_unique<SimSession>(*this, address);
}

void SimLink::set_faults(Faults faults) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_ = std::move(faults);
    rng_.seed(faults_.seed);
}

std::size_t SimLink::transmitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transmitted_;
}

std::size_t SimLink::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t SimLink::corrupted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return corrupted_;
}

void SimLink::transmit(uint16_t source, uint16_t destination, const std::vector<uint8_t>& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    transmitted_++;

    Transmission tx{source, destination, body};
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    bool drop = (faults_.drop_if && faults_.drop_if(tx)) ||
                (faults_.drop_rate > 0.0 && dist(rng_) < faults_.drop_rate);
    if (drop) {
        dropped_++;
        return;
    }

    Frame frame;
    frame.source = source;
    frame.payload = body;

    bool corrupt = (faults_.corrupt_if && faults_.corrupt_if(tx)) ||
                   (faults_.corrupt_rate > 0.0 && dist(rng_) < faults_.corrupt_rate);
    if (corrupt && !frame.payload.empty()) {
        frame.payload.back() ^= 0x5A;
        corrupted_++;
    }

    for (auto& [address, inbox] : inboxes_) {
        if (address == source) continue;
        if (destination == BROADCAST_ADDRESS || destination == address) {
            inbox.push_back(frame);
        }
    }
    arrived_.notify_all();
}

std::optional<Frame> SimLink::take(uint16_t address, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto ready = [&]() {
        auto it = inboxes_.find(address);
        return it == inboxes_.end() || !it->second.empty();
    };

    if (!arrived_.wait_for(lock, timeout, ready)) {
        return std::nullopt;
    }

    auto it = inboxes_.find(address);
    if (it == inboxes_.end()) {
        throw TransportError("[sim] address " + std::to_string(address) + " detached");
    }

    Frame frame = std::move(it->second.front());
    it->second.pop_front();
    return frame;
}

void SimLink::detach(uint16_t address) {
    std::lock_guard<std::mutex> lock(mutex_);
    inboxes_.erase(address);
    arrived_.notify_all();
}

SimSession::SimSession(SimLink& link, uint16_t address) : link_(link), address_(address) {}

SimSession::~SimSession() {
    close();
}

void SimSession::send(uint16_t destination, const std::vector<uint8_t>& payload) {
    if (!open_) {
        throw TransportError("[sim] send on closed session " + std::to_string(address_));
    }
    link_.transmit(address_, destination, payload);
}

std::optional<Frame> SimSession::receive(std::chrono::milliseconds timeout) {
    if (!open_) {
        throw TransportError("[sim] receive on closed session " + std::to_string(address_));
    }
    return link_.take(address_, timeout);
}

void SimSession::close() {
    if (!open_) return;

    open_ = false;
    link_.detach(address_);
}
