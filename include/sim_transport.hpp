#ifndef LORAXFER_SIM_TRANSPORT_HPP
#define LORAXFER_SIM_TRANSPORT_HPP

#include "transport.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

// In-memory shared medium. Sessions opened on one link exchange bodies by
// address; delivery faults are injected per frame.
class SimLink {
public:
    struct Transmission {
        uint16_t source;
        uint16_t destination;
        const std::vector<uint8_t>& body;
    };

    using FramePredicate = std::function<bool(const Transmission&)>;

    struct Faults {
        double drop_rate = 0.0;      // random loss, every frame
        double corrupt_rate = 0.0;   // random corruption of the last body byte
        uint32_t seed = 1;
        FramePredicate drop_if;      // scripted loss
        FramePredicate corrupt_if;   // scripted corruption
    };

    SimLink();
    explicit SimLink(Faults faults);

    // The link must outlive every session opened on it.
    // Throws TransportError if the address is already open.
    std::unique_ptr<Session> open(uint16_t address);

    void set_faults(Faults faults);

    std::size_t transmitted() const;
    std::size_t dropped() const;
    std::size_t corrupted() const;

private:
    friend class SimSession;

    void transmit(uint16_t source, uint16_t destination, const std::vector<uint8_t>& body);
    std::optional<Frame> take(uint16_t address, std::chrono::milliseconds timeout);
    void detach(uint16_t address);

    mutable std::mutex mutex_;
    std::condition_variable arrived_;
    std::unordered_map<uint16_t, std::deque<Frame>> inboxes_;
    Faults faults_;
    std::mt19937 rng_;
    std::size_t transmitted_ = 0;
    std::size_t dropped_ = 0;
    std::size_t corrupted_ = 0;
};

class SimSession : public Session {
public:
    SimSession(SimLink& link, uint16_t address);
    ~SimSession() override;

    void send(uint16_t destination, const std::vector<uint8_t>& payload) override;
    std::optional<Frame> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    uint16_t local_address() const override { return address_; }

private:
    SimLink& link_;
    uint16_t address_;
    bool open_ = true;
};

#endif // LORAXFER_SIM_TRANSPORT_HPP
