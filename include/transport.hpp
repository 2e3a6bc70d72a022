#ifndef LORAXFER_TRANSPORT_HPP
#define LORAXFER_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// One inbound body, addressing already stripped
struct Frame {
    uint16_t source = 0;
    std::vector<uint8_t> payload;
};

// A link session owned by exactly one running transfer.
// Implementations add and strip the addressing framing around each body.
class Session {
public:
    virtual ~Session() = default;

    // Throws TransportError on I/O failure or when closed
    virtual void send(uint16_t destination, const std::vector<uint8_t>& payload) = 0;

    // Empty on timeout. Throws TransportError on I/O failure or when closed.
    virtual std::optional<Frame> receive(std::chrono::milliseconds timeout) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual uint16_t local_address() const = 0;
};

// Addressing framing shared by the serial and UDP sessions:
// [dest_hi dest_lo dest_offset src_hi src_lo src_offset] body...
std::vector<uint8_t> frame_with_address(uint16_t destination, uint16_t source, uint8_t offset,
                                        const std::vector<uint8_t>& body);

struct AddressedFrame {
    uint16_t destination = 0;
    uint16_t source = 0;
    Frame frame;
};

// Empty if raw is shorter than the framing
std::optional<AddressedFrame> strip_address(const uint8_t* raw, std::size_t len);

#endif // LORAXFER_TRANSPORT_HPP
