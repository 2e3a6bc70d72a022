#ifndef LORAXFER_SERIAL_TRANSPORT_HPP
#define LORAXFER_SERIAL_TRANSPORT_HPP

#include "transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <termios.h>

struct SerialConfig {
    std::string device = "/dev/ttyS0";
    int baud = 9600;
    int freq_mhz = 433;
    uint16_t address = 0;
    int m0_pin = 22;          // BCM numbering, -1 leaves the mode lines alone
    int m1_pin = 27;
    std::chrono::milliseconds frame_gap{50};   // UART silence that ends one frame
    bool promiscuous = false;                  // accept frames for any destination
};

// Channel offset byte carried in the addressing framing
uint8_t channel_offset(int freq_mhz);

// Drives M0/M1 low (normal transmission mode) through sysfs for its lifetime
class ModePins {
public:
    ModePins(int m0_pin, int m1_pin);
    ~ModePins();

    ModePins(const ModePins&) = delete;
    ModePins& operator=(const ModePins&) = delete;

    void release();

private:
    int m0_pin_;
    int m1_pin_;
    bool exported_m0_ = false;
    bool exported_m1_ = false;
};

// UART-attached LoRa module in fixed-address transmission mode
class SerialSession : public Session {
public:
    explicit SerialSession(const SerialConfig& config);
    ~SerialSession() override;

    SerialSession(const SerialSession&) = delete;
    SerialSession& operator=(const SerialSession&) = delete;

    void send(uint16_t destination, const std::vector<uint8_t>& payload) override;
    std::optional<Frame> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    uint16_t local_address() const override { return config_.address; }

private:
    SerialConfig config_;
    uint8_t offset_;
    int fd_ = -1;
    termios saved_tty_{};
    bool restore_tty_ = false;
    std::unique_ptr<ModePins> mode_pins_;

    std::vector<uint8_t> read_frame(std::chrono::milliseconds timeout);
};

// Throws TransportError if the port cannot be opened or configured
std::unique_ptr<Session> open_serial_session(const SerialConfig& config);

#endif // LORAXFER_SERIAL_TRANSPORT_HPP
