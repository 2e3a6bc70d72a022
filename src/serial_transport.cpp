#include "serial_transport.hpp"
#include "config.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr std::size_t MAX_RAW_FRAME = 512;

speed_t to_speed(int baud) {
    switch (baud) {
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    default:
        throw TransportError("[serial] unsupported baud rate " + std::to_string(baud));
    }
}

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool write_sysfs(const std::string& path, const std::string& value) {
    std::ofstream out(path);
    if (!out) return false;
    out << value;
    return static_cast<bool>(out.flush());
}

std::string gpio_dir(int pin) {
    return "/sys/class/gpio/gpio" + std::to_string(pin);
}

// Returns true if this call exported the pin
bool drive_low(int pin) {
    bool exported = false;
    if (access(gpio_dir(pin).c_str(), F_OK) != 0) {
        if (!write_sysfs("/sys/class/gpio/export", std::to_string(pin))) {
            throw TransportError("[serial] cannot export GPIO " + std::to_string(pin));
        }
        exported = true;
        // udev needs a moment to fix permissions on the new node
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!write_sysfs(gpio_dir(pin) + "/direction", "out") ||
        !write_sysfs(gpio_dir(pin) + "/value", "0")) {
        if (exported) write_sysfs("/sys/class/gpio/unexport", std::to_string(pin));
        throw TransportError("[serial] cannot drive GPIO " + std::to_string(pin) + " low");
    }
    return exported;
}

} // namespace

uint8_t channel_offset(int freq_mhz) {
    int base = freq_mhz > 850 ? 850 : 410;
    int offset = freq_mhz - base;
    if (offset < 0 || offset > 0xFF) {
        throw std::invalid_argument("frequency " + std::to_string(freq_mhz) + " MHz out of range");
    }
    return static_cast<uint8_t>(offset);
}

// ---------------------- ModePins ----------------------

ModePins::ModePins(int m0_pin, int m1_pin) : m0_pin_(m0_pin), m1_pin_(m1_pin) {
    if (m0_pin_ >= 0) exported_m0_ = drive_low(m0_pin_);
    try {
        if (m1_pin_ >= 0) exported_m1_ = drive_low(m1_pin_);
    } catch (...) {
        release();
        throw;
    }
    // module needs time to settle after a mode change
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

ModePins::~ModePins() {
    release();
}

void ModePins::release() {
    if (exported_m0_) {
        write_sysfs("/sys/class/gpio/unexport", std::to_string(m0_pin_));
        exported_m0_ = false;
    }
    if (exported_m1_) {
        write_sysfs("/sys/class/gpio/unexport", std::to_string(m1_pin_));
        exported_m1_ = false;
    }
}

// ---------------------- SerialSession ----------------------

SerialSession::SerialSession(const SerialConfig& config)
    : config_(config), offset_(channel_offset(config.freq_mhz)) {
    speed_t speed = to_speed(config_.baud);

    if (config_.m0_pin >= 0 || config_.m1_pin >= 0) {
        mode_pins_ = std::make_unique<ModePins>(config_.m0_pin, config_.m1_pin);
    }

    fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd_ < 0) {
        throw TransportError(errno_text("[serial] open " + config_.device));
    }

    if (tcgetattr(fd_, &saved_tty_) != 0) {
        std::string err = errno_text("[serial] tcgetattr " + config_.device);
        ::close(fd_);
        fd_ = -1;
        throw TransportError(err);
    }

    termios tty = saved_tty_;
    cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        std::string err = errno_text("[serial] tcsetattr " + config_.device);
        ::close(fd_);
        fd_ = -1;
        throw TransportError(err);
    }
    restore_tty_ = true;
    tcflush(fd_, TCIOFLUSH);

    std::cout << "[serial] " << config_.device << " @" << config_.baud << " baud, "
              << config_.freq_mhz << " MHz, addr=" << config_.address << std::endl;
}

SerialSession::~SerialSession() {
    close();
}

void SerialSession::close() {
    if (fd_ >= 0) {
        tcdrain(fd_);
        if (restore_tty_) tcsetattr(fd_, TCSANOW, &saved_tty_);
        ::close(fd_);
        fd_ = -1;
        std::cout << "[serial] " << config_.device << " closed" << std::endl;
    }
    mode_pins_.reset();
}

void SerialSession::send(uint16_t destination, const std::vector<uint8_t>& payload) {
    if (fd_ < 0) {
        throw TransportError("[serial] send on closed session");
    }

    std::vector<uint8_t> raw = frame_with_address(destination, config_.address, offset_, payload);
    if (raw.size() > LINK_BUFFER_SIZE) {
        throw TransportError("[serial] frame of " + std::to_string(raw.size()) +
                             " bytes exceeds the module buffer");
    }

    std::size_t written = 0;
    while (written < raw.size()) {
        ssize_t n = ::write(fd_, raw.data() + written, raw.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("[serial] write"));
        }
        written += static_cast<std::size_t>(n);
    }

    if (tcdrain(fd_) != 0 && errno != EINTR) {
        throw TransportError(errno_text("[serial] tcdrain"));
    }
}

std::vector<uint8_t> SerialSession::read_frame(std::chrono::milliseconds timeout) {
    std::vector<uint8_t> raw;
    pollfd pfd{fd_, POLLIN, 0};

    int wait_ms = static_cast<int>(timeout.count());
    while (raw.size() < MAX_RAW_FRAME) {
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) return raw;
            throw TransportError(errno_text("[serial] poll"));
        }
        if (ready == 0) break;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw TransportError("[serial] device error on " + config_.device);
        }

        uint8_t buf[256];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TransportError(errno_text("[serial] read"));
        }
        raw.insert(raw.end(), buf, buf + n);

        // after the first byte, a frame ends at the first gap on the UART
        wait_ms = static_cast<int>(config_.frame_gap.count());
    }

    return raw;
}

std::optional<Frame> SerialSession::receive(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        throw TransportError("[serial] receive on closed session");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        std::vector<uint8_t> raw = read_frame(remaining);
        if (raw.empty()) return std::nullopt;

        auto addressed = strip_address(raw.data(), raw.size());
        if (!addressed) {
            std::cerr << "[serial] dropping " << raw.size() << " byte runt frame" << std::endl;
        } else if (config_.promiscuous || addressed->destination == config_.address ||
                   addressed->destination == BROADCAST_ADDRESS) {
            return std::move(addressed->frame);
        }

        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    }
}

std::unique_ptr<Session> open_serial_session(const SerialConfig& config) {
    try {
        return std::make_unique<SerialSession>(config);
    } catch (const std::invalid_argument& e) {
        throw TransportError(std::string("[serial] ") + e.what());
    }
}
