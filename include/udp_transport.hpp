#pragma once

#include "transport.hpp"

#include <memory>
#include <netinet/in.h>
#include <string>

// Bench link: the same addressing framing carried in UDP datagrams,
// for running sender and receiver without radios
struct UdpConfig {
    int local_port = 45000;
    std::string peer_host = "127.0.0.1";
    int peer_port = 45001;
    uint16_t address = 0;
    bool promiscuous = false;
};

class UdpSession : public Session {
public:
    explicit UdpSession(const UdpConfig& config);
    ~UdpSession() override;

    UdpSession(const UdpSession&) = delete;
    UdpSession& operator=(const UdpSession&) = delete;

    void send(uint16_t destination, const std::vector<uint8_t>& payload) override;
    std::optional<Frame> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    uint16_t local_address() const override { return config_.address; }

private:
    UdpConfig config_;
    int sock_ = -1;
    sockaddr_in peer_{};
};

// Throws TransportError if the socket cannot be created or bound
std::unique_ptr<Session> open_udp_session(const UdpConfig& config);
