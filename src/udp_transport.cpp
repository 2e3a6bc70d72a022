#include "udp_transport.hpp"
#include "config.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr std::size_t MAX_DATAGRAM = 1500;

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

UdpSession::UdpSession(const UdpConfig& config) : config_(config) {
    peer_.sin_family = AF_INET;
    peer_.sin_port = htons(static_cast<uint16_t>(config_.peer_port));
    if (inet_pton(AF_INET, config_.peer_host.c_str(), &peer_.sin_addr) != 1) {
        throw TransportError("[udp] invalid peer address " + config_.peer_host);
    }

    sock_ = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sock_ < 0) {
        throw TransportError(errno_text("[udp] socket"));
    }

    int optval = 1;
    setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.local_port));
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = errno_text("[udp] bind " + std::to_string(config_.local_port));
        ::close(sock_);
        sock_ = -1;
        throw TransportError(err);
    }

    std::cout << "[udp] listening on " << config_.local_port << ", peer "
              << config_.peer_host << ":" << config_.peer_port
              << ", addr=" << config_.address << std::endl;
}

UdpSession::~UdpSession() {
    close();
}

void UdpSession::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
        std::cout << "[udp] socket closed" << std::endl;
    }
}

void UdpSession::send(uint16_t destination, const std::vector<uint8_t>& payload) {
    if (sock_ < 0) {
        throw TransportError("[udp] send on closed session");
    }

    // same limit as the radio, so the bench link rejects what the module would
    std::vector<uint8_t> raw = frame_with_address(destination, config_.address, 0, payload);
    if (raw.size() > LINK_BUFFER_SIZE) {
        throw TransportError("[udp] frame of " + std::to_string(raw.size()) +
                             " bytes exceeds the module buffer");
    }

    ssize_t sent;
    do {
        sent = sendto(sock_, raw.data(), raw.size(), 0,
                      reinterpret_cast<const sockaddr*>(&peer_), sizeof(peer_));
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        throw TransportError(errno_text("[udp] sendto"));
    }
}

std::optional<Frame> UdpSession::receive(std::chrono::milliseconds timeout) {
    if (sock_ < 0) {
        throw TransportError("[udp] receive on closed session");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    pollfd pfd{sock_, POLLIN, 0};

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) return std::nullopt;
            throw TransportError(errno_text("[udp] poll"));
        }
        if (ready == 0) return std::nullopt;

        uint8_t buf[MAX_DATAGRAM];
        ssize_t len = recv(sock_, buf, sizeof(buf), 0);
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TransportError(errno_text("[udp] recv"));
        }

        auto addressed = strip_address(buf, static_cast<std::size_t>(len));
        if (addressed && (config_.promiscuous || addressed->destination == config_.address ||
                          addressed->destination == BROADCAST_ADDRESS)) {
            return std::move(addressed->frame);
        }

        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    }
}

std::unique_ptr<Session> open_udp_session(const UdpConfig& config) {
    return std::make_unique<UdpSession>(config);
}
