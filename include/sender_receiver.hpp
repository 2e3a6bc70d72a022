#pragma once

#include "config.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "serial_transport.hpp"
#include "transport.hpp"
#include "udp_transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct LinkOptions {
    enum class Kind { Serial, Udp };

    Kind kind = Kind::Serial;
    SerialConfig serial;
    UdpConfig udp;
};

std::unique_ptr<Session> open_link(const LinkOptions& link);

// Reads (or, with a preset, optimizes) the file and runs one transfer to `destination`
SendResult run_sender(const std::string& path, uint16_t destination, const LinkOptions& link,
                      const ProtocolConfig& protocol, const std::atomic<bool>& stop,
                      const std::string& optimize_preset = "");

// Waits for one transfer and writes it under `output`. expect_md5_hex may be empty.
ReceiveResult run_receiver(const std::string& output, const LinkOptions& link,
                           const ProtocolConfig& protocol, const std::atomic<bool>& stop,
                           const std::string& expect_md5_hex = "");

// Dumps every frame on the channel until stop is raised
void run_monitor(const LinkOptions& link, const std::atomic<bool>& stop);

// Where run_receiver stores `result`: received_<FILEID>.<jpg|bin> inside a
// directory, `output` itself otherwise; partial results get ".partial"
std::string output_path(const std::string& output, const ReceiveResult& result);

std::vector<uint8_t> read_file(const std::string& path);
