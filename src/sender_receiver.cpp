#include "sender_receiver.hpp"
#include "file_digest.hpp"
#include "image_prep.hpp"
#include "packet_parser.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

constexpr std::size_t MONITOR_DUMP_BYTES = 64;
constexpr std::chrono::milliseconds MONITOR_POLL{200};

std::unique_ptr<Session> open_link(const LinkOptions& link) {
    if (link.kind == LinkOptions::Kind::Udp) {
        return open_udp_session(link.udp);
    }
    return open_serial_session(link.serial);
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + path);

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

SendResult run_sender(const std::string& path, uint16_t destination, const LinkOptions& link,
                      const ProtocolConfig& protocol, const std::atomic<bool>& stop,
                      const std::string& optimize_preset) {
    validate_config(protocol);

    std::vector<uint8_t> data = optimize_preset.empty() ? read_file(path)
                                                        : optimize_image(path, optimize_preset);
    std::cout << "[sender] " << path << ": " << data.size() << " bytes, md5 " << md5_hex(data) << std::endl;

    std::unique_ptr<Session> session = open_link(link);
    FileSender sender(*session, destination, protocol);
    return sender.send(data, &stop);
}

static bool looks_like_jpeg(const std::vector<uint8_t>& data) {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

std::string output_path(const std::string& output, const ReceiveResult& result) {
    std::string path = output;

    std::error_code ec;
    if (fs::is_directory(output, ec)) {
        char name[32];
        std::snprintf(name, sizeof(name), "received_%04X.%s", result.file_id,
                      looks_like_jpeg(result.data) ? "jpg" : "bin");
        path = (fs::path(output) / name).string();
    }

    if (result.status == ReceiveStatus::Partial) path += ".partial";
    return path;
}

ReceiveResult run_receiver(const std::string& output, const LinkOptions& link,
                           const ProtocolConfig& protocol, const std::atomic<bool>& stop,
                           const std::string& expect_md5_hex) {
    validate_config(protocol);

    std::unique_ptr<Session> session = open_link(link);
    FileReceiver receiver(*session, protocol);
    if (!expect_md5_hex.empty()) {
        receiver.set_digest_check(expect_md5(expect_md5_hex));
    }

    std::cout << "[receiver] listening as 0x" << std::hex << session->local_address() << std::dec << std::endl;
    ReceiveResult result = receiver.receive(&stop);

    if (result.file_id == 0 || result.status == ReceiveStatus::Failed) {
        return result;
    }

    std::string path = output_path(output, result);
    save_buffer(path, result.data);
    std::cout << "[receiver] wrote " << path << " (" << result.data.size() << " bytes, md5 "
              << md5_hex(result.data) << ")" << std::endl;
    return result;
}

static void describe_packet(const ProtocolPacket& pkt) {
    std::cout << "  " << packet_kind_name(pkt.kind) << " file_id=0x" << std::hex << pkt.file_id << std::dec;

    switch (pkt.kind) {
    case PacketKind::Data:
        std::cout << " seq=" << pkt.seq << " len=" << pkt.payload.size()
                  << " checksum=" << static_cast<int>(pkt.checksum);
        break;
    case PacketKind::End:
        std::cout << " total=" << pkt.total_chunks;
        break;
    case PacketKind::Nack:
        std::cout << " missing=" << pkt.missing.size();
        break;
    default:
        break;
    }
    std::cout << std::endl;
}

void run_monitor(const LinkOptions& link, const std::atomic<bool>& stop) {
    LinkOptions promiscuous = link;
    promiscuous.serial.promiscuous = true;
    promiscuous.udp.promiscuous = true;

    std::unique_ptr<Session> session = open_link(promiscuous);
    std::cout << "[monitor] listening, Ctrl+C to stop" << std::endl;

    std::size_t count = 0;
    while (!stop.load()) {
        auto frame = session->receive(MONITOR_POLL);
        if (!frame) continue;

        count++;
        const std::vector<uint8_t>& body = frame->payload;
        std::cout << "[monitor] #" << count << " from 0x" << std::hex << frame->source << std::dec
                  << ", " << body.size() << " bytes" << std::endl;

        std::cout << " ";
        char byte_hex[4];
        for (std::size_t i = 0; i < body.size() && i < MONITOR_DUMP_BYTES; ++i) {
            std::snprintf(byte_hex, sizeof(byte_hex), " %02x", body[i]);
            std::cout << byte_hex;
        }
        if (body.size() > MONITOR_DUMP_BYTES) std::cout << " ...";
        std::cout << std::endl;

        try {
            describe_packet(parse_packet(body));
        } catch (const MalformedPacket& e) {
            std::cout << "  malformed: " << e.what() << std::endl;
        }
    }

    std::cout << "[monitor] " << count << " frames" << std::endl;
}
