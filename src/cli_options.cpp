#include "cli_options.hpp"
#include "packet_parser.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

constexpr long long INT_LIMIT = std::numeric_limits<int>::max();

uint16_t parse_address(const std::string& text) {
    unsigned long value;
    std::size_t used = 0;
    try {
        value = std::stoul(text, &used, 0);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad address '" + text + "'");
    }
    if (used != text.size() || text[0] == '-') throw std::invalid_argument("bad address '" + text + "'");
    if (value > 0xFFFF) throw std::invalid_argument("address out of range: " + text);
    return static_cast<uint16_t>(value);
}

long long parse_number(const std::string& flag, const std::string& text, long long min, long long max) {
    long long value;
    std::size_t used = 0;
    try {
        value = std::stoll(text, &used, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw std::invalid_argument(flag + " must be in " + std::to_string(min) + ".." +
                                    std::to_string(max) + " (got " + text + ")");
    }
    return value;
}

static std::chrono::milliseconds parse_millis(const std::string& flag, const std::string& text) {
    return std::chrono::milliseconds(parse_number(flag, text, 0, INT_LIMIT));
}

UdpConfig parse_udp(const std::string& endpoints) {
    std::size_t first = endpoints.find(':');
    std::size_t last = endpoints.rfind(':');
    if (first == std::string::npos || first == last) {
        throw std::invalid_argument("--udp expects <local_port>:<peer_host>:<peer_port>");
    }

    UdpConfig udp;
    udp.local_port = static_cast<int>(parse_number("--udp", endpoints.substr(0, first), 1, 65535));
    udp.peer_host = endpoints.substr(first + 1, last - first - 1);
    udp.peer_port = static_cast<int>(parse_number("--udp", endpoints.substr(last + 1), 1, 65535));
    if (udp.peer_host.empty()) throw std::invalid_argument("--udp needs a peer host");
    return udp;
}

CliOptions parse_options(const std::vector<std::string>& args) {
    CliOptions opts;
    bool linger_given = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + flag);
        const std::string& value = args[++i];
        ProtocolConfig& p = opts.protocol;

        if (flag == "--port") opts.link.serial.device = value;
        else if (flag == "--baud") opts.link.serial.baud = static_cast<int>(parse_number(flag, value, 1, INT_LIMIT));
        else if (flag == "--freq") opts.link.serial.freq_mhz = static_cast<int>(parse_number(flag, value, 1, INT_LIMIT));
        else if (flag == "--m0") opts.link.serial.m0_pin = static_cast<int>(parse_number(flag, value, -1, INT_LIMIT));
        else if (flag == "--m1") opts.link.serial.m1_pin = static_cast<int>(parse_number(flag, value, -1, INT_LIMIT));
        else if (flag == "--udp") {
            opts.link.kind = LinkOptions::Kind::Udp;
            opts.link.udp = parse_udp(value);
        }
        else if (flag == "--addr") opts.own_address = parse_address(value);
        else if (flag == "--chunk") p.chunk_size = static_cast<uint16_t>(parse_number(flag, value, 1, MAX_CHUNK_SIZE));
        else if (flag == "--delay-ms") p.inter_chunk_delay = parse_millis(flag, value);
        else if (flag == "--nack-timeout-ms") p.nack_timeout = parse_millis(flag, value);
        else if (flag == "--rounds") p.max_retry_rounds = static_cast<unsigned>(parse_number(flag, value, 0, INT_LIMIT));
        else if (flag == "--recv-timeout-ms") p.recv_timeout = parse_millis(flag, value);
        else if (flag == "--nack-retries") p.max_nack_retries = static_cast<unsigned>(parse_number(flag, value, 0, INT_LIMIT));
        else if (flag == "--linger-ms") {
            p.ack_linger = parse_millis(flag, value);
            linger_given = true;
        }
        else if (flag == "--optimize") opts.optimize_preset = value;
        else if (flag == "--expect-md5") opts.expect_md5 = value;
        else throw std::invalid_argument("unknown option " + flag);
    }

    if (!linger_given && opts.protocol.ack_linger <= opts.protocol.nack_timeout) {
        ProtocolConfig defaults;
        opts.protocol.ack_linger = opts.protocol.nack_timeout + (defaults.ack_linger - defaults.nack_timeout);
    }

    validate_config(opts.protocol);
    return opts;
}

void set_own_address(CliOptions& opts, uint16_t address) {
    opts.link.serial.address = address;
    opts.link.udp.address = address;
}
