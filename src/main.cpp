#include "cli_options.hpp"
#include "config.hpp"
#include "image_prep.hpp"
#include "sender_receiver.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_TRANSFER_FAILED = 2,
    EXIT_PARTIAL = 3,
    EXIT_RUNTIME = 4
};

static std::atomic<bool> stop_requested{false};

static void signal_handler(int) {
    stop_requested = true;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " send <file> <dest_addr> [options]\n"
              << "  " << prog << " recv <my_addr> <output_file_or_dir> [options]\n"
              << "  " << prog << " monitor <my_addr> [options]\n"
              << "  " << prog << " optimize <input> <output> [thumbnail|small|medium|large]\n"
              << "\nLink options:\n"
              << "  --port <dev>            serial device (default /dev/ttyS0)\n"
              << "  --baud <n>              UART baud rate (default 9600)\n"
              << "  --freq <mhz>            radio frequency (default 433)\n"
              << "  --m0 <pin> --m1 <pin>   mode pins, -1 to leave alone (default 22, 27)\n"
              << "  --udp <local:host:peer> use a UDP bench link instead of the radio\n"
              << "  --addr <n>              own address when sending (default 0)\n"
              << "\nProtocol options:\n"
              << "  --chunk <bytes>         chunk size, 1..228 (default 200)\n"
              << "  --delay-ms <n>          pacing between chunks (default 50)\n"
              << "  --nack-timeout-ms <n>   sender wait for NACK/ACK (default 10000)\n"
              << "  --rounds <n>            retry rounds (default 3)\n"
              << "  --recv-timeout-ms <n>   receiver silence timeout (default 5000)\n"
              << "  --nack-retries <n>      NACK resends before giving up (default 3)\n"
              << "  --linger-ms <n>         recv: re-ACK window after completion (default 15000,\n"
              << "                          always longer than the NACK timeout)\n"
              << "  --optimize <preset>     send: re-encode the image first\n"
              << "  --expect-md5 <hex>      recv: reject a reassembled file with another MD5\n"
              << "Example: " << prog << " send photo.jpg 1 --freq 868 --optimize small" << std::endl;
}

static int cmd_send(const std::vector<std::string>& args) {
    if (args.size() < 2) throw std::invalid_argument("send needs <file> <dest_addr>");

    uint16_t destination = parse_address(args[1]);
    CliOptions opts = parse_options(std::vector<std::string>(args.begin() + 2, args.end()));
    set_own_address(opts, opts.own_address);

    SendResult result = run_sender(args[0], destination, opts.link, opts.protocol,
                                   stop_requested, opts.optimize_preset);

    std::cout << "[main] file_id=0x" << std::hex << result.file_id << std::dec << " "
              << result.total_chunks << " chunks, " << result.rounds << " rounds, "
              << result.residual_missing << " unconfirmed" << std::endl;
    return result.success ? EXIT_OK : EXIT_TRANSFER_FAILED;
}

static int cmd_recv(const std::vector<std::string>& args) {
    if (args.size() < 2) throw std::invalid_argument("recv needs <my_addr> <output>");

    CliOptions opts = parse_options(std::vector<std::string>(args.begin() + 2, args.end()));
    set_own_address(opts, parse_address(args[0]));

    ReceiveResult result = run_receiver(args[1], opts.link, opts.protocol, stop_requested, opts.expect_md5);

    if (result.interrupted) return EXIT_TRANSFER_FAILED;
    switch (result.status) {
    case ReceiveStatus::Complete: return EXIT_OK;
    case ReceiveStatus::Partial:  return EXIT_PARTIAL;
    default:                      return EXIT_TRANSFER_FAILED;
    }
}

static int cmd_monitor(const std::vector<std::string>& args) {
    if (args.empty()) throw std::invalid_argument("monitor needs <my_addr>");

    CliOptions opts = parse_options(std::vector<std::string>(args.begin() + 1, args.end()));
    set_own_address(opts, parse_address(args[0]));

    run_monitor(opts.link, stop_requested);
    return EXIT_OK;
}

static int cmd_optimize(const std::vector<std::string>& args) {
    if (args.size() < 2) throw std::invalid_argument("optimize needs <input> <output>");

    std::string preset = args.size() > 2 ? args[2] : "small";
    save_buffer(args[1], optimize_image(args[0], preset));
    std::cout << "[main] wrote " << args[1] << std::endl;
    return EXIT_OK;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "send") return cmd_send(args);
        if (command == "recv") return cmd_recv(args);
        if (command == "monitor") return cmd_monitor(args);
        if (command == "optimize") return cmd_optimize(args);

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_RUNTIME;
    }
}
