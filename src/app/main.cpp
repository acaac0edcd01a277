/**
 * @file main.cpp
 * @brief SMS relay CLI executable entrypoint
 *
 * Usage:
 *   sms_relay -c <config> incoming <backend> <sender> <text>
 *   sms_relay -c <config> send <backend> <recipient> <text>
 *   sms_relay -c <config> retry
 *   sms_relay -c <config> mark-sent <message-id>
 *   sms_relay --help
 *   sms_relay --version
 */

#include "sms/relay/relay_service.h"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view VERSION = "0.1.0";
constexpr std::string_view PROGRAM_NAME = "sms_relay";

void print_version() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
    std::cout << "SMS Relay - phased message routing between senders and handler apps\n";
}

void print_usage() {
    std::cout << "Usage: " << PROGRAM_NAME << " [OPTIONS] <command> [ARGS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>    Path to configuration file (YAML)\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version information\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  incoming <backend> <sender> <text>     Dispatch a received message\n";
    std::cout << "  send <backend> <recipient> <text>      Send a message\n";
    std::cout << "  retry                                  Retry queued messages\n";
    std::cout << "  mark-sent <message-id>                 Record a delivery receipt\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << PROGRAM_NAME
              << " -c ./sms_relay.yaml incoming carrier +15551234567 \"hello\"\n";
    std::cout << "  " << PROGRAM_NAME << " -c ./sms_relay.yaml retry\n";
}

struct cli_options {
    std::filesystem::path config_path;
    std::string command;
    std::vector<std::string> arguments;
    bool show_help = false;
    bool show_version = false;
    bool valid = true;
    std::string error_message;
};

size_t expected_arguments(std::string_view command) {
    if (command == "incoming" || command == "send") return 3;
    if (command == "mark-sent") return 1;
    return 0;
}

cli_options parse_args(int argc, char* argv[]) {
    cli_options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (opts.command.empty()) {
            if (arg == "-h" || arg == "--help") {
                opts.show_help = true;
                return opts;
            }

            if (arg == "-v" || arg == "--version") {
                opts.show_version = true;
                return opts;
            }

            if (arg == "-c" || arg == "--config") {
                if (i + 1 >= argc) {
                    opts.valid = false;
                    opts.error_message = "Missing argument for --config";
                    return opts;
                }
                opts.config_path = argv[++i];
                continue;
            }

            if (arg.starts_with("-")) {
                opts.valid = false;
                opts.error_message = "Unknown argument: " + std::string(arg);
                return opts;
            }

            if (arg != "incoming" && arg != "send" && arg != "retry" &&
                arg != "mark-sent") {
                opts.valid = false;
                opts.error_message = "Unknown command: " + std::string(arg);
                return opts;
            }
            opts.command = std::string(arg);
            continue;
        }

        opts.arguments.emplace_back(arg);
    }

    if (!opts.command.empty() &&
        opts.arguments.size() != expected_arguments(opts.command)) {
        opts.valid = false;
        opts.error_message = "Wrong number of arguments for '" + opts.command + "'";
    }

    return opts;
}

void print_message(const sms::relay::core::message_record& message) {
    std::cout << "  #" << message.id << " " << sms::relay::core::to_string(message.direction)
              << " " << sms::relay::core::to_string(message.connection) << " ["
              << sms::relay::core::to_string(message.status) << "] " << message.text
              << "\n";
}

int run_command(sms::relay::relay_service& service, const cli_options& opts) {
    using sms::relay::router::to_string;
    auto& router = service.get_router();

    if (auto started = router.ensure_started(); !started) {
        std::cerr << "Failed to start router: " << to_string(started.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (opts.command == "incoming") {
        auto result = router.process_incoming(opts.arguments[0], opts.arguments[1],
                                              opts.arguments[2]);
        if (!result) {
            std::cerr << "Dispatch failed: " << to_string(result.error()) << "\n";
            return EXIT_FAILURE;
        }
        std::cout << (result->vetoed ? "Message vetoed:\n" : "Message handled:\n");
        print_message(result->message);
        for (const auto& reply : result->replies) {
            print_message(reply);
        }
        return EXIT_SUCCESS;
    }

    if (opts.command == "send") {
        sms::relay::core::connection target;
        target.backend = opts.arguments[0];
        target.identity = opts.arguments[1];
        auto result = router.send_outgoing(target, opts.arguments[2]);
        if (!result) {
            std::cerr << "Send failed: " << to_string(result.error()) << "\n";
            return EXIT_FAILURE;
        }
        print_message(*result);
        return EXIT_SUCCESS;
    }

    if (opts.command == "retry") {
        auto result = router.retry_queued();
        if (!result) {
            std::cerr << "Retry failed: " << to_string(result.error()) << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "Attempted: " << result->attempted << ", sent: " << result->sent
                  << ", still queued: " << result->still_queued
                  << ", failed: " << result->failed << "\n";
        return EXIT_SUCCESS;
    }

    // mark-sent
    const auto& id_arg = opts.arguments[0];
    sms::relay::core::message_id id = 0;
    auto [ptr, ec] = std::from_chars(id_arg.data(), id_arg.data() + id_arg.size(), id);
    if (ec != std::errc{} || ptr != id_arg.data() + id_arg.size() || id <= 0) {
        std::cerr << "Error: invalid message id: " << id_arg << "\n";
        return EXIT_FAILURE;
    }
    auto result = router.mark_sent(id);
    if (!result) {
        std::cerr << "Mark sent failed: " << to_string(result.error()) << "\n";
        return EXIT_FAILURE;
    }
    print_message(*result);
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);

    if (!opts.valid) {
        std::cerr << "Error: " << opts.error_message << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (opts.show_version) {
        print_version();
        return EXIT_SUCCESS;
    }

    if (opts.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    if (opts.config_path.empty()) {
        std::cerr << "Error: Configuration file required\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (opts.command.empty()) {
        std::cerr << "Error: Command required\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    try {
        auto service = sms::relay::relay_service::create_from_file(opts.config_path);
        if (!service) {
            std::cerr << "Failed to start relay: " << sms::relay::to_string(service.error())
                      << "\n";
            return EXIT_FAILURE;
        }

        return run_command(**service, opts);

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
