/**
 * @file ferry_cli.cpp
 * @brief Command line sender and receiver
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Usage:
 * - ferry_cli send <host> <port> <path>...
 * - ferry_cli receive <port> [save_dir]
 *
 * Options: --config <file>, --log <file>, --log-to-disk, --log-level <level>, --verbose
 */

#include "ferry/tcp_transport.hpp"
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/transfer_manager.hpp"
#include "ferry/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace ferry;
using namespace ferry::utilities;

static std::atomic<bool> g_shutdown(false);
static std::mutex g_output_mutex;

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " send <host> <port> <path>... [options]\n";
    std::cout << "  " << program_name << " receive <port> [save_dir] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>   Load transfer configuration from a JSON file\n";
    std::cout << "  --log <file>          Also write the log to a file\n";
    std::cout << "  --log-to-disk         Also write the log to <data dir>/logs/ferry.log\n";
    std::cout << "  --log-level <level>   debug, info, warn, error or critical (default info)\n";
    std::cout << "  --verbose             Same as --log-level debug\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " receive 7400 ~/Downloads\n";
    std::cout << "  " << program_name << " send 192.168.1.20 7400 photos/ notes.txt\n\n";
}

struct Options {
    std::vector<std::string> positional;
    std::string config_file;
    std::string log_file;
    bool log_to_disk = false;
    LogLevel log_level = LogLevel::INFO;
};

// Split options from positional arguments; returns false on a malformed option
bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            options.log_level = LogLevel::DEBUG;
        } else if (arg == "--log-to-disk") {
            options.log_to_disk = true;
        } else if (arg == "--config" || arg == "--log" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--log-level") {
                auto level = string_to_log_level(value);
                if (!level) {
                    std::cerr << "Unknown log level: " << value << "\n";
                    return false;
                }
                options.log_level = *level;
            } else {
                (arg == "--config" ? options.config_file : options.log_file) = value;
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

void print_progress(const TransferProgressEvent& event) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    double percent = event.total_bytes == 0
        ? 100.0
        : 100.0 * static_cast<double>(event.transferred_bytes) / static_cast<double>(event.total_bytes);

    std::cout << "\r" << direction_to_string(event.direction) << " "
              << static_cast<int>(percent) << "% "
              << format_file_size(event.transferred_bytes) << "/" << format_file_size(event.total_bytes)
              << " (" << event.completed_files << "/" << event.total_files << " files) "
              << format_speed(event.speed);
    if (event.eta) {
        std::cout << " ETA " << format_duration(static_cast<uint64_t>(*event.eta));
    }
    std::cout << "        " << std::flush;
}

TransferEvents make_events(std::atomic<bool>& finished, std::atomic<bool>& succeeded) {
    TransferEvents events;

    events.on_offer = [](const IncomingOfferEvent& event) {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::cout << "\nIncoming offer from " << event.peer_id << ": "
                  << event.files.size() << " file(s), " << format_file_size(event.total_size) << "\n";
        for (const auto& file : event.files) {
            std::cout << "  " << file.relative_path << " (" << format_file_size(file.size) << ")\n";
        }
    };

    events.on_progress = print_progress;

    events.on_complete = [&finished, &succeeded](const TransferCompleteEvent& event) {
        {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "\nTransfer " << event.session_id << " complete: "
                      << format_file_size(event.total_bytes) << " in "
                      << format_duration(event.elapsed_ms / 1000) << "\n";
            if (event.save_location) {
                std::cout << "Saved to " << *event.save_location << "\n";
            }
        }
        succeeded = true;
        finished = true;
    };

    events.on_failed = [&finished](const TransferFailedEvent& event) {
        {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "\nTransfer " << event.session_id
                      << (event.cancelled ? " cancelled: " : " failed: ") << event.error << "\n";
        }
        finished = true;
    };

    return events;
}

int run_send(const Options& options, config::TransferConfig config) {
    if (options.positional.size() < 3) {
        std::cerr << "send requires <host> <port> <path>...\n";
        return 1;
    }

    const std::string& host = options.positional[0];
    std::string peer_id = (host.find(':') != std::string::npos ? "[" + host + "]" : host) + ":" + options.positional[1];
    if (!parse_peer_address(peer_id)) {
        std::cerr << "Invalid peer address: " << peer_id << "\n";
        return 1;
    }

    std::vector<std::filesystem::path> paths(options.positional.begin() + 2, options.positional.end());

    auto transport = std::make_shared<TcpTransport>(0, config.request_timeout, config.io_threads, config.offer_timeout);
    if (!transport->start()) {
        std::cerr << "Failed to start transport\n";
        return 1;
    }

    std::atomic<bool> finished(false);
    std::atomic<bool> succeeded(false);
    int exit_code = 1;

    {
        TransferManager manager(transport, config, make_events(finished, succeeded));

        try {
            auto prepared = manager.prepare(paths);
            std::cout << "Offering " << prepared.files.size() << " file(s), "
                      << format_file_size(prepared.total_size) << " to " << peer_id << "...\n";

            auto result = manager.start_send(prepared.prepared_id, peer_id).get();
            if (!result.accepted) {
                std::cout << "Offer not accepted: " << result.reason.value_or("unknown reason") << "\n";
            } else {
                while (!finished && !g_shutdown) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                if (!finished) {
                    manager.cancel(result.session_id, "sender interrupted");
                }
                exit_code = succeeded ? 0 : 1;
            }
        } catch (const TransferError& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }

        manager.shutdown();
    }

    transport->stop();
    return exit_code;
}

int run_receive(const Options& options, config::TransferConfig config) {
    if (options.positional.empty()) {
        std::cerr << "receive requires <port>\n";
        return 1;
    }

    uint16_t port = 0;
    try {
        unsigned long value = std::stoul(options.positional[0]);
        if (value == 0 || value > 65535) {
            throw std::out_of_range("port");
        }
        port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        std::cerr << "Invalid port: " << options.positional[0] << "\n";
        return 1;
    }

    if (options.positional.size() >= 2) {
        config.save_directory = options.positional[1];
    }
    config.auto_accept = true;

    auto transport = std::make_shared<TcpTransport>(port, config.request_timeout, config.io_threads, config.offer_timeout);
    if (!transport->start()) {
        std::cerr << "Failed to listen on port " << port << "\n";
        return 1;
    }

    std::atomic<bool> finished(false);
    std::atomic<bool> succeeded(false);

    {
        TransferManager manager(transport, config, make_events(finished, succeeded));

        std::cout << "Receiving on port " << transport->get_listen_port() << " into "
                  << (config.save_directory.empty() ? config::get_received_directory() : config.save_directory).string()
                  << " (Ctrl+C to stop)\n";

        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutting down...\n";
        manager.shutdown();
    }

    transport->stop();
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    if (options.log_file.empty() && options.log_to_disk) {
        try {
            options.log_file = (config::get_log_directory() / "ferry.log").string();
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Cannot create log directory: " << e.what() << "\n";
            return 1;
        }
    }
    initialize_logging(options.log_file, options.log_level);

    config::TransferConfig config;
    if (!options.config_file.empty()) {
        auto loaded = config::load_config(options.config_file);
        if (!loaded) {
            std::cerr << "Invalid configuration file: " << options.config_file << "\n";
            return 1;
        }
        config = *loaded;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        if (command == "send") {
            return run_send(options, config);
        }
        if (command == "receive") {
            return run_receive(options, config);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
