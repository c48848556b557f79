/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for Ferry
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ferry {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto new_logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        new_logger->set_level(to_spdlog_level(level));
        new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            g_logger = new_logger;
        }

        spdlog::set_default_logger(new_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> string_to_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "info")     return LogLevel::INFO;
    if (lower == "warn")     return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto current = logger();
    if (!current) {
        initialize_logging();
        current = logger();
        if (!current) {
            return;
        }
    }

    switch (level) {
        case LogLevel::DEBUG:    current->debug(message); break;
        case LogLevel::INFO:     current->info(message); break;
        case LogLevel::WARN:     current->warn(message); break;
        case LogLevel::ERROR:    current->error(message); break;
        case LogLevel::CRITICAL: current->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// FORMATTING FUNCTIONS
// ============================================================================

std::string format_file_size(uint64_t size) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_d = static_cast<double>(size);

    while (size_d >= 1024.0 && unit_index < 4) {
        size_d /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
    return oss.str();
}

std::string format_speed(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return format_file_size(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

std::string format_duration(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    uint64_t secs = seconds % 60;

    std::ostringstream oss;
    bool has_output = false;

    if (hours > 0) {
        oss << hours << "h";
        has_output = true;
    }
    if (minutes > 0 || (has_output && secs > 0)) {
        if (has_output) oss << " ";
        oss << minutes << "m";
        has_output = true;
    }
    if (secs > 0 || !has_output) {
        if (has_output) oss << " ";
        oss << secs << "s";
    }

    return oss.str();
}

// ============================================================================
// ENCODING / IDENTIFIERS
// ============================================================================

std::string bytes_to_hex(const uint8_t* data, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string generate_uuid() {
    static const int sodium_ready = sodium_init();
    if (sodium_ready < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }

    uint8_t data[16];
    randombytes_buf(data, sizeof(data));

    // Set version (4) and variant bits according to RFC 4122
    data[6] = static_cast<uint8_t>((data[6] & 0x0F) | 0x40);
    data[8] = static_cast<uint8_t>((data[8] & 0x3F) | 0x80);

    std::string hex = bytes_to_hex(data, sizeof(data));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since,
                    std::chrono::steady_clock::time_point now) {
    if (now <= since) {
        return 0;
    }
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count());
}

} // namespace utilities
} // namespace ferry
