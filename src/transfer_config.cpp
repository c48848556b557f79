/**
 * @file transfer_config.cpp
 * @brief Implementation of configuration loading and path validation
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ferry/transfer_config.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace ferry {
namespace config {

// ============================================================================
// Retry policy
// ============================================================================

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }

    // Clamp the shift; anything past 2^20 is far above any sane cap
    uint32_t shift = std::min<uint32_t>(retry - 1, 20);
    std::chrono::milliseconds delay = base_delay * (int64_t(1) << shift);
    return std::min(delay, max_delay);
}

// ============================================================================
// TransferConfig
// ============================================================================

std::string TransferConfig::to_json() const {
    json j;
    j["chunk_size"] = chunk_size;
    j["max_concurrent_chunks"] = max_concurrent_chunks;
    j["retry_max_attempts"] = retry.max_attempts;
    j["retry_base_delay_ms"] = retry.base_delay.count();
    j["retry_max_delay_ms"] = retry.max_delay.count();
    j["request_timeout_ms"] = request_timeout.count();
    j["offer_timeout_ms"] = offer_timeout.count();
    j["progress_interval_ms"] = progress_interval.count();
    j["speed_window_ms"] = speed_window.count();
    j["stale_session_timeout_ms"] = stale_session_timeout.count();
    j["cleanup_interval_ms"] = cleanup_interval.count();
    j["io_threads"] = io_threads;
    j["disk_threads"] = disk_threads;
    j["driver_threads"] = driver_threads;
    j["auto_accept"] = auto_accept;
    j["save_directory"] = save_directory.string();
    return j.dump(2);
}

std::optional<TransferConfig> TransferConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_error("Configuration root must be an object");
            return std::nullopt;
        }

        TransferConfig cfg;

        auto millis = [&j](const char* key, std::chrono::milliseconds fallback) {
            return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
        };

        cfg.chunk_size = j.value("chunk_size", cfg.chunk_size);
        cfg.max_concurrent_chunks = j.value("max_concurrent_chunks", cfg.max_concurrent_chunks);
        cfg.retry.max_attempts = j.value("retry_max_attempts", cfg.retry.max_attempts);
        cfg.retry.base_delay = millis("retry_base_delay_ms", cfg.retry.base_delay);
        cfg.retry.max_delay = millis("retry_max_delay_ms", cfg.retry.max_delay);
        cfg.request_timeout = millis("request_timeout_ms", cfg.request_timeout);
        cfg.offer_timeout = millis("offer_timeout_ms", cfg.offer_timeout);
        cfg.progress_interval = millis("progress_interval_ms", cfg.progress_interval);
        cfg.speed_window = millis("speed_window_ms", cfg.speed_window);
        cfg.stale_session_timeout = millis("stale_session_timeout_ms", cfg.stale_session_timeout);
        cfg.cleanup_interval = millis("cleanup_interval_ms", cfg.cleanup_interval);
        cfg.io_threads = j.value("io_threads", cfg.io_threads);
        cfg.disk_threads = j.value("disk_threads", cfg.disk_threads);
        cfg.driver_threads = j.value("driver_threads", cfg.driver_threads);
        cfg.auto_accept = j.value("auto_accept", cfg.auto_accept);
        cfg.save_directory = j.value("save_directory", std::string());

        cfg.validate();
        return cfg;

    } catch (const json::exception& e) {
        utilities::log_error("Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    } catch (const TransferError& e) {
        utilities::log_error("Invalid configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

void TransferConfig::validate() const {
    auto fail = [](const std::string& what) {
        throw TransferError(ErrorKind::INVALID_ARGUMENT, what);
    };

    if (chunk_size < MIN_CHUNK_SIZE || chunk_size > MAX_CHUNK_SIZE) {
        fail("chunk_size out of range: " + std::to_string(chunk_size));
    }
    if (max_concurrent_chunks == 0) {
        fail("max_concurrent_chunks must be at least 1");
    }
    if (retry.max_attempts == 0) {
        fail("retry_max_attempts must be at least 1");
    }
    if (retry.base_delay.count() < 0 || retry.max_delay < retry.base_delay) {
        fail("retry delays must satisfy 0 <= base <= max");
    }
    if (request_timeout.count() <= 0) {
        fail("request_timeout_ms must be positive");
    }
    if (offer_timeout.count() <= 0) {
        fail("offer_timeout_ms must be positive");
    }
    if (progress_interval.count() < 0 || speed_window.count() <= 0) {
        fail("progress_interval_ms must be >= 0 and speed_window_ms positive");
    }
    if (stale_session_timeout.count() <= 0 || cleanup_interval.count() <= 0) {
        fail("stale_session_timeout_ms and cleanup_interval_ms must be positive");
    }
    if (io_threads == 0 || disk_threads == 0 || driver_threads == 0) {
        fail("thread pool sizes must be at least 1");
    }
}

std::optional<TransferConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utilities::log_error("Failed to open configuration file: " + path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();

    auto cfg = TransferConfig::from_json(content.str());
    if (cfg) {
        utilities::log_info("Loaded configuration from " + path.string());
    }
    return cfg;
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("FERRY_DATA_DIR");

    std::filesystem::path data_dir;
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        data_dir = env_data_dir;
    } else {
#ifdef _WIN32
        data_dir = "C:\\ProgramData\\FSI\\Ferry";
#else
        const char* home = std::getenv("HOME");
        data_dir = (home != nullptr && std::strlen(home) > 0)
            ? std::filesystem::path(home) / ".local" / "share" / "ferry"
            : std::filesystem::temp_directory_path() / "ferry";
#endif
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::filesystem::path get_received_directory() {
    std::filesystem::path received_dir = get_data_directory() / "received";

    if (!std::filesystem::exists(received_dir)) {
        std::filesystem::create_directories(received_dir);
    }

    return received_dir;
}

std::filesystem::path get_log_directory() {
    std::filesystem::path log_dir = get_data_directory() / "logs";

    if (!std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
    }

    return log_dir;
}

// ============================================================================
// Path validation
// ============================================================================

bool is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty() || relative_path.size() > MAX_RELATIVE_PATH_LENGTH) {
        return false;
    }

    // Absolute paths and Windows drive or UNC prefixes
    if (relative_path.front() == '/' ||
        relative_path.find('\\') != std::string::npos ||
        relative_path.find(':') != std::string::npos ||
        relative_path.find('\0') != std::string::npos) {
        return false;
    }

    size_t start = 0;
    while (start <= relative_path.size()) {
        size_t end = relative_path.find('/', start);
        if (end == std::string::npos) {
            end = relative_path.size();
        }

        std::string component = relative_path.substr(start, end - start);
        if (component.empty() || component == "." || component == ".." ||
            component.size() > MAX_FILENAME_LENGTH) {
            return false;
        }

        for (char c : component) {
            if (std::iscntrl(static_cast<unsigned char>(c))) {
                return false;
            }
        }

        start = end + 1;
    }

    return true;
}

bool validate_identifier(const std::string& identifier) {
    if (identifier.empty() || identifier.length() > MAX_IDENTIFIER_LENGTH) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
    }

    return true;
}

std::string sanitize_filename(const std::string& filename) {
    std::string sanitized = filename;

    // Remove any directory separators and NUL bytes
    sanitized.erase(
        std::remove_if(sanitized.begin(), sanitized.end(),
            [](char c) { return c == '/' || c == '\\' || c == '\0'; }),
        sanitized.end()
    );

    auto start = sanitized.find_first_not_of(" \t\r\n");
    auto end = sanitized.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "untitled";
    }
    sanitized = sanitized.substr(start, end - start + 1);

    const std::string dangerous_chars = "<>:\"|?*";
    for (char& c : sanitized) {
        if (dangerous_chars.find(c) != std::string::npos ||
            std::iscntrl(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }

    if (sanitized == "." || sanitized == "..") {
        return "untitled";
    }

    if (sanitized.length() > MAX_FILENAME_LENGTH) {
        sanitized = sanitized.substr(0, MAX_FILENAME_LENGTH);
    }

    return sanitized;
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        std::filesystem::path canonical_path = std::filesystem::weakly_canonical(path);
        std::filesystem::path canonical_base = std::filesystem::weakly_canonical(base_dir);

        auto relative = canonical_path.lexically_relative(canonical_base);
        if (relative.empty()) {
            return false;
        }

        // Path must sit strictly below the base
        auto first = *relative.begin();
        if (first == ".." || first == ".") {
            return false;
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

} // namespace config
} // namespace ferry
