/**
 * @file test_transfer_config.cpp
 * @brief Unit tests for transfer configuration and path validation
 *
 * Tests configuration handling including:
 * - Defaults and retry backoff
 * - JSON round trip and rejection of invalid settings
 * - Relative path validation (traversal, absolute, drive prefixes)
 * - Identifier validation and filename sanitization
 * - Directory configuration through FERRY_DATA_DIR
 * - Error kind classification
 */

#include <gtest/gtest.h>
#include "ferry/transfer_config.hpp"
#include "ferry/transfer_error.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace ferry;
using namespace ferry::config;
namespace fs = std::filesystem;

// Test fixture for transfer config tests
class TransferConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "ferry_config_test";
        fs::create_directories(test_dir_);
        setenv("FERRY_DATA_DIR", (test_dir_ / "data").string().c_str(), 1);
    }

    void TearDown() override {
        unsetenv("FERRY_DATA_DIR");
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Defaults and Retry Policy Tests
// ============================================================================

TEST_F(TransferConfigTest, DefaultsAreValid) {
    TransferConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.chunk_size, 256u * 1024u);
    EXPECT_EQ(cfg.max_concurrent_chunks, 8u);
    EXPECT_EQ(cfg.retry.max_attempts, 3u);
    EXPECT_EQ(cfg.request_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(cfg.offer_timeout, std::chrono::milliseconds(180000));
    EXPECT_GT(cfg.offer_timeout, cfg.request_timeout);
    EXPECT_FALSE(cfg.auto_accept);
    EXPECT_TRUE(cfg.save_directory.empty());
}

TEST_F(TransferConfigTest, LimitsAreReasonable) {
    EXPECT_EQ(MAX_MESSAGE_SIZE, 10u * 1024u * 1024u);
    EXPECT_EQ(MAX_FILES_PER_OFFER, 10000u);
    EXPECT_EQ(MIN_CHUNK_SIZE, 16u);
    EXPECT_EQ(MAX_CHUNK_SIZE, 4u * 1024u * 1024u);
    EXPECT_LT(DEFAULT_CHUNK_SIZE + 1024, MAX_MESSAGE_SIZE);
    EXPECT_EQ(CONNECTION_TIMEOUT, std::chrono::seconds(5));
}

TEST_F(TransferConfigTest, RetryDelayDoublesUntilCapped) {
    RetryPolicy policy;
    EXPECT_EQ(policy.delay_for(0), std::chrono::milliseconds(0));
    EXPECT_EQ(policy.delay_for(1), std::chrono::milliseconds(500));
    EXPECT_EQ(policy.delay_for(2), std::chrono::milliseconds(1000));
    EXPECT_EQ(policy.delay_for(3), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delay_for(4), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delay_for(1000), std::chrono::milliseconds(2000));
}

TEST_F(TransferConfigTest, RetryDelayZeroBase) {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(0);
    EXPECT_EQ(policy.delay_for(5), std::chrono::milliseconds(0));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(TransferConfigTest, ValidateRejectsChunkSizeOutOfRange) {
    TransferConfig cfg;
    cfg.chunk_size = MIN_CHUNK_SIZE - 1;
    EXPECT_THROW(cfg.validate(), TransferError);

    cfg.chunk_size = MAX_CHUNK_SIZE + 1;
    EXPECT_THROW(cfg.validate(), TransferError);

    cfg.chunk_size = MIN_CHUNK_SIZE;
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(TransferConfigTest, ValidateRejectsZeroCounts) {
    TransferConfig cfg;
    cfg.max_concurrent_chunks = 0;
    EXPECT_THROW(cfg.validate(), TransferError);

    cfg = TransferConfig();
    cfg.retry.max_attempts = 0;
    EXPECT_THROW(cfg.validate(), TransferError);

    cfg = TransferConfig();
    cfg.disk_threads = 0;
    EXPECT_THROW(cfg.validate(), TransferError);
}

TEST_F(TransferConfigTest, ValidateRejectsInvertedRetryDelays) {
    TransferConfig cfg;
    cfg.retry.base_delay = std::chrono::milliseconds(5000);
    cfg.retry.max_delay = std::chrono::milliseconds(100);
    EXPECT_THROW(cfg.validate(), TransferError);
}

TEST_F(TransferConfigTest, ValidateRejectsZeroOfferTimeout) {
    TransferConfig cfg;
    cfg.offer_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(cfg.validate(), TransferError);
}

TEST_F(TransferConfigTest, ValidateErrorKindIsInvalidArgument) {
    TransferConfig cfg;
    cfg.request_timeout = std::chrono::milliseconds(0);
    try {
        cfg.validate();
        FAIL() << "validate() accepted a zero request timeout";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
    }
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST_F(TransferConfigTest, JsonRoundTrip) {
    TransferConfig cfg;
    cfg.chunk_size = 1024;
    cfg.max_concurrent_chunks = 3;
    cfg.retry.max_attempts = 5;
    cfg.retry.base_delay = std::chrono::milliseconds(10);
    cfg.retry.max_delay = std::chrono::milliseconds(40);
    cfg.offer_timeout = std::chrono::milliseconds(60000);
    cfg.auto_accept = true;
    cfg.save_directory = "/tmp/ferry_inbox";

    auto parsed = TransferConfig::from_json(cfg.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->chunk_size, 1024u);
    EXPECT_EQ(parsed->max_concurrent_chunks, 3u);
    EXPECT_EQ(parsed->retry.max_attempts, 5u);
    EXPECT_EQ(parsed->retry.base_delay, std::chrono::milliseconds(10));
    EXPECT_EQ(parsed->retry.max_delay, std::chrono::milliseconds(40));
    EXPECT_EQ(parsed->offer_timeout, std::chrono::milliseconds(60000));
    EXPECT_TRUE(parsed->auto_accept);
    EXPECT_EQ(parsed->save_directory, fs::path("/tmp/ferry_inbox"));
}

TEST_F(TransferConfigTest, JsonMissingKeysUseDefaults) {
    auto parsed = TransferConfig::from_json(R"({"chunk_size": 4096})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->chunk_size, 4096u);
    EXPECT_EQ(parsed->max_concurrent_chunks, DEFAULT_MAX_CONCURRENT_CHUNKS);
    EXPECT_EQ(parsed->request_timeout, DEFAULT_REQUEST_TIMEOUT);
    EXPECT_EQ(parsed->offer_timeout, DEFAULT_OFFER_TIMEOUT);
}

TEST_F(TransferConfigTest, JsonRejectsMalformedInput) {
    EXPECT_FALSE(TransferConfig::from_json("not json").has_value());
    EXPECT_FALSE(TransferConfig::from_json("[1, 2, 3]").has_value());
    EXPECT_FALSE(TransferConfig::from_json(R"({"chunk_size": "big"})").has_value());
}

TEST_F(TransferConfigTest, JsonRejectsInvalidValues) {
    EXPECT_FALSE(TransferConfig::from_json(R"({"chunk_size": 1})").has_value());
    EXPECT_FALSE(TransferConfig::from_json(R"({"max_concurrent_chunks": 0})").has_value());
}

TEST_F(TransferConfigTest, LoadConfigFromFile) {
    fs::path file = test_dir_ / "ferry.json";
    {
        std::ofstream out(file);
        out << R"({"chunk_size": 65536, "auto_accept": true})";
    }

    auto cfg = load_config(file);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->chunk_size, 65536u);
    EXPECT_TRUE(cfg->auto_accept);
}

TEST_F(TransferConfigTest, LoadConfigMissingFile) {
    EXPECT_FALSE(load_config(test_dir_ / "absent.json").has_value());
}

// ============================================================================
// Relative Path Validation Tests
// ============================================================================

TEST_F(TransferConfigTest, RelativePathValid) {
    EXPECT_TRUE(is_safe_relative_path("file.txt"));
    EXPECT_TRUE(is_safe_relative_path("photos/2024/beach.jpg"));
    EXPECT_TRUE(is_safe_relative_path("a b/c-d_e.f"));
    EXPECT_TRUE(is_safe_relative_path("..hidden"));
}

TEST_F(TransferConfigTest, RelativePathTraversal) {
    EXPECT_FALSE(is_safe_relative_path("../etc/passwd"));
    EXPECT_FALSE(is_safe_relative_path("docs/../../etc/passwd"));
    EXPECT_FALSE(is_safe_relative_path(".."));
    EXPECT_FALSE(is_safe_relative_path("./file"));
}

TEST_F(TransferConfigTest, RelativePathAbsoluteAndDrive) {
    EXPECT_FALSE(is_safe_relative_path("/etc/passwd"));
    EXPECT_FALSE(is_safe_relative_path("C:\\Windows\\system32"));
    EXPECT_FALSE(is_safe_relative_path("C:/Windows"));
    EXPECT_FALSE(is_safe_relative_path("\\\\server\\share"));
}

TEST_F(TransferConfigTest, RelativePathMalformed) {
    EXPECT_FALSE(is_safe_relative_path(""));
    EXPECT_FALSE(is_safe_relative_path("dir//file"));
    EXPECT_FALSE(is_safe_relative_path("dir/"));
    EXPECT_FALSE(is_safe_relative_path(std::string("file\0name", 9)));
    EXPECT_FALSE(is_safe_relative_path("line\nbreak"));
    EXPECT_FALSE(is_safe_relative_path(std::string(MAX_FILENAME_LENGTH + 1, 'a')));
}

// ============================================================================
// Identifier and Filename Tests
// ============================================================================

TEST_F(TransferConfigTest, ValidateIdentifier) {
    EXPECT_TRUE(validate_identifier("3f2b8c1e-8d4a-4c1b-9a7e-0123456789ab"));
    EXPECT_TRUE(validate_identifier("session1"));
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("../up"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(TransferConfigTest, SanitizeFilename) {
    EXPECT_EQ(sanitize_filename("report.pdf"), "report.pdf");
    EXPECT_EQ(sanitize_filename("  padded.txt  "), "padded.txt");
    EXPECT_EQ(sanitize_filename("a:b*c?.txt"), "a_b_c_.txt");
    EXPECT_EQ(sanitize_filename("../.."), "....");
    EXPECT_EQ(sanitize_filename(""), "untitled");
    EXPECT_EQ(sanitize_filename(".."), "untitled");
    EXPECT_EQ(sanitize_filename("/"), "untitled");
}

TEST_F(TransferConfigTest, SanitizeFilenameTooLong) {
    std::string long_name(300, 'a');
    EXPECT_EQ(sanitize_filename(long_name).length(), MAX_FILENAME_LENGTH);
}

TEST_F(TransferConfigTest, IsSafePath) {
    fs::path base = test_dir_ / "base";
    fs::create_directories(base);

    EXPECT_TRUE(is_safe_path(base / "file.txt", base));
    EXPECT_TRUE(is_safe_path(base / "sub" / "file.txt", base));
    EXPECT_FALSE(is_safe_path(base, base));
    EXPECT_FALSE(is_safe_path(base / ".." / "escape.txt", base));
    EXPECT_FALSE(is_safe_path("/etc/passwd", base));
}

// ============================================================================
// Directory Configuration Tests
// ============================================================================

TEST_F(TransferConfigTest, DataDirectoryFromEnvironment) {
    fs::path data_dir = get_data_directory();
    EXPECT_EQ(data_dir, test_dir_ / "data");
    EXPECT_TRUE(fs::exists(data_dir));
}

TEST_F(TransferConfigTest, DirectoriesAreConsistent) {
    fs::path data_dir = get_data_directory();
    fs::path received_dir = get_received_directory();
    fs::path log_dir = get_log_directory();

    EXPECT_EQ(received_dir, data_dir / "received");
    EXPECT_EQ(log_dir, data_dir / "logs");
    EXPECT_TRUE(fs::exists(received_dir));
    EXPECT_TRUE(fs::exists(log_dir));
}

// ============================================================================
// Error Classification Tests
// ============================================================================

TEST_F(TransferConfigTest, ErrorKindClassification) {
    EXPECT_TRUE(TransferError(ErrorKind::TRANSPORT, "timeout").is_retryable());
    EXPECT_FALSE(TransferError(ErrorKind::INTEGRITY, "tag").is_retryable());
    EXPECT_TRUE(TransferError(ErrorKind::INTEGRITY, "hash").is_file_scoped());
    EXPECT_FALSE(TransferError(ErrorKind::STORAGE, "disk full").is_file_scoped());
}

TEST_F(TransferConfigTest, ErrorKindNames) {
    for (auto kind : {ErrorKind::TRANSPORT, ErrorKind::INTEGRITY, ErrorKind::STORAGE,
                      ErrorKind::PROTOCOL, ErrorKind::CANCELLED, ErrorKind::INVALID_ARGUMENT}) {
        auto parsed = string_to_error_kind(error_kind_to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(string_to_error_kind("bogus").has_value());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(TransferConfigTest, ConcurrentPathValidation) {
    const int num_threads = 10;
    std::vector<std::thread> threads;
    std::vector<int> results(num_threads, 0);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&results, i]() {
            results[i] = is_safe_relative_path("dir_" + std::to_string(i) + "/file.bin") &&
                         !is_safe_relative_path("../dir_" + std::to_string(i)) ? 1 : 0;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int result : results) {
        EXPECT_EQ(result, 1);
    }
}
