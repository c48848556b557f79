/**
 * @file test_transfer_manager.cpp
 * @brief End-to-end tests of two transfer managers over a loopback transport
 *
 * Tests the transfer engine including:
 * - Offer, accept and byte-identical delivery of files and directories
 * - Per-file integrity failures that leave the other files intact
 * - Cancellation without leftover partial files
 * - Retry of dropped chunk requests
 * - Offer validation, rejection, expiry and peer binding
 * - Offers that outlive the request timeout while awaiting a decision
 * - Session ids that are claimed once and never reused
 * - Prepare and start_send argument errors
 */

#include <gtest/gtest.h>
#include "ferry/content_hash.hpp"
#include "ferry/content_store.hpp"
#include "ferry/file_source.hpp"
#include "ferry/transfer_error.hpp"
#include "ferry/transfer_manager.hpp"
#include "loopback_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace ferry;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr auto WAIT_TIMEOUT = std::chrono::seconds(10);
constexpr auto RETRY_BACKOFF = std::chrono::milliseconds(2000);

/**
 * @brief Records engine events and lets a test wait for them
 */
struct EventLog {
    std::mutex mutex;
    std::condition_variable changed;
    std::vector<IncomingOfferEvent> offers;
    std::vector<TransferCompleteEvent> completed;
    std::vector<TransferFailedEvent> failed;
    std::atomic<size_t> progress_events{0};

    TransferEvents callbacks() {
        TransferEvents events;
        events.on_offer = [this](const IncomingOfferEvent& e) { record(offers, e); };
        events.on_progress = [this](const TransferProgressEvent&) { progress_events++; };
        events.on_complete = [this](const TransferCompleteEvent& e) { record(completed, e); };
        events.on_failed = [this](const TransferFailedEvent& e) { record(failed, e); };
        return events;
    }

    template <class Event>
    void record(std::vector<Event>& list, const Event& event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            list.push_back(event);
        }
        changed.notify_all();
    }

    template <class Event, class Pred>
    std::optional<Event> wait_for(const std::vector<Event>& list, Pred pred) {
        std::unique_lock<std::mutex> lock(mutex);
        std::optional<Event> found;
        changed.wait_for(lock, WAIT_TIMEOUT, [&]() {
            for (const auto& event : list) {
                if (pred(event)) {
                    found = event;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::optional<IncomingOfferEvent> wait_offer() {
        return wait_for(offers, [](const IncomingOfferEvent&) { return true; });
    }

    std::optional<TransferCompleteEvent> wait_complete(const std::string& session_id) {
        return wait_for(completed, [&](const TransferCompleteEvent& e) { return e.session_id == session_id; });
    }

    std::optional<TransferFailedEvent> wait_failed(const std::string& session_id) {
        return wait_for(failed, [&](const TransferFailedEvent& e) { return e.session_id == session_id; });
    }

    size_t offer_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return offers.size();
    }

    size_t complete_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return completed.size();
    }
};

template <class Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + WAIT_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

// Test fixture for TransferManager tests
class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "ferry_transfer_manager_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_ / "outbox");
        inbox_ = test_dir_ / "inbox";

        config_.chunk_size = 16;
        config_.max_concurrent_chunks = 4;
        config_.retry.max_attempts = 3;
        config_.retry.base_delay = 10ms;
        config_.retry.max_delay = 40ms;
        config_.request_timeout = 2000ms;
        config_.progress_interval = 0ms;
        config_.io_threads = 2;
        config_.disk_threads = 2;
        config_.driver_threads = 2;
        config_.save_directory = inbox_;

        network_ = std::make_unique<test::LoopbackNetwork>();

        empty_ = write_file("empty.txt", {});
        one_ = write_file("one.bin", pattern(10, 1));
        five_ = write_file("five.bin", pattern(80, 2));
    }

    void TearDown() override {
        if (bob_) {
            bob_->shutdown();
        }
        if (alice_) {
            alice_->shutdown();
        }
        bob_.reset();
        alice_.reset();
        network_.reset();

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    void start(config::TransferConfig sender_config, config::TransferConfig receiver_config) {
        alice_ = std::make_unique<TransferManager>(network_->endpoint("alice"), sender_config, alice_events_.callbacks());
        bob_ = std::make_unique<TransferManager>(network_->endpoint("bob"), receiver_config, bob_events_.callbacks());
    }

    void start() {
        start(config_, config_);
    }

    /// Long retry delays keep a session alive while its chunks are dropped
    void start_stalling(uint32_t file_id = 2, uint32_t from_index = 1) {
        auto slow = config_;
        slow.retry.base_delay = RETRY_BACKOFF;
        slow.retry.max_delay = RETRY_BACKOFF;
        start(config_, slow);

        network_->set_fault_hook([this, file_id, from_index](const std::string&, const std::string&,
                                                             const wire::Request& request) {
            const auto* chunk = std::get_if<wire::ChunkRequest>(&request);
            if (chunk != nullptr) {
                chunk_requests_++;
            }
            if (chunk != nullptr && chunk->file_id == file_id && chunk->chunk_index >= from_index) {
                if (!stalled_.exchange(true)) {
                    stalled_signal_.set_value();
                }
                return test::Fault::DROP;
            }
            return test::Fault::NONE;
        });
    }

    static std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; i++) {
            data[i] = static_cast<uint8_t>((i * 17 + seed * 29) & 0xff);
        }
        return data;
    }

    fs::path write_file(const fs::path& relative, const std::vector<uint8_t>& content) {
        fs::path path = test_dir_ / "outbox" / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static std::vector<uint8_t> read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    size_t count_part_files() const {
        size_t count = 0;
        if (!fs::exists(inbox_)) {
            return 0;
        }
        for (const auto& entry : fs::recursive_directory_iterator(inbox_)) {
            if (entry.path().extension() == ".part") {
                count++;
            }
        }
        return count;
    }

    /// Offer the standard three files and have bob accept
    StartSendResult offer_and_accept(const std::vector<fs::path>& paths) {
        auto prepared = alice_->prepare(paths);
        auto result = alice_->start_send(prepared.prepared_id, "bob");

        auto offer = bob_events_.wait_offer();
        EXPECT_TRUE(offer.has_value());
        if (!offer) {
            return StartSendResult{};
        }
        EXPECT_TRUE(bob_->accept(offer->session_id));

        EXPECT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
        return result.get();
    }

    wire::OfferRequest valid_offer(const std::string& session_id) {
        wire::OfferRequest offer;
        offer.session_id = session_id;
        offer.chunk_size = 16;

        wire::FileInfo file;
        file.file_id = 0;
        file.name = "a.txt";
        file.relative_path = "docs/a.txt";
        file.size = 5;
        file.checksum = ContentHasher::hash_bytes(pattern(5, 3));
        offer.files.push_back(file);
        offer.total_size = 5;
        return offer;
    }

    /// Send a raw request from a third endpoint and wait for the answer
    std::optional<wire::Response> raw_request(std::shared_ptr<test::LoopbackTransport> from, wire::Request request) {
        auto answer = std::make_shared<std::promise<std::optional<wire::Response>>>();
        auto future = answer->get_future();
        from->async_request("bob", std::move(request),
            [answer](std::error_code ec, std::optional<wire::Response> response) {
                answer->set_value(ec ? std::nullopt : std::move(response));
            });
        if (future.wait_for(WAIT_TIMEOUT) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

    fs::path test_dir_;
    fs::path inbox_;
    fs::path empty_;
    fs::path one_;
    fs::path five_;
    config::TransferConfig config_;

    std::unique_ptr<test::LoopbackNetwork> network_;
    EventLog alice_events_;
    EventLog bob_events_;
    std::unique_ptr<TransferManager> alice_;
    std::unique_ptr<TransferManager> bob_;

    std::atomic<bool> stalled_{false};
    std::promise<void> stalled_signal_;
    std::atomic<size_t> chunk_requests_{0};    ///< Every ChunkRequest the receiver sent
};

// ============================================================================
// Delivery Tests
// ============================================================================

TEST_F(TransferManagerTest, DeliversFilesIntact) {
    start();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted) << result.reason.value_or("");

    auto received = bob_events_.wait_complete(result.session_id);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->direction, TransferDirection::RECEIVE);
    EXPECT_EQ(received->total_bytes, 90u);
    EXPECT_EQ(received->save_location, inbox_.string());
    EXPECT_EQ(received->file_locations.size(), 3u);

    auto sent = alice_events_.wait_complete(result.session_id);
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->direction, TransferDirection::SEND);
    EXPECT_EQ(sent->total_bytes, 90u);

    EXPECT_EQ(read_file(inbox_ / "empty.txt"), std::vector<uint8_t>());
    EXPECT_TRUE(fs::exists(inbox_ / "empty.txt"));
    EXPECT_EQ(read_file(inbox_ / "one.bin"), pattern(10, 1));
    EXPECT_EQ(read_file(inbox_ / "five.bin"), pattern(80, 2));
    EXPECT_EQ(count_part_files(), 0u);
    EXPECT_GT(bob_events_.progress_events.load(), 0u);

    EXPECT_TRUE(eventually([this]() {
        return alice_->send_session_count() == 0 && bob_->receive_session_count() == 0;
    }));
}

TEST_F(TransferManagerTest, DeliversDirectoryTree) {
    write_file("album/b.png", pattern(33, 4));
    write_file("album/raw/a.dng", pattern(7, 5));
    start();

    auto result = offer_and_accept({test_dir_ / "outbox" / "album"});
    ASSERT_TRUE(result.accepted);
    ASSERT_TRUE(bob_events_.wait_complete(result.session_id).has_value());

    EXPECT_EQ(read_file(inbox_ / "album" / "b.png"), pattern(33, 4));
    EXPECT_EQ(read_file(inbox_ / "album" / "raw" / "a.dng"), pattern(7, 5));
}

TEST_F(TransferManagerTest, DeliversIntoContentStore) {
    start();
    auto prepared = alice_->prepare({one_, five_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    auto store = std::make_shared<MemoryContentStore>("media");
    ASSERT_TRUE(bob_->accept(offer->session_id, std::make_shared<ContentFileSink>(store)));
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto received = bob_events_.wait_complete(offer->session_id);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->save_location, "media://");
    EXPECT_EQ(store->contents("five.bin"), pattern(80, 2));
    EXPECT_EQ(store->contents("one.bin"), pattern(10, 1));
    EXPECT_EQ(store->pending_count(), 0u);
}

TEST_F(TransferManagerTest, SendsFromContentSources) {
    auto store = std::make_shared<MemoryContentStore>();
    auto handle = store->add_file("clip.mov", pattern(50, 6));
    start();

    auto prepared = alice_->prepare(std::vector<std::shared_ptr<FileSource>>{
        std::make_shared<ContentFileSource>(store, handle)});
    ASSERT_EQ(prepared.files.size(), 1u);
    EXPECT_EQ(prepared.files[0].checksum, ContentHasher::hash_bytes(pattern(50, 6)));

    auto result = alice_->start_send(prepared.prepared_id, "bob");
    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    ASSERT_TRUE(bob_->accept(offer->session_id));
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);

    ASSERT_TRUE(bob_events_.wait_complete(offer->session_id).has_value());
    EXPECT_EQ(read_file(inbox_ / "clip.mov"), pattern(50, 6));
}

TEST_F(TransferManagerTest, AutoAcceptReceivesWithoutAsking) {
    auto receiver = config_;
    receiver.auto_accept = true;
    start(config_, receiver);

    auto prepared = alice_->prepare({five_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    auto outcome = result.get();
    ASSERT_TRUE(outcome.accepted);

    ASSERT_TRUE(bob_events_.wait_complete(outcome.session_id).has_value());
    EXPECT_EQ(bob_events_.offer_count(), 1u);
    EXPECT_EQ(read_file(inbox_ / "five.bin"), pattern(80, 2));
}

TEST_F(TransferManagerTest, SelectedFilesOnly) {
    start();
    auto prepared = alice_->prepare({empty_, one_, five_});
    auto result = alice_->start_send(prepared.prepared_id, "bob", std::vector<uint32_t>{2});

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    ASSERT_EQ(offer->files.size(), 1u);
    EXPECT_EQ(offer->files[0].file_id, 2u);
    EXPECT_EQ(offer->total_size, 80u);

    ASSERT_TRUE(bob_->accept(offer->session_id));
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    ASSERT_TRUE(bob_events_.wait_complete(offer->session_id).has_value());
    EXPECT_FALSE(fs::exists(inbox_ / "one.bin"));
    EXPECT_TRUE(fs::exists(inbox_ / "five.bin"));
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST_F(TransferManagerTest, HashMismatchFailsOnlyThatFile) {
    start();
    auto prepared = alice_->prepare({empty_, one_, five_});

    // Same size, different bytes: the offered checksum no longer matches
    write_file("one.bin", pattern(10, 9));

    auto result = alice_->start_send(prepared.prepared_id, "bob");
    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    ASSERT_TRUE(bob_->accept(offer->session_id));
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto failed = bob_events_.wait_failed(offer->session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->cancelled);
    EXPECT_EQ(failed->failed_file_ids, std::vector<uint32_t>{1});
    EXPECT_NE(failed->error.find("1 of 3"), std::string::npos);

    EXPECT_TRUE(fs::exists(inbox_ / "empty.txt"));
    EXPECT_FALSE(fs::exists(inbox_ / "one.bin"));
    EXPECT_EQ(read_file(inbox_ / "five.bin"), pattern(80, 2));
    EXPECT_EQ(count_part_files(), 0u);

    // The sender learns of the failure through the peer's cancel
    auto sender_failed = alice_events_.wait_failed(offer->session_id);
    ASSERT_TRUE(sender_failed.has_value());
    EXPECT_EQ(bob_events_.complete_count(), 0u);
}

TEST_F(TransferManagerTest, TamperedChunkIsIntegrityFailure) {
    start();
    network_->set_fault_hook([](const std::string&, const std::string&, const wire::Request& request) {
        const auto* chunk = std::get_if<wire::ChunkRequest>(&request);
        if (chunk != nullptr && chunk->file_id == 2 && chunk->chunk_index == 0) {
            return test::Fault::TAMPER;
        }
        return test::Fault::NONE;
    });

    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);

    auto failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->failed_file_ids, std::vector<uint32_t>{2});
    EXPECT_FALSE(fs::exists(inbox_ / "five.bin"));
    EXPECT_EQ(read_file(inbox_ / "one.bin"), pattern(10, 1));
    EXPECT_EQ(count_part_files(), 0u);
}

TEST_F(TransferManagerTest, DroppedRequestIsRetried) {
    start();
    std::atomic<int> drops(0);
    network_->set_fault_hook([&drops](const std::string&, const std::string&, const wire::Request& request) {
        const auto* chunk = std::get_if<wire::ChunkRequest>(&request);
        if (chunk != nullptr && chunk->file_id == 2 && chunk->chunk_index == 3 && drops.fetch_add(1) == 0) {
            return test::Fault::DROP;
        }
        return test::Fault::NONE;
    });

    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);

    ASSERT_TRUE(bob_events_.wait_complete(result.session_id).has_value());
    EXPECT_EQ(drops.load(), 2);
    EXPECT_EQ(read_file(inbox_ / "five.bin"), pattern(80, 2));
}

TEST_F(TransferManagerTest, PersistentDropsFailTheSession) {
    start();
    network_->set_fault_hook([](const std::string&, const std::string&, const wire::Request& request) {
        const auto* chunk = std::get_if<wire::ChunkRequest>(&request);
        if (chunk != nullptr && chunk->file_id == 1) {
            return test::Fault::DROP;
        }
        return test::Fault::NONE;
    });

    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);

    auto failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->cancelled);
    EXPECT_NE(failed->error.find("gave up after 3 attempts"), std::string::npos);
    EXPECT_EQ(failed->failed_file_ids, (std::vector<uint32_t>{1, 2}));
    EXPECT_TRUE(fs::exists(inbox_ / "empty.txt"));
    EXPECT_EQ(count_part_files(), 0u);
}

TEST_F(TransferManagerTest, CancelMidTransferLeavesNoPartialFiles) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);

    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_TRUE(bob_->cancel(result.session_id));
    EXPECT_FALSE(bob_->cancel(result.session_id));

    auto failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_TRUE(failed->cancelled);
    EXPECT_EQ(failed->error, "cancelled by user");
    EXPECT_EQ(failed->failed_file_ids, std::vector<uint32_t>{2});

    auto sender_failed = alice_events_.wait_failed(result.session_id);
    ASSERT_TRUE(sender_failed.has_value());
    EXPECT_TRUE(sender_failed->cancelled);

    EXPECT_TRUE(eventually([this]() { return bob_->receive_session_count() == 0; }));
    EXPECT_FALSE(fs::exists(inbox_ / "five.bin"));
    EXPECT_EQ(count_part_files(), 0u);

    // A retry was waiting on its backoff at cancel time and must not fire
    size_t requests = chunk_requests_.load();
    std::this_thread::sleep_for(RETRY_BACKOFF + 500ms);
    EXPECT_EQ(chunk_requests_.load(), requests);
}

TEST_F(TransferManagerTest, CancelAfterTwoOfFiveChunks) {
    start_stalling(0, 2);
    auto result = offer_and_accept({five_});
    ASSERT_TRUE(result.accepted);

    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);
    ASSERT_TRUE(eventually([&]() {
        auto progress = bob_->progress(result.session_id);
        return progress && progress->transferred_bytes >= 32;
    }));
    EXPECT_EQ(count_part_files(), 1u);

    EXPECT_TRUE(bob_->cancel(result.session_id));

    auto failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_TRUE(failed->cancelled);
    EXPECT_EQ(failed->failed_file_ids, std::vector<uint32_t>{0});

    auto sender_failed = alice_events_.wait_failed(result.session_id);
    ASSERT_TRUE(sender_failed.has_value());
    EXPECT_TRUE(sender_failed->cancelled);
    EXPECT_EQ(sender_failed->error, "cancelled by user");

    EXPECT_TRUE(eventually([this]() { return bob_->receive_session_count() == 0; }));
    EXPECT_FALSE(fs::exists(inbox_ / "five.bin"));
    EXPECT_EQ(count_part_files(), 0u);

    size_t requests = chunk_requests_.load();
    std::this_thread::sleep_for(RETRY_BACKOFF + 500ms);
    EXPECT_EQ(chunk_requests_.load(), requests);
    EXPECT_EQ(bob_events_.complete_count(), 0u);
}

TEST_F(TransferManagerTest, SenderCancelStopsReceiver) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);

    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_TRUE(alice_->cancel(result.session_id, "sender stopped"));

    auto failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_TRUE(failed->cancelled);
    EXPECT_EQ(failed->error, "sender stopped");
    EXPECT_EQ(count_part_files(), 0u);
}

TEST_F(TransferManagerTest, ProgressOfLiveSession) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);
    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto progress = bob_->progress(result.session_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->direction, TransferDirection::RECEIVE);
    EXPECT_EQ(progress->total_bytes, 90u);
    EXPECT_EQ(progress->total_files, 3u);
    EXPECT_GE(progress->completed_files, 2u);

    EXPECT_TRUE(alice_->progress(result.session_id).has_value());
    EXPECT_FALSE(bob_->progress("no-such-session").has_value());
}

// ============================================================================
// Offer Handling Tests
// ============================================================================

TEST_F(TransferManagerTest, RejectResolvesSender) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->peer_id, "alice");

    auto pending = bob_->pending_offers();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].session_id, offer->session_id);
    EXPECT_EQ(pending[0].total_size, 10u);

    EXPECT_TRUE(bob_->reject(offer->session_id, "no thanks"));
    EXPECT_FALSE(bob_->reject(offer->session_id));
    EXPECT_FALSE(bob_->accept(offer->session_id));
    EXPECT_EQ(bob_->pending_offer_count(), 0u);

    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    auto outcome = result.get();
    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(outcome.reason, "no thanks");
    EXPECT_EQ(alice_->send_session_count(), 0u);
}

TEST_F(TransferManagerTest, CancelPendingOfferRejectsIt) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_TRUE(bob_->cancel(offer->session_id, "busy"));

    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_EQ(result.get().reason, "busy");
    EXPECT_FALSE(bob_->cancel("unknown-session"));
}

TEST_F(TransferManagerTest, OfferToUnknownPeerFails) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "carol");

    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    auto outcome = result.get();
    EXPECT_FALSE(outcome.accepted);
    ASSERT_TRUE(outcome.reason.has_value());
    EXPECT_EQ(outcome.reason->rfind("offer failed", 0), 0u);
}

TEST_F(TransferManagerTest, UnsafeOfferIsRejected) {
    start();
    auto mallory = network_->endpoint("mallory");

    auto offer = valid_offer("evil-session");
    offer.files[0].relative_path = "../../etc/cron.d/job";

    auto response = raw_request(mallory, offer);
    ASSERT_TRUE(response.has_value());
    auto* answer = std::get_if<wire::OfferResultResponse>(&*response);
    ASSERT_NE(answer, nullptr);
    EXPECT_FALSE(answer->accepted);
    EXPECT_FALSE(answer->key.has_value());
    ASSERT_TRUE(answer->reason.has_value());
    EXPECT_NE(answer->reason->find("unsafe relative path"), std::string::npos);

    EXPECT_EQ(bob_events_.offer_count(), 0u);
    EXPECT_EQ(bob_->pending_offer_count(), 0u);
}

TEST_F(TransferManagerTest, DuplicateSessionIdIsRejected) {
    start();
    auto mallory = network_->endpoint("mallory");

    // The first offer stays pending, so its answer only comes at shutdown
    mallory->async_request("bob", valid_offer("dup-session"), [](std::error_code, std::optional<wire::Response>) {});
    ASSERT_TRUE(bob_events_.wait_offer().has_value());

    auto second = raw_request(mallory, valid_offer("dup-session"));
    ASSERT_TRUE(second.has_value());
    auto* answer = std::get_if<wire::OfferResultResponse>(&*second);
    ASSERT_NE(answer, nullptr);
    EXPECT_FALSE(answer->accepted);
    EXPECT_EQ(answer->reason, "session id already in use");
}

TEST_F(TransferManagerTest, DuplicateOfferDuringAcceptIsRejected) {
    start();
    auto mallory = network_->endpoint("mallory");

    for (int round = 0; round < 20; round++) {
        std::string session_id = "race-" + std::to_string(round);
        mallory->async_request("bob", valid_offer(session_id), [](std::error_code, std::optional<wire::Response>) {});
        ASSERT_TRUE(bob_events_.wait_for(bob_events_.offers, [&](const IncomingOfferEvent& e) {
            return e.session_id == session_id;
        }).has_value());

        std::thread accepter([&]() { bob_->accept(session_id); });
        auto duplicate = raw_request(mallory, valid_offer(session_id));
        accepter.join();

        ASSERT_TRUE(duplicate.has_value());
        auto* answer = std::get_if<wire::OfferResultResponse>(&*duplicate);
        ASSERT_NE(answer, nullptr);
        EXPECT_FALSE(answer->accepted);
        EXPECT_EQ(answer->reason, "session id already in use");
        EXPECT_EQ(bob_->pending_offer_count(), 0u);
        EXPECT_LE(bob_->receive_session_count(), 1u);

        // mallory serves no chunks, so the accepted session fails on its own
        ASSERT_TRUE(eventually([this]() { return bob_->receive_session_count() == 0; }));
    }
}

TEST_F(TransferManagerTest, SessionIdIsNeverReused) {
    start();
    auto mallory = network_->endpoint("mallory");

    mallory->async_request("bob", valid_offer("once-only"), [](std::error_code, std::optional<wire::Response>) {});
    ASSERT_TRUE(bob_events_.wait_offer().has_value());
    EXPECT_TRUE(bob_->reject("once-only", "not now"));
    EXPECT_EQ(bob_->pending_offer_count(), 0u);

    auto again = raw_request(mallory, valid_offer("once-only"));
    ASSERT_TRUE(again.has_value());
    auto* answer = std::get_if<wire::OfferResultResponse>(&*again);
    ASSERT_NE(answer, nullptr);
    EXPECT_FALSE(answer->accepted);
    EXPECT_EQ(answer->reason, "session id already in use");
    EXPECT_EQ(bob_events_.offer_count(), 1u);
}

TEST_F(TransferManagerTest, ChunkRequestFromOtherPeerGetsAck) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);
    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto mallory = network_->endpoint("mallory");
    wire::ChunkRequest steal;
    steal.session_id = result.session_id;
    steal.file_id = 1;
    steal.chunk_index = 0;

    auto answer = std::make_shared<std::promise<std::optional<wire::Response>>>();
    auto future = answer->get_future();
    mallory->async_request("alice", steal, [answer](std::error_code ec, std::optional<wire::Response> response) {
        answer->set_value(ec ? std::nullopt : std::move(response));
    });
    ASSERT_EQ(future.wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto response = future.get();
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(std::holds_alternative<wire::AckResponse>(*response));
}

TEST_F(TransferManagerTest, CancelFromOtherPeerIsIgnored) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);
    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);

    wire::CancelRequest cancel;
    cancel.session_id = result.session_id;
    cancel.reason = "spoofed";
    auto response = raw_request(network_->endpoint("mallory"), cancel);
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(std::holds_alternative<wire::AckResponse>(*response));

    EXPECT_EQ(bob_->receive_session_count(), 1u);
    EXPECT_TRUE(bob_->progress(result.session_id).has_value());
}

// ============================================================================
// Stale Session Tests
// ============================================================================

TEST_F(TransferManagerTest, SweepExpiresUnansweredOffer) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());

    EXPECT_EQ(bob_->sweep_stale_sessions(), 0u);
    auto later = std::chrono::steady_clock::now() + config_.offer_timeout + 1s;
    EXPECT_EQ(bob_->sweep_stale_sessions(later), 1u);
    EXPECT_EQ(bob_->pending_offer_count(), 0u);

    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_EQ(result.get().reason, "offer expired");

    auto failed = bob_events_.wait_failed(offer->session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->error, "offer expired");
}

TEST_F(TransferManagerTest, OfferOutlivesRequestTimeout) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");

    auto offer = bob_events_.wait_offer();
    ASSERT_TRUE(offer.has_value());

    auto later = std::chrono::steady_clock::now() + config_.request_timeout + 1s;
    EXPECT_EQ(bob_->sweep_stale_sessions(later), 0u);
    EXPECT_EQ(bob_->pending_offer_count(), 1u);

    EXPECT_TRUE(bob_->accept(offer->session_id));
    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_TRUE(result.get().accepted);
    EXPECT_TRUE(bob_events_.wait_complete(offer->session_id).has_value());
}

TEST_F(TransferManagerTest, SweepExpiresIdleSendSession) {
    start_stalling();
    auto result = offer_and_accept({empty_, one_, five_});
    ASSERT_TRUE(result.accepted);
    ASSERT_EQ(stalled_signal_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto later = std::chrono::steady_clock::now() + config_.stale_session_timeout + 1s;
    EXPECT_GE(alice_->sweep_stale_sessions(later), 1u);

    auto failed = alice_events_.wait_failed(result.session_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->cancelled);
    EXPECT_NE(failed->error.find("expired"), std::string::npos);
    EXPECT_EQ(alice_->send_session_count(), 0u);

    // The receiver is told and gives up too
    auto receiver_failed = bob_events_.wait_failed(result.session_id);
    ASSERT_TRUE(receiver_failed.has_value());
    EXPECT_TRUE(receiver_failed->cancelled);
}

TEST_F(TransferManagerTest, ShutdownRejectsPendingOffers) {
    start();
    auto prepared = alice_->prepare({one_});
    auto result = alice_->start_send(prepared.prepared_id, "bob");
    ASSERT_TRUE(bob_events_.wait_offer().has_value());

    bob_->shutdown();
    bob_->shutdown();

    ASSERT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_EQ(result.get().reason, "receiver shutting down");
}

// ============================================================================
// Argument Tests
// ============================================================================

TEST_F(TransferManagerTest, PrepareErrors) {
    start();

    try {
        alice_->prepare(std::vector<fs::path>{});
        FAIL() << "prepare() accepted an empty list";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
        EXPECT_STREQ(e.what(), "No files given");
    }

    fs::create_directories(test_dir_ / "outbox" / "hollow");
    try {
        alice_->prepare({test_dir_ / "outbox" / "hollow"});
        FAIL() << "prepare() accepted an empty directory";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
    }

    try {
        alice_->prepare({test_dir_ / "outbox" / "missing.bin"});
        FAIL() << "prepare() accepted a missing file";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE);
    }
}

TEST_F(TransferManagerTest, PrepareAssignsSequentialIds) {
    start();
    auto prepared = alice_->prepare({empty_, one_, five_});
    ASSERT_EQ(prepared.files.size(), 3u);
    for (uint32_t i = 0; i < 3; i++) {
        EXPECT_EQ(prepared.files[i].file_id, i);
    }
    EXPECT_EQ(prepared.total_size, 90u);
    EXPECT_EQ(prepared.files[2].checksum, ContentHasher::hash_bytes(pattern(80, 2)));
    EXPECT_FALSE(prepared.prepared_id.empty());
}

TEST_F(TransferManagerTest, StartSendErrors) {
    start();
    EXPECT_THROW(alice_->start_send("no-such-id", "bob"), TransferError);

    auto prepared = alice_->prepare({one_, five_});
    EXPECT_THROW(alice_->start_send(prepared.prepared_id, "bob", std::vector<uint32_t>{}), TransferError);
    EXPECT_THROW(alice_->start_send(prepared.prepared_id, "bob", std::vector<uint32_t>{7}), TransferError);

    // Argument errors leave the prepared transfer usable; starting consumes it
    auto result = alice_->start_send(prepared.prepared_id, "carol");
    EXPECT_THROW(alice_->start_send(prepared.prepared_id, "bob"), TransferError);
    EXPECT_EQ(result.wait_for(WAIT_TIMEOUT), std::future_status::ready);
}

TEST_F(TransferManagerTest, InvalidConfigurationIsRejected) {
    auto bad = config_;
    bad.chunk_size = 1;
    EXPECT_THROW({ TransferManager manager(network_->endpoint("x"), bad); }, TransferError);
    EXPECT_THROW({ TransferManager manager(nullptr, config_); }, TransferError);
}

// ============================================================================
// Offer Validation Tests
// ============================================================================

TEST_F(TransferManagerTest, ValidOfferPasses) {
    EXPECT_FALSE(validate_offer(valid_offer("session-1")).has_value());
}

TEST_F(TransferManagerTest, OfferValidationReasons) {
    auto expect_reason = [this](const std::function<void(wire::OfferRequest&)>& mutate, const std::string& reason) {
        auto offer = valid_offer("session-1");
        mutate(offer);
        auto problem = validate_offer(offer);
        ASSERT_TRUE(problem.has_value()) << "expected: " << reason;
        EXPECT_NE(problem->find(reason), std::string::npos) << *problem;
    };

    expect_reason([](wire::OfferRequest& o) { o.session_id = ""; }, "invalid session id");
    expect_reason([](wire::OfferRequest& o) { o.session_id = "a/b"; }, "invalid session id");
    expect_reason([](wire::OfferRequest& o) { o.files.clear(); o.total_size = 0; }, "no files");
    expect_reason([](wire::OfferRequest& o) { o.chunk_size = 8; }, "chunk size");
    expect_reason([](wire::OfferRequest& o) { o.files[0].relative_path = "/abs/path"; }, "unsafe relative path");
    expect_reason([](wire::OfferRequest& o) { o.files[0].relative_path = "a/../../b"; }, "unsafe relative path");
    expect_reason([](wire::OfferRequest& o) { o.files[0].name = ""; }, "invalid file name");
    expect_reason([](wire::OfferRequest& o) { o.files[0].checksum = "abc"; }, "invalid checksum");
    expect_reason([](wire::OfferRequest& o) { o.total_size = 6; }, "does not match");
    expect_reason([](wire::OfferRequest& o) {
        o.files.push_back(o.files[0]);
        o.files[1].relative_path = "docs/b.txt";
        o.total_size = 10;
    }, "duplicate file id");
    expect_reason([](wire::OfferRequest& o) {
        o.files.push_back(o.files[0]);
        o.files[1].file_id = 1;
        o.total_size = 10;
    }, "duplicate relative path");
}
