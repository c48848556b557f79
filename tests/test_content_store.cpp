/**
 * @file test_content_store.cpp
 * @brief Unit tests for the in-memory content store
 *
 * Tests content store operations including:
 * - Population with files and nested directories
 * - Ordered child listing and path lookup
 * - Pending entries: bounded writes, publish, remove
 * - Replacement of an existing visible entry on publish
 */

#include <gtest/gtest.h>
#include "ferry/content_store.hpp"
#include "ferry/transfer_error.hpp"
#include <string>
#include <vector>

using namespace ferry;

// Test fixture for MemoryContentStore tests
class ContentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryContentStore>("media");
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::shared_ptr<MemoryContentStore> store_;
};

// ============================================================================
// Population Tests
// ============================================================================

TEST_F(ContentStoreTest, AddFileIsVisible) {
    auto handle = store_->add_file("notes.txt", bytes("hello"));
    EXPECT_EQ(handle.rfind("media://", 0), 0u);

    auto info = store_->stat(handle);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "notes.txt");
    EXPECT_EQ(info->size, 5u);
    EXPECT_FALSE(info->is_dir);

    EXPECT_EQ(store_->contents("notes.txt"), bytes("hello"));
}

TEST_F(ContentStoreTest, NestedFileCreatesParents) {
    store_->add_file("album/2024/a.jpg", bytes("jpeg"));

    auto album = store_->find("album");
    ASSERT_TRUE(album.has_value());
    EXPECT_TRUE(album->is_dir);

    auto year = store_->find("album/2024");
    ASSERT_TRUE(year.has_value());
    EXPECT_TRUE(year->is_dir);
    EXPECT_EQ(year->name, "2024");
}

TEST_F(ContentStoreTest, ListChildrenSortedAndDirect) {
    auto dir = store_->add_directory("docs");
    store_->add_file("docs/b.txt", bytes("b"));
    store_->add_file("docs/a.txt", bytes("a"));
    store_->add_file("docs/sub/c.txt", bytes("c"));

    auto children = store_->list_children(dir);
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[0].name, "a.txt");
    EXPECT_EQ(children[1].name, "b.txt");
    EXPECT_EQ(children[2].name, "sub");
    EXPECT_TRUE(children[2].is_dir);
}

TEST_F(ContentStoreTest, ListChildrenOfFileIsEmpty) {
    auto file = store_->add_file("single.bin", bytes("x"));
    EXPECT_TRUE(store_->list_children(file).empty());
    EXPECT_TRUE(store_->list_children("media://999").empty());
}

TEST_F(ContentStoreTest, ReadAtBounds) {
    auto handle = store_->add_file("data.bin", bytes("0123456789"));
    uint8_t buffer[4];

    EXPECT_EQ(store_->read_at(handle, 8, buffer, sizeof(buffer)), 2u);
    EXPECT_EQ(buffer[0], '8');
    EXPECT_EQ(store_->read_at(handle, 10, buffer, sizeof(buffer)), 0u);
    EXPECT_THROW(store_->read_at("media://404", 0, buffer, sizeof(buffer)), TransferError);
}

TEST_F(ContentStoreTest, DescribeNamesRoot) {
    EXPECT_EQ(store_->describe(), "media://");
}

// ============================================================================
// Pending Entry Tests
// ============================================================================

TEST_F(ContentStoreTest, PendingEntryIsHiddenUntilPublished) {
    auto handle = store_->create_pending("incoming/file.bin", 4);
    EXPECT_EQ(store_->pending_count(), 1u);
    EXPECT_FALSE(store_->stat(handle).has_value());
    EXPECT_FALSE(store_->find("incoming/file.bin").has_value());

    auto data = bytes("abcd");
    store_->write_at(handle, 0, data.data(), data.size());
    store_->publish(handle);

    EXPECT_EQ(store_->pending_count(), 0u);
    EXPECT_EQ(store_->contents("incoming/file.bin"), data);
}

TEST_F(ContentStoreTest, PendingWritesOutOfOrder) {
    auto handle = store_->create_pending("ooo.bin", 6);
    auto tail = bytes("def");
    auto head = bytes("abc");
    store_->write_at(handle, 3, tail.data(), tail.size());
    store_->write_at(handle, 0, head.data(), head.size());
    store_->publish(handle);
    EXPECT_EQ(store_->contents("ooo.bin"), bytes("abcdef"));
}

TEST_F(ContentStoreTest, WriteBeyondDeclaredSizeFails) {
    auto handle = store_->create_pending("small.bin", 2);
    auto data = bytes("abc");
    EXPECT_THROW(store_->write_at(handle, 0, data.data(), data.size()), TransferError);
    EXPECT_THROW(store_->write_at(handle, 3, data.data(), 1), TransferError);
}

TEST_F(ContentStoreTest, WriteToPublishedEntryFails) {
    auto handle = store_->add_file("done.bin", bytes("x"));
    auto data = bytes("y");
    EXPECT_THROW(store_->write_at(handle, 0, data.data(), data.size()), TransferError);
    EXPECT_THROW(store_->publish(handle), TransferError);
}

TEST_F(ContentStoreTest, RemovePendingEntry) {
    auto handle = store_->create_pending("gone.bin", 3);
    store_->remove(handle);
    EXPECT_EQ(store_->pending_count(), 0u);
    EXPECT_NO_THROW(store_->remove(handle));
}

TEST_F(ContentStoreTest, PublishReplacesExistingEntry) {
    store_->add_file("report.txt", bytes("old"));
    auto handle = store_->create_pending("report.txt", 3);
    auto data = bytes("new");
    store_->write_at(handle, 0, data.data(), data.size());

    // The old version stays visible until the new one is published
    EXPECT_EQ(store_->contents("report.txt"), bytes("old"));
    store_->publish(handle);
    EXPECT_EQ(store_->contents("report.txt"), bytes("new"));
}

TEST_F(ContentStoreTest, CreatePendingRejectsEmptyPath) {
    EXPECT_THROW(store_->create_pending("", 1), TransferError);
}
