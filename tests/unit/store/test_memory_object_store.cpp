/**
 * @file test_memory_object_store.cpp
 * @brief Unit tests for memory_object_store
 */

#include <gtest/gtest.h>

#include <kcenon/vector_transfer/store/memory_object_store.h>

#include "../test_fixtures.h"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::vector_transfer::test {

namespace {

auto drain(byte_stream& stream, std::size_t* pieces = nullptr) -> byte_buffer {
    byte_buffer out;
    std::size_t count = 0;
    while (true) {
        auto item = stream.next();
        if (!item || !item.value()) {
            break;
        }
        ++count;
        out.insert(out.end(), item.value()->begin(), item.value()->end());
    }
    if (pieces) {
        *pieces = count;
    }
    return out;
}

}  // namespace

class MemoryObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        memory_store_config config;
        config.stream_piece_size = 16;
        store_ = std::make_unique<memory_object_store>(config);
        data_ = make_payload(100);
        store_->put_object("vectors", "a.bin", data_);
    }

    std::unique_ptr<memory_object_store> store_;
    byte_buffer data_;
};

// ============================================================================
// buffered_byte_stream
// ============================================================================

TEST_F(MemoryObjectStoreTest, BufferedStreamServesFixedPieces) {
    buffered_byte_stream stream(make_payload(40), 16);

    std::size_t pieces = 0;
    auto body = drain(stream, &pieces);

    EXPECT_EQ(body.size(), 40u);
    EXPECT_EQ(pieces, 3u);
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST_F(MemoryObjectStoreTest, BufferedStreamZeroPieceSizeServesOnePiece) {
    buffered_byte_stream stream(make_payload(40));

    std::size_t pieces = 0;
    drain(stream, &pieces);

    EXPECT_EQ(pieces, 1u);
}

TEST_F(MemoryObjectStoreTest, BufferedStreamRepeatsEnd) {
    buffered_byte_stream stream(byte_buffer{});

    auto first = stream.next();
    auto second = stream.next();

    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first.value().has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second.value().has_value());
}

// ============================================================================
// get_object
// ============================================================================

TEST_F(MemoryObjectStoreTest, GetWholeObject) {
    auto output = store_->get_object("vectors", "a.bin", std::nullopt);

    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output.value().content_length, 100u);
    EXPECT_EQ(drain(*output.value().body), data_);
    EXPECT_EQ(store_->get_object_calls(), 1u);
}

TEST_F(MemoryObjectStoreTest, GetBoundedRange) {
    auto output = store_->get_object("vectors", "a.bin", byte_range{10, 19});

    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output.value().content_length, 10u);
    EXPECT_EQ(drain(*output.value().body), byte_buffer(data_.begin() + 10, data_.begin() + 20));
}

TEST_F(MemoryObjectStoreTest, RangeEndIsClampedToObject) {
    auto output = store_->get_object("vectors", "a.bin", byte_range{90, 500});

    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output.value().content_length, 10u);
}

TEST_F(MemoryObjectStoreTest, RangeAtObjectSizeIsEmpty) {
    auto output = store_->get_object("vectors", "a.bin", byte_range{100, std::nullopt});

    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output.value().content_length, 0u);
    EXPECT_TRUE(drain(*output.value().body).empty());
}

TEST_F(MemoryObjectStoreTest, RangeBeyondObjectSizeIsInvalid) {
    auto output = store_->get_object("vectors", "a.bin", byte_range{101, std::nullopt});

    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, error_code::invalid_range);
}

TEST_F(MemoryObjectStoreTest, MissingKeyIsObjectNotFound) {
    auto output = store_->get_object("vectors", "missing.bin", std::nullopt);

    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, error_code::object_not_found);
    EXPECT_EQ(store_->get_object_calls(), 1u);
}

// ============================================================================
// Multipart uploads
// ============================================================================

TEST_F(MemoryObjectStoreTest, MultipartRoundTrip) {
    auto upload_id = store_->create_multipart_upload("vectors", "b.bin");
    ASSERT_TRUE(upload_id.has_value());
    EXPECT_EQ(store_->pending_upload_count(), 1u);

    auto first = make_payload(30, 1);
    auto second = make_payload(12, 2);
    auto tag1 = store_->upload_part("vectors", "b.bin", upload_id.value(), 1, first);
    auto tag2 = store_->upload_part("vectors", "b.bin", upload_id.value(), 2, second);
    ASSERT_TRUE(tag1.has_value());
    ASSERT_TRUE(tag2.has_value());
    EXPECT_EQ(tag1.value().front(), '"');
    EXPECT_EQ(tag1.value(), memory_object_store::compute_etag(first));
    EXPECT_EQ(store_->uploaded_part_count(upload_id.value()), 2u);

    auto done = store_->complete_multipart_upload(
        "vectors", "b.bin", upload_id.value(),
        {{1, tag1.value()}, {2, tag2.value()}});

    ASSERT_TRUE(done.has_value()) << done.error().message;
    auto expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(store_->object_data("vectors", "b.bin"), expected);
    EXPECT_EQ(store_->pending_upload_count(), 0u);
}

TEST_F(MemoryObjectStoreTest, CompletionWithNoPartsCreatesEmptyObject) {
    auto upload_id = store_->create_multipart_upload("vectors", "empty.bin");
    ASSERT_TRUE(upload_id.has_value());

    ASSERT_TRUE(store_->complete_multipart_upload("vectors", "empty.bin",
                                                  upload_id.value(), {}).has_value());

    auto stored = store_->object_data("vectors", "empty.bin");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->empty());
}

TEST_F(MemoryObjectStoreTest, ReuploadedPartReplacesPrevious) {
    auto upload_id = store_->create_multipart_upload("vectors", "c.bin").value();
    ASSERT_TRUE(store_->upload_part("vectors", "c.bin", upload_id, 1, make_payload(8, 1)).has_value());
    auto tag = store_->upload_part("vectors", "c.bin", upload_id, 1, make_payload(8, 9));
    ASSERT_TRUE(tag.has_value());

    EXPECT_EQ(store_->uploaded_part_count(upload_id), 1u);
    ASSERT_TRUE(store_->complete_multipart_upload("vectors", "c.bin", upload_id,
                                                  {{1, tag.value()}}).has_value());
    EXPECT_EQ(store_->object_data("vectors", "c.bin"), make_payload(8, 9));
}

TEST_F(MemoryObjectStoreTest, CompletionRejectsBadPartLists) {
    auto upload_id = store_->create_multipart_upload("vectors", "d.bin").value();
    auto tag1 = store_->upload_part("vectors", "d.bin", upload_id, 1, make_payload(4, 1)).value();
    auto tag2 = store_->upload_part("vectors", "d.bin", upload_id, 2, make_payload(4, 2)).value();

    auto unordered = store_->complete_multipart_upload(
        "vectors", "d.bin", upload_id, {{2, tag2}, {1, tag1}});
    ASSERT_FALSE(unordered.has_value());
    EXPECT_EQ(unordered.error().code, error_code::invalid_part);

    auto wrong_tag = store_->complete_multipart_upload(
        "vectors", "d.bin", upload_id, {{1, tag2}});
    ASSERT_FALSE(wrong_tag.has_value());
    EXPECT_EQ(wrong_tag.error().code, error_code::invalid_part);

    auto unknown = store_->complete_multipart_upload(
        "vectors", "d.bin", upload_id, {{1, tag1}, {3, tag2}});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, error_code::invalid_part);

    EXPECT_EQ(store_->pending_upload_count(), 1u);
    EXPECT_FALSE(store_->object_data("vectors", "d.bin").has_value());
}

TEST_F(MemoryObjectStoreTest, UnknownUploadIsRejected) {
    auto part = store_->upload_part("vectors", "e.bin", "upload-404", 1, make_payload(4));
    ASSERT_FALSE(part.has_value());
    EXPECT_EQ(part.error().code, error_code::upload_not_found);

    auto upload_id = store_->create_multipart_upload("vectors", "e.bin").value();
    auto other_key = store_->upload_part("vectors", "f.bin", upload_id, 1, make_payload(4));
    ASSERT_FALSE(other_key.has_value());
    EXPECT_EQ(other_key.error().code, error_code::upload_not_found);

    auto zero = store_->upload_part("vectors", "e.bin", upload_id, 0, make_payload(4));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, error_code::invalid_part);
}

TEST_F(MemoryObjectStoreTest, CreateRequiresBucketAndKey) {
    auto upload_id = store_->create_multipart_upload("", "x");

    ASSERT_FALSE(upload_id.has_value());
    EXPECT_EQ(upload_id.error().code, error_code::invalid_argument);
}

TEST_F(MemoryObjectStoreTest, ConcurrentUploadsGetDistinctIds) {
    constexpr int count = 16;
    std::vector<std::string> ids(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i) {
        threads.emplace_back([&, i] {
            auto id = store_->create_multipart_upload("vectors", "k" + std::to_string(i));
            if (id) {
                ids[i] = id.value();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::sort(ids.begin(), ids.end());
    EXPECT_TRUE(std::unique(ids.begin(), ids.end()) == ids.end());
    EXPECT_EQ(store_->pending_upload_count(), static_cast<size_t>(count));
}

}  // namespace kcenon::vector_transfer::test
