/**
 * @file test_record_chunker.cpp
 * @brief Unit tests for record_chunker
 */

#include <gtest/gtest.h>

#include <kcenon/vector_transfer/download/record_chunker.h>

#include "../test_fixtures.h"

#include <memory>
#include <vector>

namespace kcenon::vector_transfer::test {

namespace {

class scripted_stream : public byte_stream {
public:
    explicit scripted_stream(std::vector<stream_item> items) : items_(std::move(items)) {}

    auto next() -> stream_item override {
        if (index_ >= items_.size()) {
            return std::optional<byte_buffer>{};
        }
        return items_[index_++];
    }

private:
    std::vector<stream_item> items_;
    std::size_t index_ = 0;
};

auto make_chunker(const byte_buffer& data, std::size_t piece_size, std::size_t chunk_size,
                  std::optional<uint64_t> max_records = std::nullopt) -> record_chunker {
    return record_chunker(std::make_unique<buffered_byte_stream>(data, piece_size),
                          chunk_size, max_records);
}

}  // namespace

class RecordChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// Regrouping
// ============================================================================

TEST_F(RecordChunkerTest, RegroupsUnalignedPiecesIntoExactRecords) {
    auto data = make_index_records(50);
    auto chunker = make_chunker(data, 5, sizeof(uint64_t));

    for (uint64_t i = 0; i < 50; ++i) {
        auto item = chunker.next();
        ASSERT_TRUE(item.has_value()) << item.error().message;
        ASSERT_TRUE(item.value().has_value());
        ASSERT_EQ(item.value()->size(), sizeof(uint64_t));
        EXPECT_EQ(record_value(*item.value()), i);
    }

    auto end = chunker.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end.value().has_value());
    EXPECT_TRUE(chunker.is_finished());
    EXPECT_EQ(chunker.records_emitted(), 50u);
}

TEST_F(RecordChunkerTest, PiecesLargerThanRecordsAreSplit) {
    auto data = make_payload(6 * 12);
    auto chunker = make_chunker(data, 40, 6);

    byte_buffer joined;
    for (int i = 0; i < 12; ++i) {
        auto item = chunker.next();
        ASSERT_TRUE(item.has_value());
        ASSERT_TRUE(item.value().has_value());
        ASSERT_EQ(item.value()->size(), 6u);
        joined.insert(joined.end(), item.value()->begin(), item.value()->end());
        EXPECT_LT(chunker.buffered_bytes(), 40u + 6u);
    }
    EXPECT_EQ(joined, data);
}

TEST_F(RecordChunkerTest, SinglePieceBody) {
    auto data = make_payload(30);
    auto chunker = make_chunker(data, 0, 10);

    for (int i = 0; i < 3; ++i) {
        auto item = chunker.next();
        ASSERT_TRUE(item.has_value());
        ASSERT_TRUE(item.value().has_value());
    }
    auto end = chunker.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end.value().has_value());
}

TEST_F(RecordChunkerTest, EmptyStreamEndsImmediately) {
    auto chunker = make_chunker(byte_buffer{}, 16, 8);

    auto item = chunker.next();
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item.value().has_value());
    EXPECT_EQ(chunker.records_emitted(), 0u);
}

// ============================================================================
// Record limit
// ============================================================================

TEST_F(RecordChunkerTest, StopsAtRecordLimit) {
    auto data = make_index_records(10);
    auto chunker = make_chunker(data, 8, sizeof(uint64_t), 3);

    for (uint64_t i = 0; i < 3; ++i) {
        auto item = chunker.next();
        ASSERT_TRUE(item.has_value());
        ASSERT_TRUE(item.value().has_value());
        EXPECT_EQ(record_value(*item.value()), i);
    }

    auto end = chunker.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end.value().has_value());
}

TEST_F(RecordChunkerTest, ZeroRecordLimitEmitsNothing) {
    auto data = make_index_records(4);
    auto chunker = make_chunker(data, 8, sizeof(uint64_t), 0);

    auto item = chunker.next();
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item.value().has_value());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(RecordChunkerTest, LeftoverBytesAtEndAreAnError) {
    auto data = make_payload(20);
    auto chunker = make_chunker(data, 7, 6);

    for (int i = 0; i < 3; ++i) {
        auto item = chunker.next();
        ASSERT_TRUE(item.has_value());
        ASSERT_TRUE(item.value().has_value());
    }

    auto tail = chunker.next();
    ASSERT_FALSE(tail.has_value());
    EXPECT_EQ(tail.error().code, error_code::stream_ended_unexpectedly);

    // Terminal: afterwards only the end marker
    auto after = chunker.next();
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after.value().has_value());
}

TEST_F(RecordChunkerTest, ZeroChunkSizeIsRejected) {
    auto chunker = make_chunker(make_payload(8), 4, 0);

    auto item = chunker.next();
    ASSERT_FALSE(item.has_value());
    EXPECT_EQ(item.error().code, error_code::invalid_configuration);
}

TEST_F(RecordChunkerTest, SourceErrorIsPassedThrough) {
    std::vector<stream_item> script;
    script.emplace_back(std::optional<byte_buffer>{make_payload(4)});
    script.emplace_back(unexpected(error{error_code::io_error, "socket closed"}));

    record_chunker chunker(std::make_unique<scripted_stream>(std::move(script)), 8);

    auto item = chunker.next();
    ASSERT_FALSE(item.has_value());
    EXPECT_EQ(item.error().code, error_code::io_error);
    EXPECT_EQ(item.error().message, "socket closed");
    EXPECT_TRUE(chunker.is_finished());
}

TEST_F(RecordChunkerTest, EmptyPiecesAreSkipped) {
    std::vector<stream_item> script;
    script.emplace_back(std::optional<byte_buffer>{byte_buffer{}});
    script.emplace_back(std::optional<byte_buffer>{make_payload(8)});
    script.emplace_back(std::optional<byte_buffer>{byte_buffer{}});

    record_chunker chunker(std::make_unique<scripted_stream>(std::move(script)), 8);

    auto item = chunker.next();
    ASSERT_TRUE(item.has_value());
    ASSERT_TRUE(item.value().has_value());
    EXPECT_EQ(item.value()->size(), 8u);

    auto end = chunker.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end.value().has_value());
}

}  // namespace kcenon::vector_transfer::test
