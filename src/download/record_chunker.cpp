/**
 * @file record_chunker.cpp
 * @brief Implementation of record_chunker
 */

#include <kcenon/vector_transfer/download/record_chunker.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::vector_transfer {

record_chunker::record_chunker(
    std::unique_ptr<byte_stream> source,
    std::size_t chunk_size,
    std::optional<uint64_t> max_records)
    : source_(std::move(source))
    , chunk_size_(chunk_size)
    , max_records_(max_records) {
}

auto record_chunker::next() -> stream_item {
    if (finished_) {
        return std::optional<byte_buffer>{};
    }

    if (chunk_size_ == 0 || !source_) {
        finished_ = true;
        return unexpected(error{error_code::invalid_configuration,
            chunk_size_ == 0 ? "chunk size must be non-zero" : "chunker has no source"});
    }

    if (max_records_ && records_emitted_ >= *max_records_) {
        finished_ = true;
        return std::optional<byte_buffer>{};
    }

    while (buffered_bytes() < chunk_size_) {
        auto piece = source_->next();
        if (!piece) {
            finished_ = true;
            return unexpected(piece.error());
        }

        if (!piece.value()) {
            finished_ = true;
            if (buffered_bytes() != 0) {
                VT_LOG_DEBUG(log_category::chunker,
                    "Source ended with " + std::to_string(buffered_bytes()) +
                    " bytes of a " + std::to_string(chunk_size_) + " byte record");
                return unexpected(error{error_code::stream_ended_unexpectedly,
                    "stream ended with " + std::to_string(buffered_bytes()) +
                    " leftover bytes (record size " + std::to_string(chunk_size_) + ")"});
            }
            return std::optional<byte_buffer>{};
        }

        // Compact before growing so the buffer stays near one record
        if (read_offset_ > 0) {
            buffer_.erase(buffer_.begin(),
                          buffer_.begin() + static_cast<std::ptrdiff_t>(read_offset_));
            read_offset_ = 0;
        }
        const auto& bytes = *piece.value();
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    ++records_emitted_;
    return std::optional<byte_buffer>{take_record()};
}

auto record_chunker::take_record() -> byte_buffer {
    auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(read_offset_);
    byte_buffer record(first, first + static_cast<std::ptrdiff_t>(chunk_size_));
    read_offset_ += chunk_size_;
    if (read_offset_ == buffer_.size()) {
        buffer_.clear();
        read_offset_ = 0;
    }
    return record;
}

}  // namespace kcenon::vector_transfer
