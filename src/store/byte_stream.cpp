/**
 * @file byte_stream.cpp
 * @brief Implementation of buffered_byte_stream
 */

#include <kcenon/vector_transfer/store/object_store.h>

#include <algorithm>

namespace kcenon::vector_transfer {

buffered_byte_stream::buffered_byte_stream(byte_buffer data, std::size_t piece_size)
    : data_(std::move(data)), piece_size_(piece_size) {
}

auto buffered_byte_stream::next() -> stream_item {
    if (offset_ >= data_.size()) {
        return std::optional<byte_buffer>{};
    }

    std::size_t count = remaining();
    if (piece_size_ > 0) {
        count = std::min(count, piece_size_);
    }

    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset_);
    byte_buffer piece(first, first + static_cast<std::ptrdiff_t>(count));
    offset_ += count;
    return std::optional<byte_buffer>{std::move(piece)};
}

}  // namespace kcenon::vector_transfer
