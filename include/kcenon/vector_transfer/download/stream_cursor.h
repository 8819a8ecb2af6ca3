/**
 * @file stream_cursor.h
 * @brief Record offset of a ranged download
 */

#ifndef KCENON_VECTOR_TRANSFER_DOWNLOAD_STREAM_CURSOR_H
#define KCENON_VECTOR_TRANSFER_DOWNLOAD_STREAM_CURSOR_H

#include <kcenon/vector_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace kcenon::vector_transfer {

/**
 * @brief Position of a ranged record stream
 *
 * start_index is the first record not yet delivered. end_index, when set,
 * is the exclusive record bound of the range.
 */
struct stream_cursor {
    uint64_t start_index = 0;
    std::optional<uint64_t> end_index;

    stream_cursor() = default;

    explicit stream_cursor(uint64_t start, std::optional<uint64_t> end = std::nullopt)
        : start_index(start), end_index(end) {}

    /**
     * @brief Check end_index >= start_index
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (end_index && *end_index < start_index) {
            return unexpected(error{error_code::invalid_argument,
                "end index " + std::to_string(*end_index) +
                " precedes start index " + std::to_string(start_index)});
        }
        return {};
    }

    /**
     * @brief Records left in a bounded range, empty for unbounded ones
     */
    [[nodiscard]] auto remaining() const -> std::optional<uint64_t> {
        if (!end_index) {
            return std::nullopt;
        }
        return *end_index > start_index ? *end_index - start_index : 0;
    }

    [[nodiscard]] auto is_exhausted() const -> bool {
        auto left = remaining();
        return left && *left == 0;
    }

    /**
     * @brief Byte range covering the undelivered records
     * @param chunk_size Record size in bytes
     *
     * Must not be called on an exhausted cursor; the bounded form would
     * have its end before its start.
     */
    [[nodiscard]] auto to_byte_range(std::size_t chunk_size) const -> byte_range {
        byte_range range;
        range.start = start_index * chunk_size;
        if (end_index) {
            range.end = *end_index * chunk_size - 1;
        }
        return range;
    }

    [[nodiscard]] auto operator==(const stream_cursor& other) const -> bool = default;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_DOWNLOAD_STREAM_CURSOR_H
