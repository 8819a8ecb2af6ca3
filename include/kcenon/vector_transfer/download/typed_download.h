/**
 * @file typed_download.h
 * @brief Whole-object and per-record decoding into typed element arrays
 */

#ifndef KCENON_VECTOR_TRANSFER_DOWNLOAD_TYPED_DOWNLOAD_H
#define KCENON_VECTOR_TRANSFER_DOWNLOAD_TYPED_DOWNLOAD_H

#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/store/object_store.h>

#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief Copy a whole stream into a preallocated destination
 * @param source Stream to drain
 * @param dest Destination; every piece lands at its byte offset
 * @return Bytes written (always dest.size() on success)
 *
 * Errors:
 * - error_code::chunk_overflow if the stream delivers more than dest holds
 * - error_code::stream_ended_unexpectedly if it delivers less
 * - errors of the stream itself are passed through
 */
[[nodiscard]] auto read_exact(byte_stream& source, std::span<std::byte> dest)
    -> result<std::size_t>;

/**
 * @brief Check that a byte length splits evenly into elements
 */
[[nodiscard]] auto check_alignment(uint64_t length, std::size_t element_size) -> result<uint64_t>;

/**
 * @brief Download a whole object as an array of T
 * @tparam T Trivially copyable element type
 * @param store Object store
 * @param bucket Bucket name
 * @param key Object key
 * @return Elements, empty optional if the object does not exist, or an error
 *
 * The destination is allocated once from the reported content length.
 * A length that is not a multiple of sizeof(T) fails with
 * error_code::alignment_error before any body byte is read.
 */
template <typename T>
[[nodiscard]] auto download_vec(object_store& store,
                                const std::string& bucket,
                                const std::string& key)
    -> result<std::optional<std::vector<T>>> {
    static_assert(std::is_trivially_copyable_v<T>,
                  "download_vec requires a trivially copyable element type");

    auto output = store.get_object(bucket, key, std::nullopt);
    if (!output) {
        if (output.error().code == error_code::object_not_found) {
            return std::optional<std::vector<T>>{};
        }
        return unexpected(output.error());
    }

    auto count = check_alignment(output.value().content_length, sizeof(T));
    if (!count) {
        return unexpected(error{count.error().code,
            bucket + "/" + key + ": " + count.error().message});
    }

    std::vector<T> elements(static_cast<std::size_t>(count.value()));
    auto written = read_exact(*output.value().body, std::as_writable_bytes(std::span<T>(elements)));
    if (!written) {
        return unexpected(written.error());
    }

    return std::optional<std::vector<T>>{std::move(elements)};
}

/**
 * @brief Reinterpret one record's bytes as elements of T
 * @tparam T Trivially copyable element type
 * @param bytes Record bytes, length must be a multiple of sizeof(T)
 */
template <typename T>
[[nodiscard]] auto decode_records(std::span<const std::byte> bytes) -> result<std::vector<T>> {
    static_assert(std::is_trivially_copyable_v<T>,
                  "decode_records requires a trivially copyable element type");

    auto count = check_alignment(bytes.size(), sizeof(T));
    if (!count) {
        return unexpected(count.error());
    }

    std::vector<T> elements(static_cast<std::size_t>(count.value()));
    if (!bytes.empty()) {
        std::memcpy(elements.data(), bytes.data(), bytes.size());
    }
    return elements;
}

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_DOWNLOAD_TYPED_DOWNLOAD_H
