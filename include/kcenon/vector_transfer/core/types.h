/**
 * @file types.h
 * @brief Core type definitions for vector_trans_system
 */

#ifndef KCENON_VECTOR_TRANSFER_CORE_TYPES_H
#define KCENON_VECTOR_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief Owned run of raw bytes (network piece, record or part body)
 */
using byte_buffer = std::vector<std::byte>;

/**
 * @brief Error codes for vector transfer operations
 */
enum class error_code {
    success = 0,

    // Store errors (-100 to -119)
    store_error = -100,
    object_not_found = -101,
    upload_not_found = -102,
    invalid_part = -103,
    invalid_range = -104,

    // I/O errors (-120 to -139)
    io_error = -120,
    file_read_error = -121,
    file_write_error = -122,
    file_not_found = -123,

    // Protocol errors (-140 to -159)
    alignment_error = -140,
    stream_ended_unexpectedly = -141,
    chunk_overflow = -142,

    // Transfer errors (-160 to -179)
    retries_exhausted = -160,
    create_upload_failed = -161,
    part_upload_failed = -162,
    final_part_failed = -163,
    completion_failed = -164,

    // Task state errors (-180 to -199)
    task_state_error = -180,
    invalid_state = -181,
    cancelled = -182,

    // Configuration errors (-200 to -219)
    invalid_configuration = -200,
    invalid_argument = -201,
    state_corrupted = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
};

/**
 * @brief Broad grouping of error codes
 */
enum class error_kind {
    none,
    store,
    io,
    protocol,
    transfer,
    task_state,
    configuration,
    internal,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::store_error:
            return "store error";
        case error_code::object_not_found:
            return "object not found";
        case error_code::upload_not_found:
            return "upload not found";
        case error_code::invalid_part:
            return "invalid part";
        case error_code::invalid_range:
            return "invalid range";
        case error_code::io_error:
            return "i/o error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::alignment_error:
            return "length not a multiple of element size";
        case error_code::stream_ended_unexpectedly:
            return "stream ended unexpectedly";
        case error_code::chunk_overflow:
            return "chunk overflows destination";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::create_upload_failed:
            return "create upload failed";
        case error_code::part_upload_failed:
            return "part upload failed";
        case error_code::final_part_failed:
            return "final part failed";
        case error_code::completion_failed:
            return "completion failed";
        case error_code::task_state_error:
            return "task state error";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::cancelled:
            return "cancelled";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code to its kind using the numeric ranges above
 */
[[nodiscard]] constexpr auto kind_of(error_code code) -> error_kind {
    const auto value = static_cast<int>(code);
    if (value == 0) return error_kind::none;
    if (value <= -100 && value > -120) return error_kind::store;
    if (value <= -120 && value > -140) return error_kind::io;
    if (value <= -140 && value > -160) return error_kind::protocol;
    if (value <= -160 && value > -180) return error_kind::transfer;
    if (value <= -180 && value > -200) return error_kind::task_state;
    if (value <= -200 && value > -220) return error_kind::configuration;
    return error_kind::internal;
}

/**
 * @brief Whether a failed ranged read may be reissued from the cursor
 *
 * Only transport failures qualify. An absent object and all protocol
 * violations are final.
 */
[[nodiscard]] constexpr auto is_retryable_read_error(error_code code) -> bool {
    if (code == error_code::object_not_found) {
        return false;
    }
    const auto kind = kind_of(code);
    return kind == error_kind::store || kind == error_kind::io;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto kind() const noexcept -> error_kind { return kind_of(code); }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief One element of a pull-based byte or record sequence
 *
 * A value holds the next item, an empty optional marks the end of the
 * sequence and an error is terminal.
 */
using stream_item = result<std::optional<byte_buffer>>;

/**
 * @brief Inclusive byte range for ranged object reads
 */
struct byte_range {
    uint64_t start = 0;
    std::optional<uint64_t> end;  ///< Inclusive last byte, open-ended if unset

    /**
     * @brief Format as an HTTP Range header value
     * @return "bytes=start-" or "bytes=start-end"
     */
    [[nodiscard]] auto to_header() const -> std::string {
        std::string header = "bytes=" + std::to_string(start) + "-";
        if (end) {
            header += std::to_string(*end);
        }
        return header;
    }

    /**
     * @brief Number of bytes the range selects from an object
     * @param object_size Total object size in bytes
     */
    [[nodiscard]] auto length_within(uint64_t object_size) const -> uint64_t {
        if (start >= object_size) {
            return 0;
        }
        uint64_t last = object_size - 1;
        if (end && *end < last) {
            last = *end;
        }
        return last < start ? 0 : last - start + 1;
    }

    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_CORE_TYPES_H
