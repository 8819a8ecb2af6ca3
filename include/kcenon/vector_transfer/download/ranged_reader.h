/**
 * @file ranged_reader.h
 * @brief Resumable ranged record reader
 */

#ifndef KCENON_VECTOR_TRANSFER_DOWNLOAD_RANGED_READER_H
#define KCENON_VECTOR_TRANSFER_DOWNLOAD_RANGED_READER_H

#include <kcenon/vector_transfer/core/logging.h>
#include <kcenon/vector_transfer/core/transfer_config.h>
#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/download/record_chunker.h>
#include <kcenon/vector_transfer/download/stream_cursor.h>
#include <kcenon/vector_transfer/store/object_store.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::vector_transfer {

/**
 * @brief Reader state
 */
enum class reader_state {
    requesting,  ///< Next call issues a ranged GET from the cursor
    streaming,   ///< Records are pulled from the open response
    finished     ///< End of sequence or terminal error was returned
};

[[nodiscard]] constexpr auto to_string(reader_state state) -> const char* {
    switch (state) {
        case reader_state::requesting: return "requesting";
        case reader_state::streaming: return "streaming";
        case reader_state::finished: return "finished";
        default: return "unknown";
    }
}

/**
 * @brief Streams fixed-size records of an object and survives read failures
 *
 * The reader issues one ranged GET covering the records from its cursor
 * onwards and regroups the body into records. Each delivered record moves
 * the cursor forward by one. When reading the body fails, the reader
 * drops the response and issues a fresh GET from the cursor, so no record
 * is delivered twice or skipped.
 *
 * Failure policy:
 * - A GET that cannot be initiated (including an absent object) is
 *   returned immediately and never retried.
 * - Protocol violations (partial trailing record) are returned immediately.
 * - Transport failures are retried until max_consecutive_failures happen
 *   in a row; the counter resets whenever a record is delivered. The
 *   final failure is returned as error_code::retries_exhausted.
 *
 * Not thread-safe; use from one thread or move into a prefetch_stream.
 */
class ranged_reader {
public:
    /**
     * @brief Construct a reader
     * @param store Object store
     * @param bucket Bucket name
     * @param key Object key
     * @param cursor First record to read and optional exclusive end
     * @param config Record size and retry budget
     */
    ranged_reader(std::shared_ptr<object_store> store,
                  std::string bucket,
                  std::string key,
                  stream_cursor cursor,
                  download_config config);

    ranged_reader(ranged_reader&&) noexcept = default;
    auto operator=(ranged_reader&&) noexcept -> ranged_reader& = default;

    /**
     * @brief Produce the next record
     * @return Record, empty optional at end of range, or a terminal error
     */
    [[nodiscard]] auto next() -> stream_item;

    [[nodiscard]] auto cursor() const noexcept -> const stream_cursor& { return cursor_; }

    [[nodiscard]] auto state() const noexcept -> reader_state { return state_; }

    [[nodiscard]] auto is_finished() const noexcept -> bool {
        return state_ == reader_state::finished;
    }

    [[nodiscard]] auto consecutive_failures() const noexcept -> uint32_t {
        return consecutive_failures_;
    }

    /**
     * @brief GET requests reissued after failures over the reader's lifetime
     */
    [[nodiscard]] auto total_retries() const noexcept -> uint64_t { return total_retries_; }

    [[nodiscard]] auto bucket() const -> const std::string& { return bucket_; }

    [[nodiscard]] auto key() const -> const std::string& { return key_; }

private:
    auto open_range() -> result<void>;
    /**
     * @brief Classify a read failure
     * @return Terminal item to return, or empty to reissue the GET
     */
    auto handle_failure(const error& err) -> std::optional<stream_item>;
    auto fail(error err) -> stream_item;
    [[nodiscard]] auto log_context() const -> transfer_log_context;

    std::shared_ptr<object_store> store_;
    std::string bucket_;
    std::string key_;
    stream_cursor cursor_;
    download_config config_;
    reader_state state_ = reader_state::requesting;
    std::optional<record_chunker> chunker_;
    uint32_t consecutive_failures_ = 0;
    uint64_t total_retries_ = 0;
    bool validated_ = false;
    std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_DOWNLOAD_RANGED_READER_H
