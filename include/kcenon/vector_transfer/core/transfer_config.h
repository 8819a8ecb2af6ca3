/**
 * @file transfer_config.h
 * @brief Configuration for ranged downloads and multipart uploads
 */

#ifndef KCENON_VECTOR_TRANSFER_CORE_TRANSFER_CONFIG_H
#define KCENON_VECTOR_TRANSFER_CORE_TRANSFER_CONFIG_H

#include <kcenon/vector_transfer/config/feature_flags.h>
#include <kcenon/vector_transfer/core/types.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::vector_transfer {

/**
 * @brief Configuration for ranged record downloads
 */
struct download_config {
    /// Default lookahead of the prefetching stream
    static constexpr std::size_t default_prefetch_depth = 2;

    /// Default consecutive failure budget of a ranged reader
    static constexpr uint32_t default_max_consecutive_failures =
        VECTOR_TRANS_DEFAULT_MAX_READ_FAILURES;

    /// Size of one record in bytes
    std::size_t chunk_size = 0;

    /// Consecutive failed reads tolerated before the reader gives up
    uint32_t max_consecutive_failures = default_max_consecutive_failures;

    /// Records buffered ahead of the consumer
    std::size_t prefetch_depth = default_prefetch_depth;

    download_config() = default;

    explicit download_config(std::size_t record_size) : chunk_size(record_size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{
                error_code::invalid_configuration, "chunk size must be non-zero"});
        }
        if (max_consecutive_failures == 0) {
            return unexpected(error{
                error_code::invalid_configuration,
                "max consecutive failures must be at least 1"});
        }
        if (prefetch_depth == 0) {
            return unexpected(error{
                error_code::invalid_configuration, "prefetch depth must be at least 1"});
        }
        return {};
    }
};

/**
 * @brief Configuration for multipart uploads
 */
struct upload_config {
    /// Default part size (512 MiB)
    static constexpr uint64_t default_part_size = VECTOR_TRANS_DEFAULT_PART_SIZE;

    /// Size of every part except possibly the last one
    uint64_t part_size = default_part_size;

    upload_config() = default;

    explicit upload_config(uint64_t size) : part_size(size) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (part_size == 0) {
            return unexpected(error{
                error_code::invalid_configuration, "part size must be non-zero"});
        }
        return {};
    }
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_CORE_TRANSFER_CONFIG_H
