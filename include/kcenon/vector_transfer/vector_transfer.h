/**
 * @file vector_transfer.h
 * @brief Main header for vector_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the vector_trans_system library.
 * Include this header to access all download and upload functionality.
 *
 * @code
 * #include <kcenon/vector_transfer/vector_transfer.h>
 *
 * using namespace kcenon::vector_transfer;
 *
 * auto store = std::make_shared<memory_object_store>();
 *
 * // Stream fixed-size records, resuming transparently on read failures
 * ranged_reader reader(store, "vectors", "shard-0007.bin",
 *                      stream_cursor{}, download_config{512});
 * prefetch_stream records(std::move(reader));
 *
 * // Upload in parts with one part in flight
 * auto upload = multipart_upload::create(store, "vectors", "out.bin");
 * @endcode
 */

#ifndef KCENON_VECTOR_TRANSFER_VECTOR_TRANSFER_H
#define KCENON_VECTOR_TRANSFER_VECTOR_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/vector_transfer/core/types.h"
#include "kcenon/vector_transfer/core/transfer_config.h"

// Object store
#include "kcenon/vector_transfer/store/object_store.h"
#include "kcenon/vector_transfer/store/memory_object_store.h"

// Download
#include "kcenon/vector_transfer/download/stream_cursor.h"
#include "kcenon/vector_transfer/download/record_chunker.h"
#include "kcenon/vector_transfer/download/ranged_reader.h"
#include "kcenon/vector_transfer/download/prefetch_stream.h"
#include "kcenon/vector_transfer/download/typed_download.h"

// Upload
#include "kcenon/vector_transfer/upload/upload_state.h"
#include "kcenon/vector_transfer/upload/upload_state_store.h"
#include "kcenon/vector_transfer/upload/multipart_upload.h"
#include "kcenon/vector_transfer/upload/upload_set.h"

// Adapters
#include "kcenon/vector_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::vector_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_VECTOR_TRANSFER_H
