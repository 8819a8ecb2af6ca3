/**
 * @file multipart_upload.h
 * @brief Buffered multipart upload with one part in flight
 */

#ifndef KCENON_VECTOR_TRANSFER_UPLOAD_MULTIPART_UPLOAD_H
#define KCENON_VECTOR_TRANSFER_UPLOAD_MULTIPART_UPLOAD_H

#include <kcenon/vector_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/vector_transfer/core/transfer_config.h>
#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/store/object_store.h>
#include <kcenon/vector_transfer/upload/upload_state.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace kcenon::vector_transfer {

/**
 * @brief Streams caller bytes into a multipart upload
 *
 * Bytes are buffered until a full part is available; that part is uploaded
 * in the background while the caller keeps sending. At most one part is in
 * flight. Its result is folded into state() before the next part starts,
 * so parts are committed in strictly ascending part number order.
 *
 * Lifecycle:
 * 1. create() or resume()
 * 2. send() any number of times
 * 3. std::move(upload).complete()
 *
 * state() only ever contains committed parts and may be persisted at any
 * time (see upload_state_store) to resume the upload in another process.
 * A resumed producer restarts its input at state().uploaded_bytes.
 *
 * @code
 * auto upload = multipart_upload::create(store, "vectors", "shard-0007.bin",
 *                                        upload_config{64 * 1024 * 1024});
 * if (!upload) { return; }
 *
 * for (const auto& batch : batches) {
 *     auto sent = upload.value().send(std::as_bytes(std::span(batch)));
 *     if (!sent) { break; }
 * }
 * auto done = std::move(upload.value()).complete();
 * @endcode
 *
 * @note Not thread-safe; use upload_set to drive several uploads from
 *       several threads.
 */
class multipart_upload {
public:
    /**
     * @brief Start a new multipart upload
     * @param store Object store receiving the upload
     * @param bucket Target bucket
     * @param key Target key
     * @param config Upload configuration
     * @param pool Task pool for part uploads (shared default if null)
     * @return Upload, or error_code::create_upload_failed if the store
     *         refused to start it
     */
    [[nodiscard]] static auto create(
        std::shared_ptr<object_store> store,
        const std::string& bucket,
        const std::string& key,
        const upload_config& config = {},
        std::shared_ptr<adapters::task_pool_interface> pool = nullptr)
        -> result<multipart_upload>;

    /**
     * @brief Continue an upload from persisted state
     *
     * The store is not contacted. The buffer starts empty.
     */
    [[nodiscard]] static auto resume(
        std::shared_ptr<object_store> store,
        const upload_state& state,
        std::shared_ptr<adapters::task_pool_interface> pool = nullptr)
        -> result<multipart_upload>;

    /**
     * @brief Joins a part still in flight; its result is discarded
     */
    ~multipart_upload();

    multipart_upload(const multipart_upload&) = delete;
    auto operator=(const multipart_upload&) -> multipart_upload& = delete;
    multipart_upload(multipart_upload&&) noexcept;
    auto operator=(multipart_upload&&) noexcept -> multipart_upload&;

    /**
     * @brief Append bytes, starting part uploads as full parts accumulate
     * @return true if at least one part was committed during the call
     *
     * Blocks only when a full part is ready while the previous one is still
     * uploading. A failed part is reported as error_code::part_upload_failed
     * and every later call fails with error_code::invalid_state.
     */
    [[nodiscard]] auto send(std::span<const std::byte> data) -> result<bool>;

    /**
     * @brief Upload the remainder and finalize the object
     *
     * Errors:
     * - error_code::final_part_failed if the in-flight or the final part failed
     * - error_code::completion_failed if the store rejected the completion
     */
    [[nodiscard]] auto complete() && -> result<void>;

    /**
     * @brief Committed progress
     *
     * A moved-from upload reports an empty state.
     */
    [[nodiscard]] auto state() const -> const upload_state&;

    [[nodiscard]] auto buffered_bytes() const -> std::size_t;

    [[nodiscard]] auto has_part_in_flight() const -> bool;

    /**
     * @brief Whether a part failure made the upload unusable
     */
    [[nodiscard]] auto is_failed() const -> bool;

private:
    struct impl;

    explicit multipart_upload(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_UPLOAD_MULTIPART_UPLOAD_H
