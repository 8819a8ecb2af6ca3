/**
 * @file upload_set.h
 * @brief Fixed group of multipart uploads addressed by index
 */

#ifndef KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_SET_H
#define KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_SET_H

#include <kcenon/vector_transfer/upload/multipart_upload.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief N multipart uploads under one key prefix
 *
 * Upload i writes key prefix + std::to_string(i). Each upload is guarded by
 * its own mutex, so different indices may be fed from different threads
 * concurrently while sends to the same index are serialized.
 */
class upload_set {
public:
    /**
     * @brief Start count uploads
     *
     * Uploads are created in index order; if one fails the ones already
     * created are dropped and the error is returned.
     */
    [[nodiscard]] static auto create(
        std::shared_ptr<object_store> store,
        const std::string& bucket,
        const std::string& prefix,
        std::size_t count,
        const upload_config& config = {},
        std::shared_ptr<adapters::task_pool_interface> pool = nullptr)
        -> result<upload_set>;

    /**
     * @brief Rebuild a set from persisted state, preserving index order
     */
    [[nodiscard]] static auto resume(
        std::shared_ptr<object_store> store,
        const multi_upload_state& state,
        std::shared_ptr<adapters::task_pool_interface> pool = nullptr)
        -> result<upload_set>;

    ~upload_set();

    upload_set(const upload_set&) = delete;
    auto operator=(const upload_set&) -> upload_set& = delete;
    upload_set(upload_set&&) noexcept;
    auto operator=(upload_set&&) noexcept -> upload_set&;

    /**
     * @brief Send bytes to upload index
     * @return error_code::invalid_argument for an index out of range,
     *         otherwise the upload's own result
     */
    [[nodiscard]] auto send(std::size_t index, std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Snapshot of the committed state of every upload
     */
    [[nodiscard]] auto states() const -> multi_upload_state;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Complete every upload in index order, stopping at the first error
     */
    [[nodiscard]] auto complete() && -> result<void>;

private:
    struct slot;

    explicit upload_set(std::vector<std::unique_ptr<slot>> slots);

    std::vector<std::unique_ptr<slot>> slots_;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_SET_H
