/**
 * @file memory_object_store.h
 * @brief In-process object store with multipart upload support
 */

#ifndef KCENON_VECTOR_TRANSFER_STORE_MEMORY_OBJECT_STORE_H
#define KCENON_VECTOR_TRANSFER_STORE_MEMORY_OBJECT_STORE_H

#include <kcenon/vector_transfer/store/object_store.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::vector_transfer {

/**
 * @brief Configuration for memory_object_store
 */
struct memory_store_config {
    /// Size of the pieces a GET body is served in (0 = one piece)
    std::size_t stream_piece_size = 64 * 1024;
};

/**
 * @brief object_store kept entirely in memory
 *
 * Follows S3 semantics where the engines depend on them:
 * - part etags are content derived and quoted
 * - completion requires ascending part numbers whose etags match
 * - parts may be re-uploaded under the same number before completion
 *
 * A range starting exactly at the object size yields an empty body; a
 * range starting beyond it fails with error_code::invalid_range.
 *
 * Thread-safe.
 */
class memory_object_store : public object_store {
public:
    explicit memory_object_store(memory_store_config config = {});
    ~memory_object_store() override;

    memory_object_store(const memory_object_store&) = delete;
    auto operator=(const memory_object_store&) -> memory_object_store& = delete;

    [[nodiscard]] auto get_object(
        const std::string& bucket,
        const std::string& key,
        const std::optional<byte_range>& range) -> result<get_object_output> override;

    [[nodiscard]] auto create_multipart_upload(
        const std::string& bucket,
        const std::string& key) -> result<std::string> override;

    [[nodiscard]] auto upload_part(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        uint32_t part_number,
        byte_buffer body) -> result<std::string> override;

    [[nodiscard]] auto complete_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        const std::vector<completed_part>& parts) -> result<void> override;

    /**
     * @brief Store an object directly, replacing any previous one
     */
    void put_object(const std::string& bucket, const std::string& key, byte_buffer data);

    /**
     * @brief Copy of a stored object's bytes
     */
    [[nodiscard]] auto object_data(const std::string& bucket, const std::string& key) const
        -> std::optional<byte_buffer>;

    /**
     * @brief Number of multipart uploads opened and not yet completed
     */
    [[nodiscard]] auto pending_upload_count() const -> std::size_t;

    /**
     * @brief Number of parts received so far for an open upload
     */
    [[nodiscard]] auto uploaded_part_count(const std::string& upload_id) const -> std::size_t;

    /**
     * @brief Total get_object calls served, including failed ones
     */
    [[nodiscard]] auto get_object_calls() const -> uint64_t;

    /**
     * @brief Content derived etag for a part body
     */
    [[nodiscard]] static auto compute_etag(const byte_buffer& body) -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_STORE_MEMORY_OBJECT_STORE_H
