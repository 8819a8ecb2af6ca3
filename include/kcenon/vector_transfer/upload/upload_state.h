/**
 * @file upload_state.h
 * @brief Serializable progress of multipart uploads
 */

#ifndef KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_H
#define KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_H

#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/store/object_store.h>

#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief Progress of one multipart upload
 *
 * Holds no live handles, so it can be persisted and later handed to
 * multipart_upload::resume(). parts[i] is the etag of part number i + 1.
 * uploaded_bytes counts committed bytes only; a resumed producer restarts
 * its input at this offset.
 */
struct upload_state {
    std::string bucket;
    std::string key;
    uint64_t part_size = 0;
    std::string upload_id;
    std::vector<std::string> parts;
    uint64_t uploaded_bytes = 0;

    /**
     * @brief Check the fields needed to resume
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Parts in completion order with 1-based part numbers
     */
    [[nodiscard]] auto completed_parts() const -> std::vector<completed_part>;

    /**
     * @brief Serialize as a JSON object
     *
     * Field names: bucket, key, size_per_upload, upload_id, parts,
     * uploaded_bytes.
     */
    [[nodiscard]] auto to_json() const -> std::string;

    [[nodiscard]] static auto from_json(const std::string& json) -> result<upload_state>;

    [[nodiscard]] auto operator==(const upload_state& other) const -> bool = default;
};

/**
 * @brief Progress of every upload of an upload_set, in index order
 */
struct multi_upload_state {
    std::vector<upload_state> uploads;

    /**
     * @brief Serialize as {"uploads": [...]}
     */
    [[nodiscard]] auto to_json() const -> std::string;

    [[nodiscard]] static auto from_json(const std::string& json) -> result<multi_upload_state>;

    [[nodiscard]] auto operator==(const multi_upload_state& other) const -> bool = default;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_H
