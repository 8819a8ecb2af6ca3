/**
 * @file upload_state_store.h
 * @brief File-backed persistence of multipart upload progress
 *
 * Saves upload_state and multi_upload_state records as JSON files so that an
 * interrupted upload can be resumed by a later process.
 */

#ifndef KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_STORE_H
#define KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_STORE_H

#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/upload/upload_state.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief Configuration for upload_state_store
 */
struct upload_state_store_config {
    std::filesystem::path state_directory;  ///< Directory for state files
    std::chrono::seconds state_ttl{7 * 86400};  ///< Age after which states are expired

    /**
     * @brief Default constructor using a directory under the system temp path
     */
    upload_state_store_config();

    explicit upload_state_store_config(std::filesystem::path dir);
};

/**
 * @brief Persists upload progress under caller-chosen names
 *
 * Each record is stored as <state_directory>/<name>.json. Names may only
 * contain letters, digits, '.', '_' and '-' and must not start with '.'.
 * Loaded records are cached in memory.
 *
 * @code
 * upload_state_store states(upload_state_store_config{"/var/lib/vt/states"});
 *
 * // after every send() that committed a part
 * auto saved = states.save_state("shard-0007", upload.state());
 *
 * // in a later process
 * auto restored = states.load_state("shard-0007");
 * if (restored) {
 *     auto upload = multipart_upload::resume(store, restored.value());
 * }
 * @endcode
 */
class upload_state_store {
public:
    explicit upload_state_store(const upload_state_store_config& config = {});
    ~upload_state_store();

    upload_state_store(const upload_state_store&) = delete;
    auto operator=(const upload_state_store&) -> upload_state_store& = delete;
    upload_state_store(upload_state_store&&) noexcept;
    auto operator=(upload_state_store&&) noexcept -> upload_state_store&;

    // ========================================================================
    // Single uploads
    // ========================================================================

    [[nodiscard]] auto save_state(const std::string& name, const upload_state& state)
        -> result<void>;

    /**
     * @brief Load a single upload record
     * @return State, error_code::file_not_found if absent,
     *         error_code::state_corrupted if the file does not parse
     */
    [[nodiscard]] auto load_state(const std::string& name) -> result<upload_state>;

    // ========================================================================
    // Upload sets
    // ========================================================================

    [[nodiscard]] auto save_set_state(const std::string& name, const multi_upload_state& state)
        -> result<void>;

    [[nodiscard]] auto load_set_state(const std::string& name) -> result<multi_upload_state>;

    // ========================================================================
    // Management
    // ========================================================================

    /**
     * @brief Remove a record; removing an absent record succeeds
     */
    [[nodiscard]] auto delete_state(const std::string& name) -> result<void>;

    [[nodiscard]] auto has_state(const std::string& name) const -> bool;

    /**
     * @brief Names of all records in the state directory, sorted
     */
    [[nodiscard]] auto list_states() const -> std::vector<std::string>;

    /**
     * @brief Delete records whose files are older than state_ttl
     * @return Number of records removed
     */
    [[nodiscard]] auto cleanup_expired_states() -> std::size_t;

    [[nodiscard]] auto config() const -> const upload_state_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_UPLOAD_UPLOAD_STATE_STORE_H
