/**
 * @file upload_state_store.cpp
 * @brief Implementation of upload_state_store
 */

#include <kcenon/vector_transfer/upload/upload_state_store.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace kcenon::vector_transfer {

// ============================================================================
// upload_state_store_config implementation
// ============================================================================

upload_state_store_config::upload_state_store_config()
    : state_directory(std::filesystem::temp_directory_path() / "vector_trans_states") {
}

upload_state_store_config::upload_state_store_config(std::filesystem::path dir)
    : state_directory(std::move(dir)) {
}

namespace {

auto is_valid_name(const std::string& name) -> bool {
    if (name.empty() || name.front() == '.') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    });
}

auto check_name(const std::string& name) -> result<void> {
    if (!is_valid_name(name)) {
        return unexpected(error(error_code::invalid_argument,
            "invalid state name: '" + name + "'"));
    }
    return {};
}

auto get_state_file_path(const std::filesystem::path& dir, const std::string& name)
    -> std::filesystem::path {
    return dir / (name + ".json");
}

}  // namespace

// ============================================================================
// upload_state_store::impl
// ============================================================================

class upload_state_store::impl {
public:
    explicit impl(const upload_state_store_config& cfg)
        : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);
        if (ec) {
            VT_LOG_WARN(log_category::state,
                "Failed to create state directory " + config_.state_directory.string() +
                ": " + ec.message());
        }
    }

    auto save_state(const std::string& name, const upload_state& state) -> result<void> {
        if (auto valid = check_name(name); !valid) {
            return valid;
        }

        std::unique_lock lock(mutex_);

        VT_LOG_DEBUG(log_category::state,
            "Saving upload state '" + name + "' (" +
            std::to_string(state.parts.size()) + " parts, " +
            std::to_string(state.uploaded_bytes) + " bytes)");

        auto written = write_file(name, state.to_json());
        if (!written) {
            return written;
        }

        set_cache_.erase(name);
        cache_[name] = state;
        return {};
    }

    auto load_state(const std::string& name) -> result<upload_state> {
        if (auto valid = check_name(name); !valid) {
            return unexpected(valid.error());
        }

        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(name);
            if (it != cache_.end()) {
                VT_LOG_TRACE(log_category::state, "State found in cache: " + name);
                return it->second;
            }
        }

        auto text = read_file(name);
        if (!text) {
            return unexpected(text.error());
        }

        auto state = upload_state::from_json(text.value());
        if (!state) {
            VT_LOG_ERROR(log_category::state,
                "Failed to parse upload state '" + name + "': " + state.error().message);
            return state;
        }

        VT_LOG_DEBUG(log_category::state,
            "Upload state recovered: " + name + " (" +
            std::to_string(state.value().parts.size()) + " parts committed)");

        {
            std::unique_lock lock(mutex_);
            cache_[name] = state.value();
        }
        return state;
    }

    auto save_set_state(const std::string& name, const multi_upload_state& state)
        -> result<void> {
        if (auto valid = check_name(name); !valid) {
            return valid;
        }

        std::unique_lock lock(mutex_);

        VT_LOG_DEBUG(log_category::state,
            "Saving upload set state '" + name + "' (" +
            std::to_string(state.uploads.size()) + " uploads)");

        auto written = write_file(name, state.to_json());
        if (!written) {
            return written;
        }

        cache_.erase(name);
        set_cache_[name] = state;
        return {};
    }

    auto load_set_state(const std::string& name) -> result<multi_upload_state> {
        if (auto valid = check_name(name); !valid) {
            return unexpected(valid.error());
        }

        {
            std::shared_lock lock(mutex_);
            auto it = set_cache_.find(name);
            if (it != set_cache_.end()) {
                return it->second;
            }
        }

        auto text = read_file(name);
        if (!text) {
            return unexpected(text.error());
        }

        auto state = multi_upload_state::from_json(text.value());
        if (!state) {
            VT_LOG_ERROR(log_category::state,
                "Failed to parse upload set state '" + name + "': " + state.error().message);
            return state;
        }

        {
            std::unique_lock lock(mutex_);
            set_cache_[name] = state.value();
        }
        return state;
    }

    auto delete_state(const std::string& name) -> result<void> {
        if (auto valid = check_name(name); !valid) {
            return valid;
        }

        std::unique_lock lock(mutex_);

        VT_LOG_DEBUG(log_category::state, "Deleting upload state: " + name);

        cache_.erase(name);
        set_cache_.erase(name);

        auto path = get_state_file_path(config_.state_directory, name);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            VT_LOG_ERROR(log_category::state,
                "Failed to delete state file: " + path.string() + " (" + ec.message() + ")");
            return unexpected(error(error_code::file_write_error,
                "failed to delete state file: " + ec.message()));
        }
        return {};
    }

    auto has_state(const std::string& name) const -> bool {
        if (!is_valid_name(name)) {
            return false;
        }
        {
            std::shared_lock lock(mutex_);
            if (cache_.count(name) != 0 || set_cache_.count(name) != 0) {
                return true;
            }
        }
        std::error_code ec;
        return std::filesystem::exists(get_state_file_path(config_.state_directory, name), ec);
    }

    auto list_states() const -> std::vector<std::string> {
        std::vector<std::string> names;

        std::error_code ec;
        std::filesystem::directory_iterator it(config_.state_directory, ec);
        if (ec) {
            VT_LOG_DEBUG(log_category::state,
                "State directory not readable: " + config_.state_directory.string());
            return names;
        }

        for (const auto& entry : it) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            auto name = entry.path().stem().string();
            if (is_valid_name(name)) {
                names.push_back(std::move(name));
            }
        }

        std::sort(names.begin(), names.end());
        return names;
    }

    auto cleanup_expired_states() -> std::size_t {
        VT_LOG_DEBUG(log_category::state, "Cleaning up expired upload states");

        const auto cutoff = std::filesystem::file_time_type::clock::now() - config_.state_ttl;
        std::size_t removed = 0;

        for (const auto& name : list_states()) {
            auto path = get_state_file_path(config_.state_directory, name);
            std::error_code ec;
            auto modified = std::filesystem::last_write_time(path, ec);
            if (ec || modified >= cutoff) {
                continue;
            }

            auto deleted = delete_state(name);
            if (deleted) {
                ++removed;
            }
        }

        if (removed > 0) {
            VT_LOG_INFO(log_category::state,
                "Removed " + std::to_string(removed) + " expired upload states");
        }
        return removed;
    }

    [[nodiscard]] auto config() const -> const upload_state_store_config& {
        return config_;
    }

private:
    // Caller holds the unique lock.
    auto write_file(const std::string& name, const std::string& json) -> result<void> {
        auto path = get_state_file_path(config_.state_directory, name);
        auto temp_path = path;
        temp_path += ".tmp";

        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file) {
                VT_LOG_ERROR(log_category::state,
                    "Failed to open state file for writing: " + temp_path.string());
                return unexpected(error(error_code::file_write_error,
                    "failed to open state file for writing: " + temp_path.string()));
            }
            file << json;
            file.flush();
            if (!file) {
                VT_LOG_ERROR(log_category::state,
                    "Failed to write state file: " + temp_path.string());
                return unexpected(error(error_code::file_write_error,
                    "failed to write state file: " + temp_path.string()));
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            VT_LOG_ERROR(log_category::state,
                "Failed to replace state file " + path.string() + ": " + ec.message());
            std::filesystem::remove(temp_path, ec);
            return unexpected(error(error_code::file_write_error,
                "failed to replace state file: " + path.string()));
        }

        VT_LOG_TRACE(log_category::state, "State persisted to: " + path.string());
        return {};
    }

    auto read_file(const std::string& name) const -> result<std::string> {
        auto path = get_state_file_path(config_.state_directory, name);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            VT_LOG_DEBUG(log_category::state, "State file not found: " + path.string());
            return unexpected(error(error_code::file_not_found,
                "state file not found: " + path.string()));
        }

        std::ifstream file(path);
        if (!file) {
            VT_LOG_ERROR(log_category::state, "Failed to open state file: " + path.string());
            return unexpected(error(error_code::file_read_error,
                "failed to open state file: " + path.string()));
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    upload_state_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, upload_state> cache_;
    std::unordered_map<std::string, multi_upload_state> set_cache_;
};

// ============================================================================
// upload_state_store implementation
// ============================================================================

upload_state_store::upload_state_store(const upload_state_store_config& config)
    : impl_(std::make_unique<impl>(config)) {
}

upload_state_store::~upload_state_store() = default;

upload_state_store::upload_state_store(upload_state_store&&) noexcept = default;
auto upload_state_store::operator=(upload_state_store&&) noexcept
    -> upload_state_store& = default;

auto upload_state_store::save_state(const std::string& name, const upload_state& state)
    -> result<void> {
    return impl_->save_state(name, state);
}

auto upload_state_store::load_state(const std::string& name) -> result<upload_state> {
    return impl_->load_state(name);
}

auto upload_state_store::save_set_state(const std::string& name,
                                        const multi_upload_state& state) -> result<void> {
    return impl_->save_set_state(name, state);
}

auto upload_state_store::load_set_state(const std::string& name)
    -> result<multi_upload_state> {
    return impl_->load_set_state(name);
}

auto upload_state_store::delete_state(const std::string& name) -> result<void> {
    return impl_->delete_state(name);
}

auto upload_state_store::has_state(const std::string& name) const -> bool {
    return impl_->has_state(name);
}

auto upload_state_store::list_states() const -> std::vector<std::string> {
    return impl_->list_states();
}

auto upload_state_store::cleanup_expired_states() -> std::size_t {
    return impl_->cleanup_expired_states();
}

auto upload_state_store::config() const -> const upload_state_store_config& {
    return impl_->config();
}

}  // namespace kcenon::vector_transfer
