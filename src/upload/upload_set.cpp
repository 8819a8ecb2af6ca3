/**
 * @file upload_set.cpp
 * @brief Implementation of upload_set
 */

#include <kcenon/vector_transfer/upload/upload_set.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <mutex>

namespace kcenon::vector_transfer {

struct upload_set::slot {
    mutable std::mutex mutex;
    multipart_upload upload;

    explicit slot(multipart_upload u) : upload(std::move(u)) {}
};

upload_set::upload_set(std::vector<std::unique_ptr<slot>> slots)
    : slots_(std::move(slots)) {
}

upload_set::~upload_set() = default;

upload_set::upload_set(upload_set&&) noexcept = default;
auto upload_set::operator=(upload_set&&) noexcept -> upload_set& = default;

auto upload_set::create(
    std::shared_ptr<object_store> store,
    const std::string& bucket,
    const std::string& prefix,
    std::size_t count,
    const upload_config& config,
    std::shared_ptr<adapters::task_pool_interface> pool) -> result<upload_set> {
    if (!pool) {
        pool = adapters::task_pool_factory::shared_default();
    }

    std::vector<std::unique_ptr<slot>> slots;
    slots.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        auto key = prefix + std::to_string(i);
        auto upload = multipart_upload::create(store, bucket, key, config, pool);
        if (!upload) {
            transfer_log_context ctx;
            ctx.bucket = bucket;
            ctx.key = key;
            ctx.error_message = upload.error().message;
            VT_LOG_ERROR_CTX(log_category::upload,
                "Upload set creation failed at index " + std::to_string(i), ctx);
            return unexpected(upload.error());
        }
        slots.push_back(std::make_unique<slot>(std::move(upload.value())));
    }

    transfer_log_context ctx;
    ctx.bucket = bucket;
    ctx.key = prefix;
    VT_LOG_INFO_CTX(log_category::upload,
        "Upload set created with " + std::to_string(count) + " uploads", ctx);
    return upload_set(std::move(slots));
}

auto upload_set::resume(
    std::shared_ptr<object_store> store,
    const multi_upload_state& state,
    std::shared_ptr<adapters::task_pool_interface> pool) -> result<upload_set> {
    if (!pool) {
        pool = adapters::task_pool_factory::shared_default();
    }

    std::vector<std::unique_ptr<slot>> slots;
    slots.reserve(state.uploads.size());

    for (std::size_t i = 0; i < state.uploads.size(); ++i) {
        auto upload = multipart_upload::resume(store, state.uploads[i], pool);
        if (!upload) {
            return unexpected(error{upload.error().code,
                "upload " + std::to_string(i) + " of set: " + upload.error().message});
        }
        slots.push_back(std::make_unique<slot>(std::move(upload.value())));
    }

    VT_LOG_INFO(log_category::upload,
        "Upload set resumed with " + std::to_string(slots.size()) + " uploads");
    return upload_set(std::move(slots));
}

auto upload_set::send(std::size_t index, std::span<const std::byte> data) -> result<void> {
    if (index >= slots_.size()) {
        return unexpected(error{error_code::invalid_argument,
            "upload index " + std::to_string(index) + " out of range (size " +
            std::to_string(slots_.size()) + ")"});
    }

    auto& entry = *slots_[index];
    std::lock_guard lock(entry.mutex);
    auto sent = entry.upload.send(data);
    if (!sent) {
        return unexpected(sent.error());
    }
    return {};
}

auto upload_set::states() const -> multi_upload_state {
    multi_upload_state snapshot;
    snapshot.uploads.reserve(slots_.size());
    for (const auto& entry : slots_) {
        std::lock_guard lock(entry->mutex);
        snapshot.uploads.push_back(entry->upload.state());
    }
    return snapshot;
}

auto upload_set::size() const -> std::size_t {
    return slots_.size();
}

auto upload_set::complete() && -> result<void> {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        auto& entry = *slots_[i];
        std::lock_guard lock(entry.mutex);
        auto done = std::move(entry.upload).complete();
        if (!done) {
            transfer_log_context ctx;
            ctx.bucket = entry.upload.state().bucket;
            ctx.key = entry.upload.state().key;
            ctx.error_message = done.error().message;
            VT_LOG_ERROR_CTX(log_category::upload,
                "Upload set completion stopped at index " + std::to_string(i), ctx);
            return done;
        }
    }
    return {};
}

}  // namespace kcenon::vector_transfer
