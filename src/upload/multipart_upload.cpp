/**
 * @file multipart_upload.cpp
 * @brief Implementation of multipart_upload
 */

#include <kcenon/vector_transfer/upload/multipart_upload.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace kcenon::vector_transfer {

namespace {

/**
 * @brief Part uploading in the background
 */
struct pending_part {
    uint32_t part_number = 0;
    uint64_t size = 0;
    std::chrono::steady_clock::time_point started;
    std::future<result<std::string>> outcome;
    std::future<void> task;
};

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

auto make_context(const upload_state& state) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.bucket = state.bucket;
    ctx.key = state.key;
    ctx.upload_id = state.upload_id;
    return ctx;
}

}  // namespace

// ============================================================================
// multipart_upload::impl
// ============================================================================

struct multipart_upload::impl {
    std::shared_ptr<object_store> store;
    std::shared_ptr<adapters::task_pool_interface> pool;
    upload_state state;
    byte_buffer buffer;
    std::optional<pending_part> pending;
    bool failed = false;
    bool completed = false;

    ~impl() {
        if (!pending) {
            return;
        }
        auto ctx = make_context(state);
        ctx.part_number = pending->part_number;
        ctx.bytes = pending->size;
        VT_LOG_WARN_CTX(log_category::upload,
            "Upload dropped with a part in flight, waiting for it and discarding its result",
            ctx);
        auto discarded = join(*pending);
        static_cast<void>(discarded);
        pending.reset();
    }

    /**
     * @brief Wait for a part task and collect its etag
     */
    static auto join(pending_part& part) -> result<std::string> {
        result<std::string> outcome = unexpected(error{
            error_code::task_state_error, "part task produced no result"});
        try {
            outcome = part.outcome.get();
        } catch (const std::exception& e) {
            outcome = unexpected(error{error_code::task_state_error,
                std::string("part task ended abnormally: ") + e.what()});
        }
        if (part.task.valid()) {
            try {
                part.task.get();
            } catch (const std::exception& e) {
                VT_LOG_ERROR(log_category::upload,
                    std::string("Part task reported a failure: ") + e.what());
            }
        }
        return outcome;
    }

    /**
     * @brief Commit the in-flight part if there is one
     * @param wait Block until it finishes; otherwise fold only a finished part
     * @return Whether a part was committed
     */
    auto fold(bool wait) -> result<bool> {
        if (!pending) {
            return false;
        }
        if (!wait &&
            pending->outcome.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }

        pending_part part = std::move(*pending);
        pending.reset();

        auto etag = join(part);

        auto ctx = make_context(state);
        ctx.part_number = part.part_number;
        ctx.bytes = part.size;
        ctx.duration_ms = elapsed_ms(part.started);

        if (!etag) {
            failed = true;
            ctx.error_message = etag.error().message;
            VT_LOG_ERROR_CTX(log_category::upload, "Part upload failed", ctx);
            return unexpected(error{error_code::part_upload_failed,
                "part " + std::to_string(part.part_number) + " of " + state.bucket + "/" +
                state.key + " failed: " + etag.error().message});
        }

        state.parts.push_back(std::move(etag.value()));
        state.uploaded_bytes += part.size;

        VT_LOG_DEBUG_CTX(log_category::upload, "Part committed", ctx);
        return true;
    }

    /**
     * @brief Hand a part body to the task pool
     */
    auto start_part(byte_buffer body) -> result<void> {
        const auto part_number = static_cast<uint32_t>(state.parts.size() + 1);
        const auto size = static_cast<uint64_t>(body.size());

        auto promise = std::make_shared<std::promise<result<std::string>>>();
        pending_part part;
        part.part_number = part_number;
        part.size = size;
        part.started = std::chrono::steady_clock::now();
        part.outcome = promise->get_future();

        auto ctx = make_context(state);
        ctx.part_number = part_number;
        ctx.bytes = size;
        VT_LOG_TRACE_CTX(log_category::upload, "Starting part upload", ctx);

        try {
            part.task = pool->submit_to_stage(
                [store = store, bucket = state.bucket, key = state.key,
                 upload_id = state.upload_id, part_number, body = std::move(body),
                 promise]() mutable {
                    try {
                        promise->set_value(store->upload_part(
                            bucket, key, upload_id, part_number, std::move(body)));
                    } catch (const std::exception& e) {
                        promise->set_value(unexpected(error{error_code::task_state_error,
                            std::string("part upload threw: ") + e.what()}));
                    }
                },
                std::string(adapters::task_stage::part_upload));
        } catch (const std::exception& e) {
            failed = true;
            ctx.error_message = e.what();
            VT_LOG_ERROR_CTX(log_category::upload, "Part upload could not be scheduled", ctx);
            return unexpected(error{error_code::task_state_error,
                std::string("failed to schedule part upload: ") + e.what()});
        }

        pending = std::move(part);
        return {};
    }

    auto check_usable() const -> result<void> {
        if (completed) {
            return unexpected(error{error_code::invalid_state,
                "upload of " + state.bucket + "/" + state.key + " is already completed"});
        }
        if (failed) {
            return unexpected(error{error_code::invalid_state,
                "upload of " + state.bucket + "/" + state.key + " failed earlier"});
        }
        return {};
    }
};

// ============================================================================
// multipart_upload implementation
// ============================================================================

multipart_upload::multipart_upload(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {
}

multipart_upload::~multipart_upload() = default;

multipart_upload::multipart_upload(multipart_upload&&) noexcept = default;
auto multipart_upload::operator=(multipart_upload&&) noexcept -> multipart_upload& = default;

auto multipart_upload::create(
    std::shared_ptr<object_store> store,
    const std::string& bucket,
    const std::string& key,
    const upload_config& config,
    std::shared_ptr<adapters::task_pool_interface> pool) -> result<multipart_upload> {
    if (!store) {
        return unexpected(error{error_code::invalid_argument, "object store must not be null"});
    }
    if (bucket.empty() || key.empty()) {
        return unexpected(error{error_code::invalid_argument, "bucket and key must be non-empty"});
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto upload_id = store->create_multipart_upload(bucket, key);
    if (!upload_id) {
        transfer_log_context ctx;
        ctx.bucket = bucket;
        ctx.key = key;
        ctx.error_message = upload_id.error().message;
        VT_LOG_ERROR_CTX(log_category::upload, "Failed to create multipart upload", ctx);
        return unexpected(error{error_code::create_upload_failed,
            "failed to create multipart upload for " + bucket + "/" + key + ": " +
            upload_id.error().message});
    }

    auto state = std::make_unique<impl>();
    state->store = std::move(store);
    state->pool = pool ? std::move(pool) : adapters::task_pool_factory::shared_default();
    state->state.bucket = bucket;
    state->state.key = key;
    state->state.part_size = config.part_size;
    state->state.upload_id = std::move(upload_id.value());

    auto ctx = make_context(state->state);
    VT_LOG_INFO_CTX(log_category::upload, "Multipart upload created", ctx);
    return multipart_upload(std::move(state));
}

auto multipart_upload::resume(
    std::shared_ptr<object_store> store,
    const upload_state& state,
    std::shared_ptr<adapters::task_pool_interface> pool) -> result<multipart_upload> {
    if (!store) {
        return unexpected(error{error_code::invalid_argument, "object store must not be null"});
    }
    if (auto valid = state.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto resumed = std::make_unique<impl>();
    resumed->store = std::move(store);
    resumed->pool = pool ? std::move(pool) : adapters::task_pool_factory::shared_default();
    resumed->state = state;

    auto ctx = make_context(state);
    ctx.bytes = state.uploaded_bytes;
    VT_LOG_INFO_CTX(log_category::upload,
        "Multipart upload resumed after " + std::to_string(state.parts.size()) + " parts", ctx);
    return multipart_upload(std::move(resumed));
}

auto multipart_upload::send(std::span<const std::byte> data) -> result<bool> {
    if (!impl_) {
        return unexpected(error{error_code::invalid_state, "upload was moved from"});
    }
    if (auto usable = impl_->check_usable(); !usable) {
        return unexpected(usable.error());
    }

    auto committed = impl_->fold(false);
    if (!committed) {
        return committed;
    }
    bool any_committed = committed.value();

    const auto part_size = static_cast<std::size_t>(impl_->state.part_size);
    std::size_t offset = 0;

    while (offset < data.size()) {
        auto room = part_size - impl_->buffer.size();
        auto take = std::min(room, data.size() - offset);
        auto first = data.begin() + static_cast<std::ptrdiff_t>(offset);
        impl_->buffer.insert(impl_->buffer.end(), first,
                             first + static_cast<std::ptrdiff_t>(take));
        offset += take;

        if (impl_->buffer.size() < part_size) {
            continue;
        }

        auto folded = impl_->fold(true);
        if (!folded) {
            return folded;
        }
        any_committed = any_committed || folded.value();

        auto started = impl_->start_part(std::exchange(impl_->buffer, byte_buffer{}));
        if (!started) {
            return unexpected(started.error());
        }
    }

    return any_committed;
}

auto multipart_upload::complete() && -> result<void> {
    if (!impl_) {
        return unexpected(error{error_code::invalid_state, "upload was moved from"});
    }
    if (auto usable = impl_->check_usable(); !usable) {
        return usable;
    }

    auto& self = *impl_;
    auto ctx = make_context(self.state);
    const auto started = std::chrono::steady_clock::now();

    auto folded = self.fold(true);
    if (!folded) {
        return unexpected(error{error_code::final_part_failed, folded.error().message});
    }

    if (!self.buffer.empty()) {
        auto started = self.start_part(std::exchange(self.buffer, byte_buffer{}));
        if (!started) {
            return unexpected(error{error_code::final_part_failed, started.error().message});
        }
        auto final_part = self.fold(true);
        if (!final_part) {
            return unexpected(error{error_code::final_part_failed, final_part.error().message});
        }
    }

    auto parts = self.state.completed_parts();
    auto done = self.store->complete_multipart_upload(
        self.state.bucket, self.state.key, self.state.upload_id, parts);
    if (!done) {
        self.failed = true;
        ctx.error_message = done.error().message;
        ctx.duration_ms = elapsed_ms(started);
        VT_LOG_ERROR_CTX(log_category::upload, "Multipart upload completion failed", ctx);
        return unexpected(error{error_code::completion_failed,
            "failed to complete " + self.state.bucket + "/" + self.state.key + ": " +
            done.error().message});
    }

    self.completed = true;
    ctx.bytes = self.state.uploaded_bytes;
    ctx.duration_ms = elapsed_ms(started);
    VT_LOG_INFO_CTX(log_category::upload,
        "Multipart upload completed with " + std::to_string(parts.size()) + " parts", ctx);
    return {};
}

auto multipart_upload::state() const -> const upload_state& {
    static const upload_state moved_from{};
    return impl_ ? impl_->state : moved_from;
}

auto multipart_upload::buffered_bytes() const -> std::size_t {
    return impl_ ? impl_->buffer.size() : 0;
}

auto multipart_upload::has_part_in_flight() const -> bool {
    return impl_ && impl_->pending.has_value();
}

auto multipart_upload::is_failed() const -> bool {
    return impl_ && impl_->failed;
}

}  // namespace kcenon::vector_transfer
