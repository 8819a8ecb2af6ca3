/**
 * @file ranged_reader.cpp
 * @brief Implementation of ranged_reader
 */

#include <kcenon/vector_transfer/download/ranged_reader.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <chrono>

namespace kcenon::vector_transfer {

ranged_reader::ranged_reader(
    std::shared_ptr<object_store> store,
    std::string bucket,
    std::string key,
    stream_cursor cursor,
    download_config config)
    : store_(std::move(store))
    , bucket_(std::move(bucket))
    , key_(std::move(key))
    , cursor_(cursor)
    , config_(config) {
}

auto ranged_reader::next() -> stream_item {
    while (true) {
        switch (state_) {
            case reader_state::finished:
                return std::optional<byte_buffer>{};

            case reader_state::requesting: {
                if (!validated_) {
                    if (!store_) {
                        return fail(error{error_code::invalid_argument, "no object store"});
                    }
                    if (auto valid = config_.validate(); !valid) {
                        return fail(valid.error());
                    }
                    if (auto valid = cursor_.validate(); !valid) {
                        return fail(valid.error());
                    }
                    validated_ = true;
                }

                if (cursor_.is_exhausted()) {
                    state_ = reader_state::finished;
                    return std::optional<byte_buffer>{};
                }

                if (auto opened = open_range(); !opened) {
                    auto ctx = log_context();
                    ctx.error_message = opened.error().message;
                    VT_LOG_ERROR_CTX(log_category::download,
                        "Ranged read could not be started", ctx);
                    return fail(opened.error());
                }
                state_ = reader_state::streaming;
                break;
            }

            case reader_state::streaming: {
                auto item = chunker_->next();
                if (!item) {
                    if (auto terminal = handle_failure(item.error())) {
                        return std::move(*terminal);
                    }
                    break;
                }

                if (!item.value()) {
                    auto ctx = log_context();
                    ctx.attempt = static_cast<uint32_t>(total_retries_ + 1);
                    VT_LOG_DEBUG_CTX(log_category::download, "Ranged read finished", ctx);
                    chunker_.reset();
                    state_ = reader_state::finished;
                    return std::optional<byte_buffer>{};
                }

                consecutive_failures_ = 0;
                ++cursor_.start_index;
                return item;
            }
        }
    }
}

auto ranged_reader::open_range() -> result<void> {
    auto range = cursor_.to_byte_range(config_.chunk_size);

    auto ctx = log_context();
    VT_LOG_TRACE_CTX(log_category::download, "GET " + range.to_header(), ctx);

    auto output = store_->get_object(bucket_, key_, range);
    if (!output) {
        return unexpected(output.error());
    }

    chunker_.emplace(std::move(output.value().body), config_.chunk_size, cursor_.remaining());
    return {};
}

auto ranged_reader::handle_failure(const error& err) -> std::optional<stream_item> {
    chunker_.reset();

    if (!is_retryable_read_error(err.code)) {
        auto ctx = log_context();
        ctx.error_message = err.message;
        VT_LOG_ERROR_CTX(log_category::download, "Ranged read failed permanently", ctx);
        return fail(err);
    }

    ++consecutive_failures_;

    auto ctx = log_context();
    ctx.attempt = consecutive_failures_;
    ctx.error_message = err.message;

    if (consecutive_failures_ >= config_.max_consecutive_failures) {
        VT_LOG_ERROR_CTX(log_category::download,
            "Ranged read failed " + std::to_string(consecutive_failures_) +
            " times in a row, giving up", ctx);
        return fail(error{error_code::retries_exhausted,
            "ranged read of " + bucket_ + "/" + key_ + " failed " +
            std::to_string(consecutive_failures_) + " consecutive times at record " +
            std::to_string(cursor_.start_index) + ": " + err.message});
    }

    VT_LOG_WARN_CTX(log_category::download,
        "Ranged read failed, reissuing from cursor", ctx);
    ++total_retries_;
    state_ = reader_state::requesting;
    return std::nullopt;
}

auto ranged_reader::log_context() const -> transfer_log_context {
    transfer_log_context ctx;
    ctx.bucket = bucket_;
    ctx.key = key_;
    ctx.record_index = cursor_.start_index;
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_).count());
    return ctx;
}

auto ranged_reader::fail(error err) -> stream_item {
    chunker_.reset();
    state_ = reader_state::finished;
    return unexpected(std::move(err));
}

}  // namespace kcenon::vector_transfer
