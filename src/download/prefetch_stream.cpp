/**
 * @file prefetch_stream.cpp
 * @brief Implementation of prefetch_stream
 */

#include <kcenon/vector_transfer/download/prefetch_stream.h>
#include <kcenon/vector_transfer/core/bounded_queue.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <string>

namespace kcenon::vector_transfer {

namespace {

/**
 * @brief State shared between the consumer and the producer tasks
 *
 * At most one producer task is scheduled at a time. A task reads while the
 * queue has room and then returns its worker; the consumer schedules the
 * next task after it frees a slot.
 */
struct producer_state {
    bounded_queue<stream_item> queue;
    ranged_reader reader;
    std::shared_ptr<adapters::task_pool_interface> pool;
    transfer_log_context log_ctx;

    std::mutex mutex;
    std::condition_variable idle;
    std::future<void> task;
    bool scheduled = false;
    bool done = false;

    producer_state(ranged_reader r, std::size_t depth,
                   std::shared_ptr<adapters::task_pool_interface> p)
        : queue(depth)
        , reader(std::move(r))
        , pool(std::move(p)) {
        log_ctx.bucket = reader.bucket();
        log_ctx.key = reader.key();
    }
};

void wait_for_task(std::future<void>& task, const transfer_log_context& log_ctx) {
    if (!task.valid()) {
        return;
    }
    try {
        task.get();
    } catch (const std::exception& e) {
        auto ctx = log_ctx;
        ctx.error_message = e.what();
        VT_LOG_ERROR_CTX(log_category::prefetch, "Prefetch task ended abnormally", ctx);
    }
}

void run_producer(const std::shared_ptr<producer_state>& state) {
    auto finish = [&state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->scheduled = false;
            state->done = true;
        }
        state->idle.notify_all();
    };

    try {
        while (true) {
            auto item = state->reader.next();
            const bool terminal = !item || !item.value();
            if (!state->queue.push(std::move(item))) {
                VT_LOG_DEBUG_CTX(log_category::prefetch,
                    "Consumer went away, stopping producer", state->log_ctx);
                finish();
                return;
            }
            if (terminal) {
                finish();
                return;
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done || state->queue.size() >= state->queue.capacity()) {
                state->scheduled = false;
                state->idle.notify_all();
                return;
            }
        }
    } catch (const std::exception& e) {
        auto ctx = state->log_ctx;
        ctx.error_message = e.what();
        VT_LOG_ERROR_CTX(log_category::prefetch, "Prefetch producer threw", ctx);
        static_cast<void>(state->queue.push(unexpected(error{
            error_code::task_state_error, std::string("prefetch producer failed: ") + e.what()})));
        finish();
    }
}

/**
 * @brief Submit the next producer task
 *
 * Caller holds state->mutex and the queue has at least one free slot.
 * @return The finished task this one replaces
 */
auto schedule_producer(const std::shared_ptr<producer_state>& state) -> std::future<void> {
    auto previous = std::move(state->task);
    state->scheduled = true;
    try {
        state->task = state->pool->submit_to_stage(
            [state]() { run_producer(state); },
            std::string(adapters::task_stage::prefetch));
    } catch (const std::exception& e) {
        state->scheduled = false;
        state->done = true;
        auto ctx = state->log_ctx;
        ctx.error_message = e.what();
        VT_LOG_ERROR_CTX(log_category::prefetch, "Prefetch task could not be scheduled", ctx);
        static_cast<void>(state->queue.push(unexpected(error{
            error_code::task_state_error,
            std::string("failed to schedule prefetch task: ") + e.what()})));
    }
    return previous;
}

}  // namespace

// ============================================================================
// prefetch_stream::impl
// ============================================================================

struct prefetch_stream::impl {
    std::shared_ptr<producer_state> state;
    bool finished = false;
    bool cancelled = false;
    uint64_t delivered = 0;

    ~impl() { stop(); }

    void resume_producer() {
        std::future<void> previous;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->scheduled || state->done) {
                return;
            }
            previous = schedule_producer(state);
        }
        wait_for_task(previous, state->log_ctx);
    }

    void stop() {
        if (!state) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->done = true;
        }
        state->queue.close();

        std::future<void> task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->idle.wait(lock, [this] { return !state->scheduled; });
            task = std::move(state->task);
        }
        wait_for_task(task, state->log_ctx);
    }
};

prefetch_stream::prefetch_stream(
    ranged_reader reader,
    std::size_t depth,
    std::shared_ptr<adapters::task_pool_interface> pool)
    : impl_(std::make_unique<impl>()) {
    if (depth == 0) {
        depth = download_config::default_prefetch_depth;
    }
    if (!pool) {
        pool = adapters::task_pool_factory::shared_default();
    }

    impl_->state = std::make_shared<producer_state>(std::move(reader), depth, std::move(pool));

    VT_LOG_DEBUG_CTX(log_category::prefetch,
        "Starting prefetch (depth " + std::to_string(depth) + ")", impl_->state->log_ctx);

    std::lock_guard<std::mutex> lock(impl_->state->mutex);
    static_cast<void>(schedule_producer(impl_->state));
}

prefetch_stream::~prefetch_stream() = default;

prefetch_stream::prefetch_stream(prefetch_stream&&) noexcept = default;
auto prefetch_stream::operator=(prefetch_stream&&) noexcept -> prefetch_stream& = default;

auto prefetch_stream::next() -> stream_item {
    if (!impl_) {
        return unexpected(error{error_code::invalid_state, "prefetch stream was moved from"});
    }
    if (impl_->cancelled) {
        return unexpected(error{error_code::cancelled, "prefetch stream was cancelled"});
    }
    if (impl_->finished) {
        return std::optional<byte_buffer>{};
    }

    auto item = impl_->state->queue.pop();
    if (!item) {
        impl_->finished = true;
        return unexpected(error{error_code::task_state_error,
            "prefetch producer stopped without a terminal result"});
    }

    if (!item->has_value() || !item->value()) {
        impl_->finished = true;
    } else {
        ++impl_->delivered;
        impl_->resume_producer();
    }
    return std::move(*item);
}

void prefetch_stream::cancel() {
    if (!impl_ || impl_->cancelled) {
        return;
    }
    impl_->cancelled = true;
    impl_->stop();
    VT_LOG_DEBUG_CTX(log_category::prefetch,
        "Prefetch cancelled after " + std::to_string(impl_->delivered) + " records",
        impl_->state->log_ctx);
}

auto prefetch_stream::is_finished() const -> bool {
    return !impl_ || impl_->finished || impl_->cancelled;
}

auto prefetch_stream::records_delivered() const -> uint64_t {
    return impl_ ? impl_->delivered : 0;
}

auto prefetch_stream::buffered() const -> std::size_t {
    return impl_ ? impl_->state->queue.size() : 0;
}

}  // namespace kcenon::vector_transfer
