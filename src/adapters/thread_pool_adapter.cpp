// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Task pool adapter implementation for vector_trans_system
 */

#include "kcenon/vector_transfer/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::vector_transfer::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_task_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_task_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

thread_system_task_adapter::thread_system_task_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_task_adapter::~thread_system_task_adapter() = default;

thread_system_task_adapter::thread_system_task_adapter(
    thread_system_task_adapter&&) noexcept = default;

thread_system_task_adapter& thread_system_task_adapter::operator=(
    thread_system_task_adapter&&) noexcept = default;

std::shared_ptr<thread_system_task_adapter>
thread_system_task_adapter::create_default(size_t worker_count,
                                           const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_task_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_task_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "vector_transfer_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

std::future<void> thread_system_task_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker->increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise, tracker = pimpl_->tracker,
                         stage = stage_name]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        tracker->decrement(stage);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), stage_name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_task_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_task_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_task_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_task_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_task_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_task_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_task_pool implementation
// ============================================================================

// Shared with running tasks so they may outlive the pool object
struct async_task_pool::impl {
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;
};

async_task_pool::async_task_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [pimpl = pimpl_, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

std::future<void> async_task_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [pimpl = pimpl_, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              pimpl->tracker.decrement(stage);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                          pimpl->tracker.decrement(stage);
                      });
}

size_t async_task_pool::worker_count() const {
    return default_worker_count();
}

bool async_task_pool::is_running() const { return true; }

size_t async_task_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_task_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_task_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_task_pool>();
#endif
}

std::shared_ptr<task_pool_interface> task_pool_factory::shared_default() {
    static const std::shared_ptr<task_pool_interface> pool = create();
    return pool;
}

}  // namespace kcenon::vector_transfer::adapters
