// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Task pool adapter for vector_trans_system
 *
 * Background work of the library (multipart part uploads, prefetch
 * producers) is submitted through this interface so it can run either on a
 * thread_system pool or on std::async.
 *
 * Features:
 * - Stage-based task tracking (part uploads, prefetch producers)
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::vector_transfer::adapters {

/**
 * @brief Well-known stage names used for task tracking
 */
struct task_stage {
    static constexpr std::string_view part_upload = "part_upload";
    static constexpr std::string_view prefetch = "prefetch";
};

/**
 * @brief Interface for task pool operations in vector_trans_system
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task tracked under a stage name
     * @param task The task to execute
     * @param stage_name Name of the stage (see task_stage)
     * @return Future for the task completion
     *
     * @note Execution is the same as submit(); only the per-stage
     *       pending count differs.
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending or running task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get pending or running task count for a stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_task_adapter : public task_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_task_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "vector_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_task_adapter() override;

    thread_system_task_adapter(const thread_system_task_adapter&) = delete;
    thread_system_task_adapter& operator=(const thread_system_task_adapter&) = delete;

    thread_system_task_adapter(thread_system_task_adapter&&) noexcept;
    thread_system_task_adapter& operator=(thread_system_task_adapter&&) noexcept;

    /**
     * @brief Factory method to create and start a pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_task_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "vector_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread. pending_tasks() counts tasks that have
 * been submitted and not yet finished.
 */
class async_task_pool : public task_pool_interface {
public:
    async_task_pool();
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate task pool adapter
 *
 * Selects thread_system_task_adapter when KCENON_WITH_THREAD_SYSTEM is set,
 * async_task_pool otherwise.
 */
class task_pool_factory {
public:
    /**
     * @brief Create the best available task pool adapter
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "vector_transfer_pool");

    /**
     * @brief Process-wide pool used when callers do not supply one
     *
     * Created on first use and kept alive for the rest of the process.
     */
    [[nodiscard]] static std::shared_ptr<task_pool_interface> shared_default();

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::vector_transfer::adapters
