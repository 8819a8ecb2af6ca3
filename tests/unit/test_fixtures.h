/**
 * @file test_fixtures.h
 * @brief Shared helpers for unit tests
 *
 * Provides record payload generators, an object store that injects
 * failures into ranged reads and a task pool with a fixed worker count.
 */

#ifndef KCENON_VECTOR_TRANSFER_TESTS_TEST_FIXTURES_H
#define KCENON_VECTOR_TRANSFER_TESTS_TEST_FIXTURES_H

#include <kcenon/vector_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/vector_transfer/store/memory_object_store.h>

#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::vector_transfer::test {

/**
 * @brief Object of count 8-byte records, record i holding the value i
 */
inline auto make_index_records(uint64_t count) -> byte_buffer {
    byte_buffer data(count * sizeof(uint64_t));
    for (uint64_t i = 0; i < count; ++i) {
        std::memcpy(data.data() + i * sizeof(uint64_t), &i, sizeof(uint64_t));
    }
    return data;
}

/**
 * @brief Value stored in an 8-byte record
 */
inline auto record_value(const byte_buffer& record) -> uint64_t {
    uint64_t value = 0;
    if (record.size() == sizeof(value)) {
        std::memcpy(&value, record.data(), sizeof(value));
    }
    return value;
}

/**
 * @brief Deterministic pseudo-random payload
 */
inline auto make_payload(std::size_t size, uint32_t seed = 1) -> byte_buffer {
    byte_buffer data(size);
    uint32_t x = seed * 2654435761u + 1;
    for (auto& b : data) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = static_cast<std::byte>(x & 0xFF);
    }
    return data;
}

inline auto as_span(const byte_buffer& data) -> std::span<const std::byte> {
    return std::span<const std::byte>(data.data(), data.size());
}

/**
 * @brief Body wrapper that fails after a number of pieces
 */
class failing_stream : public byte_stream {
public:
    failing_stream(std::unique_ptr<byte_stream> inner, std::size_t pieces, error failure)
        : inner_(std::move(inner)), pieces_left_(pieces), failure_(std::move(failure)) {}

    auto next() -> stream_item override {
        if (pieces_left_ == 0) {
            return unexpected(failure_);
        }
        --pieces_left_;
        return inner_->next();
    }

private:
    std::unique_ptr<byte_stream> inner_;
    std::size_t pieces_left_;
    error failure_;
};

/**
 * @brief memory_object_store with scripted read failures
 *
 * Records every requested range so tests can check where reads resumed.
 */
class flaky_object_store : public memory_object_store {
public:
    explicit flaky_object_store(memory_store_config config = {})
        : memory_object_store(config) {}

    /**
     * @brief Make the next count bodies fail after pieces_before_failure pieces
     */
    void fail_next_reads(uint32_t count, std::size_t pieces_before_failure,
                         error failure = error{error_code::io_error, "connection reset by peer"}) {
        std::lock_guard lock(mutex_);
        failing_reads_ = count;
        pieces_before_failure_ = pieces_before_failure;
        read_failure_ = std::move(failure);
    }

    /**
     * @brief Make the next count GET requests fail before any body is returned
     */
    void fail_next_requests(uint32_t count,
                            error failure = error{error_code::store_error, "service unavailable"}) {
        std::lock_guard lock(mutex_);
        failing_requests_ = count;
        request_failure_ = std::move(failure);
    }

    auto get_object(const std::string& bucket,
                    const std::string& key,
                    const std::optional<byte_range>& range) -> result<get_object_output> override {
        std::unique_lock lock(mutex_);
        ranges_.push_back(range);
        if (failing_requests_ > 0) {
            --failing_requests_;
            return unexpected(request_failure_);
        }
        const bool fail_body = failing_reads_ > 0;
        if (fail_body) {
            --failing_reads_;
        }
        const auto pieces = pieces_before_failure_;
        const auto failure = read_failure_;
        lock.unlock();

        auto output = memory_object_store::get_object(bucket, key, range);
        if (!output || !fail_body) {
            return output;
        }
        output.value().body = std::make_unique<failing_stream>(
            std::move(output.value().body), pieces, failure);
        return output;
    }

    [[nodiscard]] auto requested_ranges() const -> std::vector<std::optional<byte_range>> {
        std::lock_guard lock(mutex_);
        return ranges_;
    }

private:
    mutable std::mutex mutex_;
    uint32_t failing_reads_ = 0;
    std::size_t pieces_before_failure_ = 0;
    error read_failure_;
    uint32_t failing_requests_ = 0;
    error request_failure_;
    std::vector<std::optional<byte_range>> ranges_;
};

/**
 * @brief Task pool with a fixed number of worker threads and a FIFO job queue
 *
 * Jobs never get a worker of their own, so a job that blocks keeps every
 * later job waiting.
 */
class fixed_worker_pool : public adapters::task_pool_interface {
public:
    explicit fixed_worker_pool(std::size_t workers) {
        for (std::size_t i = 0; i < workers; ++i) {
            workers_.emplace_back([this] { work(); });
        }
    }

    ~fixed_worker_pool() override {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    fixed_worker_pool(const fixed_worker_pool&) = delete;
    fixed_worker_pool& operator=(const fixed_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override {
        std::packaged_task<void()> job(std::move(task));
        auto future = job.get_future();
        {
            std::lock_guard lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
        return future;
    }

    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string&) override {
        return submit(std::move(task));
    }

    [[nodiscard]] size_t worker_count() const override { return workers_.size(); }

    [[nodiscard]] bool is_running() const override { return true; }

    [[nodiscard]] size_t pending_tasks() const override {
        std::lock_guard lock(mutex_);
        return jobs_.size();
    }

    [[nodiscard]] size_t pending_tasks(const std::string&) const override {
        return pending_tasks();
    }

private:
    void work() {
        while (true) {
            std::packaged_task<void()> job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> jobs_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

}  // namespace kcenon::vector_transfer::test

#endif  // KCENON_VECTOR_TRANSFER_TESTS_TEST_FIXTURES_H
