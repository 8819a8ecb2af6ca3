/**
 * @file prefetch_stream.h
 * @brief Background lookahead over a ranged_reader
 */

#ifndef KCENON_VECTOR_TRANSFER_DOWNLOAD_PREFETCH_STREAM_H
#define KCENON_VECTOR_TRANSFER_DOWNLOAD_PREFETCH_STREAM_H

#include <kcenon/vector_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/download/ranged_reader.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace kcenon::vector_transfer {

/**
 * @brief Pipelines network reads with consumption of records
 *
 * Producer tasks drain the reader into a bounded queue; the consumer pulls
 * results with next(). Records arrive in reader order. The reader's
 * terminal value (end of range or error) is returned exactly once, after
 * which next() keeps reporting the end.
 *
 * The queue depth bounds how far the producer runs ahead. A producer task
 * returns its pool worker as soon as the queue is full and the next one is
 * submitted when next() frees a slot, so a stream never holds a worker
 * while waiting for its consumer. Destroying the stream, or calling
 * cancel(), closes the queue and waits for a running producer task.
 *
 * @code
 * prefetch_stream stream(ranged_reader(store, "vectors", "shard-0007",
 *                                      stream_cursor{0}, download_config{3072}));
 * for (auto item = stream.next(); item && item.value(); item = stream.next()) {
 *     consume(*item.value());
 * }
 * @endcode
 */
class prefetch_stream {
public:
    /**
     * @brief Start prefetching
     * @param reader Reader to drain (moved into the producer task)
     * @param depth Maximum number of results buffered ahead (0 = default)
     * @param pool Task pool for the producer (null = shared default pool)
     */
    explicit prefetch_stream(
        ranged_reader reader,
        std::size_t depth = download_config::default_prefetch_depth,
        std::shared_ptr<adapters::task_pool_interface> pool = nullptr);

    ~prefetch_stream();

    prefetch_stream(const prefetch_stream&) = delete;
    auto operator=(const prefetch_stream&) -> prefetch_stream& = delete;
    prefetch_stream(prefetch_stream&&) noexcept;
    auto operator=(prefetch_stream&&) noexcept -> prefetch_stream&;

    /**
     * @brief Wait for the next result of the reader
     * @return Record, empty optional at end, or the reader's terminal error.
     *         After cancel() the result is error_code::cancelled.
     */
    [[nodiscard]] auto next() -> stream_item;

    /**
     * @brief Stop the producer and wait for it to exit
     *
     * Buffered records are discarded.
     */
    void cancel();

    [[nodiscard]] auto is_finished() const -> bool;

    /**
     * @brief Records handed to the consumer so far
     */
    [[nodiscard]] auto records_delivered() const -> uint64_t;

    /**
     * @brief Results currently waiting in the queue
     */
    [[nodiscard]] auto buffered() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_DOWNLOAD_PREFETCH_STREAM_H
