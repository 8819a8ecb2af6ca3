/**
 * @file record_chunker.h
 * @brief Regroups a byte stream into fixed-size records
 */

#ifndef KCENON_VECTOR_TRANSFER_DOWNLOAD_RECORD_CHUNKER_H
#define KCENON_VECTOR_TRANSFER_DOWNLOAD_RECORD_CHUNKER_H

#include <kcenon/vector_transfer/core/types.h>
#include <kcenon/vector_transfer/store/object_store.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::vector_transfer {

/**
 * @brief Turns network pieces of arbitrary size into exact records
 *
 * Every record returned by next() is exactly chunk_size bytes. Bytes are
 * accumulated across pieces until a full record is available. When a
 * maximum record count is given, the chunker stops after that many
 * records without reading further from the source.
 *
 * A source that ends with a partial record left over is a protocol
 * violation (error_code::stream_ended_unexpectedly). Errors from the
 * source are passed through. Any error is terminal: afterwards next()
 * only reports the end of the sequence.
 *
 * @code
 * record_chunker chunker(std::move(output.body), sizeof(float) * 768);
 * while (true) {
 *     auto item = chunker.next();
 *     if (!item) { handle(item.error()); break; }
 *     if (!item.value()) break;
 *     consume(*item.value());
 * }
 * @endcode
 */
class record_chunker {
public:
    /**
     * @brief Construct over a source stream
     * @param source Stream of network pieces (owned)
     * @param chunk_size Record size in bytes
     * @param max_records Stop after this many records, if set
     */
    record_chunker(std::unique_ptr<byte_stream> source,
                   std::size_t chunk_size,
                   std::optional<uint64_t> max_records = std::nullopt);

    record_chunker(record_chunker&&) noexcept = default;
    auto operator=(record_chunker&&) noexcept -> record_chunker& = default;

    /**
     * @brief Produce the next record
     * @return Record, empty optional at end of sequence, or a terminal error
     */
    [[nodiscard]] auto next() -> stream_item;

    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }

    [[nodiscard]] auto records_emitted() const noexcept -> uint64_t { return records_emitted_; }

    /**
     * @brief Bytes received but not yet returned as part of a record
     */
    [[nodiscard]] auto buffered_bytes() const noexcept -> std::size_t {
        return buffer_.size() - read_offset_;
    }

    [[nodiscard]] auto is_finished() const noexcept -> bool { return finished_; }

private:
    auto take_record() -> byte_buffer;

    std::unique_ptr<byte_stream> source_;
    std::size_t chunk_size_;
    std::optional<uint64_t> max_records_;
    uint64_t records_emitted_ = 0;
    byte_buffer buffer_;
    std::size_t read_offset_ = 0;
    bool finished_ = false;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_DOWNLOAD_RECORD_CHUNKER_H
