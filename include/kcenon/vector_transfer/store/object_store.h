/**
 * @file object_store.h
 * @brief Abstract object store consumed by the transfer engines
 *
 * The engines only need four operations of an S3-compatible store: a
 * (ranged) streaming GET and the three multipart upload calls. Concrete
 * clients (HTTP, SDK based, in-memory) implement this interface.
 */

#ifndef KCENON_VECTOR_TRANSFER_STORE_OBJECT_STORE_H
#define KCENON_VECTOR_TRANSFER_STORE_OBJECT_STORE_H

#include <kcenon/vector_transfer/core/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::vector_transfer {

/**
 * @brief Pull-based body of a GET response
 *
 * Pieces arrive in network order with arbitrary sizes.
 */
class byte_stream {
public:
    virtual ~byte_stream() = default;

    /**
     * @brief Fetch the next network piece
     * @return Piece, empty optional at end of body, or a read error
     */
    [[nodiscard]] virtual auto next() -> stream_item = 0;
};

/**
 * @brief byte_stream over an owned buffer, served in fixed-size pieces
 */
class buffered_byte_stream : public byte_stream {
public:
    /**
     * @param data Body bytes
     * @param piece_size Size of every piece but the last (0 serves one piece)
     */
    explicit buffered_byte_stream(byte_buffer data, std::size_t piece_size = 0);

    [[nodiscard]] auto next() -> stream_item override;

    [[nodiscard]] auto remaining() const -> std::size_t { return data_.size() - offset_; }

private:
    byte_buffer data_;
    std::size_t piece_size_;
    std::size_t offset_ = 0;
};

/**
 * @brief Result of a GET request
 */
struct get_object_output {
    uint64_t content_length = 0;          ///< Length of the returned body (range length)
    std::unique_ptr<byte_stream> body;
};

/**
 * @brief Part reference passed to complete_multipart_upload
 */
struct completed_part {
    uint32_t part_number = 0;  ///< 1-based
    std::string etag;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Object store operations used by downloads and multipart uploads
 *
 * Implementations must be safe to call from several threads at once.
 * All failures are reported through result; an absent key is reported
 * as error_code::object_not_found.
 */
class object_store {
public:
    virtual ~object_store() = default;

    /**
     * @brief Start streaming an object or a byte range of it
     * @param bucket Bucket name
     * @param key Object key
     * @param range Optional inclusive byte range
     */
    [[nodiscard]] virtual auto get_object(
        const std::string& bucket,
        const std::string& key,
        const std::optional<byte_range>& range) -> result<get_object_output> = 0;

    /**
     * @brief Open a multipart upload
     * @return Upload id
     */
    [[nodiscard]] virtual auto create_multipart_upload(
        const std::string& bucket,
        const std::string& key) -> result<std::string> = 0;

    /**
     * @brief Upload one part of an open multipart upload
     * @param part_number 1-based part number
     * @param body Part bytes
     * @return Completion tag (etag) of the part
     */
    [[nodiscard]] virtual auto upload_part(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        uint32_t part_number,
        byte_buffer body) -> result<std::string> = 0;

    /**
     * @brief Assemble the uploaded parts into the final object
     * @param parts Parts in ascending part-number order
     */
    [[nodiscard]] virtual auto complete_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::string& upload_id,
        const std::vector<completed_part>& parts) -> result<void> = 0;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_STORE_OBJECT_STORE_H
