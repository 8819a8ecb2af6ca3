/**
 * @file typed_download.cpp
 * @brief Non-template helpers of typed_download.h
 */

#include <kcenon/vector_transfer/download/typed_download.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::vector_transfer {

auto check_alignment(uint64_t length, std::size_t element_size) -> result<uint64_t> {
    if (element_size == 0) {
        return unexpected(error{error_code::invalid_argument, "element size must be non-zero"});
    }
    if (length % element_size != 0) {
        return unexpected(error{error_code::alignment_error,
            "length " + std::to_string(length) + " is not a multiple of element size " +
            std::to_string(element_size)});
    }
    return length / element_size;
}

auto read_exact(byte_stream& source, std::span<std::byte> dest) -> result<std::size_t> {
    std::size_t offset = 0;

    while (true) {
        auto piece = source.next();
        if (!piece) {
            VT_LOG_DEBUG(log_category::download,
                "Body read failed after " + std::to_string(offset) + " of " +
                std::to_string(dest.size()) + " bytes: " + piece.error().message);
            return unexpected(piece.error());
        }
        if (!piece.value()) {
            break;
        }

        const auto& bytes = *piece.value();
        if (bytes.size() > dest.size() - offset) {
            return unexpected(error{error_code::chunk_overflow,
                "piece of " + std::to_string(bytes.size()) + " bytes at offset " +
                std::to_string(offset) + " overflows a " + std::to_string(dest.size()) +
                " byte destination"});
        }

        std::copy(bytes.begin(), bytes.end(), dest.begin() + static_cast<std::ptrdiff_t>(offset));
        offset += bytes.size();
    }

    if (offset != dest.size()) {
        return unexpected(error{error_code::stream_ended_unexpectedly,
            "body ended after " + std::to_string(offset) + " of " +
            std::to_string(dest.size()) + " bytes"});
    }
    return offset;
}

}  // namespace kcenon::vector_transfer
