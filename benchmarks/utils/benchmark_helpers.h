/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_VECTOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_VECTOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace kcenon::vector_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate float32 embedding records
     * @param count Number of records
     * @param dimensions Floats per record
     * @param seed Random seed (0 for random)
     * @return Packed little-endian records, count * dimensions * 4 bytes
     */
    static auto generate_embeddings(std::size_t count, std::size_t dimensions, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_object = 1 * MB;
constexpr std::size_t medium_object = 16 * MB;
constexpr std::size_t large_object = 64 * MB;

// Network piece sizes seen from typical HTTP clients
constexpr std::size_t small_piece = 8 * KB;
constexpr std::size_t default_piece = 64 * KB;
constexpr std::size_t large_piece = 1 * MB;

// Record sizes (768 and 1536 float32 dimensions)
constexpr std::size_t record_768 = 768 * 4;
constexpr std::size_t record_1536 = 1536 * 4;
}  // namespace sizes

}  // namespace kcenon::vector_transfer::benchmark

#endif  // KCENON_VECTOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
