/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace kcenon::vector_transfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_embeddings(
    std::size_t count, std::size_t dimensions, uint32_t seed) -> std::vector<std::byte> {
    std::vector<float> values(count * dimensions);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::normal_distribution<float> dis(0.0f, 1.0f);

    for (auto& value : values) {
        value = dis(gen);
    }

    std::vector<std::byte> data(values.size() * sizeof(float));
    if (!data.empty()) {
        std::memcpy(data.data(), values.data(), data.size());
    }
    return data;
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::vector_transfer::benchmark
