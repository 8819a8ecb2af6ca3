/**
 * @file download_example.cpp
 * @brief Ranged record download with transparent retries and prefetch
 *
 * This example demonstrates:
 * - Reading a record range of an object with a prefetching stream
 * - Surviving connection drops through cursor-based resumption
 * - Downloading a whole object as typed elements
 */

#include <kcenon/vector_transfer/vector_transfer.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::vector_transfer;

namespace {

constexpr std::size_t dimensions = 16;
constexpr std::size_t record_size = dimensions * sizeof(float);

/**
 * @brief Body that drops the connection after a number of pieces
 */
class dropping_stream : public byte_stream {
public:
    dropping_stream(std::unique_ptr<byte_stream> inner, std::size_t pieces)
        : inner_(std::move(inner)), pieces_left_(pieces) {}

    auto next() -> stream_item override {
        if (pieces_left_ == 0) {
            return unexpected(error{error_code::io_error, "connection reset by peer"});
        }
        --pieces_left_;
        return inner_->next();
    }

private:
    std::unique_ptr<byte_stream> inner_;
    std::size_t pieces_left_;
};

/**
 * @brief Store whose first GET bodies break partway through
 */
class unreliable_store : public memory_object_store {
public:
    explicit unreliable_store(int drops) : memory_object_store(memory_store_config{1000}),
                                           drops_left_(drops) {}

    auto get_object(const std::string& bucket,
                    const std::string& key,
                    const std::optional<byte_range>& range) -> result<get_object_output> override {
        auto output = memory_object_store::get_object(bucket, key, range);
        if (output && drops_left_.fetch_sub(1) > 0) {
            output.value().body = std::make_unique<dropping_stream>(
                std::move(output.value().body), 3);
        }
        return output;
    }

private:
    std::atomic<int> drops_left_;
};

auto make_embeddings(std::size_t count) -> byte_buffer {
    std::vector<float> values(count * dimensions);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i / dimensions) + static_cast<float>(i % dimensions) / 100.0f;
    }
    byte_buffer data(values.size() * sizeof(float));
    std::memcpy(data.data(), values.data(), data.size());
    return data;
}

}  // namespace

int main(int argc, char* argv[]) {
    uint64_t first = 100;
    uint64_t last = 400;
    std::size_t total = 1000;

    if (argc == 3) {
        first = std::stoull(argv[1]);
        last = std::stoull(argv[2]);
    } else if (argc != 1) {
        std::cout << "Usage: " << argv[0] << " [first_record end_record]" << std::endl;
        return 1;
    }
    if (last > total || first > last) {
        std::cerr << "Error: range must lie within [0, " << total << "]" << std::endl;
        return 1;
    }

    get_logger().initialize();

    auto store = std::make_shared<unreliable_store>(2);
    store->put_object("vectors", "embeddings.f32", make_embeddings(total));

    // Ranged streaming read
    std::cout << "Streaming records [" << first << ", " << last << ")" << std::endl;

    download_config config(record_size);
    config.prefetch_depth = 4;
    prefetch_stream stream(
        ranged_reader(store, "vectors", "embeddings.f32", stream_cursor{first, last}, config),
        config.prefetch_depth);

    uint64_t expected = first;
    for (auto item = stream.next(); ; item = stream.next()) {
        if (!item) {
            std::cerr << "Error: " << item.error().message << std::endl;
            return 1;
        }
        if (!item.value()) {
            break;
        }

        auto vec = decode_records<float>(std::span<const std::byte>(*item.value()));
        if (!vec || vec.value().size() != dimensions ||
            static_cast<uint64_t>(vec.value()[0]) != expected) {
            std::cerr << "Error: record " << expected << " is corrupt" << std::endl;
            return 1;
        }
        ++expected;
    }

    std::cout << "  received " << stream.records_delivered() << " records, "
              << store->get_object_calls() << " GET requests" << std::endl;

    // Whole-object typed read
    auto all = download_vec<float>(*store, "vectors", "embeddings.f32");
    if (!all) {
        std::cerr << "Error: " << all.error().message << std::endl;
        return 1;
    }
    if (!all.value()) {
        std::cerr << "Error: object disappeared" << std::endl;
        return 1;
    }
    std::cout << "Downloaded " << all.value()->size() << " floats ("
              << all.value()->size() / dimensions << " vectors)" << std::endl;

    auto missing = download_vec<float>(*store, "vectors", "missing.f32");
    if (missing && !missing.value()) {
        std::cout << "missing.f32 is absent, as expected" << std::endl;
    }
    return 0;
}
