/**
 * @file resume_upload_example.cpp
 * @brief Multipart upload interrupted mid-way and resumed from saved state
 *
 * This example demonstrates:
 * - Persisting upload state after every send() with upload_state_store
 * - Abandoning an upload object to simulate a crash
 * - Loading the state and continuing from uploaded_bytes
 * - Resuming a whole upload set in one step
 */

#include <kcenon/vector_transfer/vector_transfer.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

using namespace kcenon::vector_transfer;

namespace {

constexpr uint64_t part_size = 256 * 1024;

auto make_payload(std::size_t size, unsigned seed) -> byte_buffer {
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

/**
 * @brief Send a prefix of data, saving the state after every write
 */
auto send_and_checkpoint(multipart_upload& upload,
                         upload_state_store& states,
                         const std::string& name,
                         std::span<const std::byte> data,
                         std::size_t write_size) -> bool {
    while (!data.empty()) {
        auto piece = data.first(std::min(write_size, data.size()));
        data = data.subspan(piece.size());

        auto sent = upload.send(piece);
        if (!sent) {
            std::cerr << "Error: " << sent.error().message << std::endl;
            return false;
        }
        auto saved = states.save_state(name, upload.state());
        if (!saved) {
            std::cerr << "Error: " << saved.error().message << std::endl;
            return false;
        }
    }
    return true;
}

auto single_upload(std::shared_ptr<memory_object_store> store,
                   upload_state_store& states) -> bool {
    const std::string name = "embeddings-shard-0";
    auto payload = make_payload(part_size * 5 + 1234, 1);

    std::cout << "== Single upload (" << payload.size() << " bytes)" << std::endl;

    {
        auto created = multipart_upload::create(store, "vectors", "shard-0.bin",
                                                upload_config{part_size});
        if (!created) {
            std::cerr << "Error: " << created.error().message << std::endl;
            return false;
        }
        auto upload = std::move(created.value());

        // Only the first ~60% is sent before the "crash"
        auto head = std::span<const std::byte>(payload).first(payload.size() * 6 / 10);
        if (!send_and_checkpoint(upload, states, name, head, 50000)) {
            return false;
        }
        std::cout << "  interrupted with " << upload.state().uploaded_bytes
                  << " bytes committed" << std::endl;
    }

    auto restored = states.load_state(name);
    if (!restored) {
        std::cerr << "Error: " << restored.error().message << std::endl;
        return false;
    }
    const auto offset = restored.value().uploaded_bytes;
    std::cout << "  resuming at byte " << offset << " (part "
              << restored.value().parts.size() + 1 << ")" << std::endl;

    auto resumed = multipart_upload::resume(store, restored.value());
    if (!resumed) {
        std::cerr << "Error: " << resumed.error().message << std::endl;
        return false;
    }
    auto upload = std::move(resumed.value());

    auto tail = std::span<const std::byte>(payload).subspan(static_cast<std::size_t>(offset));
    if (!send_and_checkpoint(upload, states, name, tail, 50000)) {
        return false;
    }
    auto done = std::move(upload).complete();
    if (!done) {
        std::cerr << "Error: " << done.error().message << std::endl;
        return false;
    }

    auto removed = states.delete_state(name);
    if (!removed) {
        std::cerr << "Warning: " << removed.error().message << std::endl;
    }

    auto stored = store->object_data("vectors", "shard-0.bin");
    bool ok = stored && *stored == payload;
    std::cout << "  completed, object " << (ok ? "matches" : "DIFFERS") << std::endl;
    return ok;
}

auto set_upload(std::shared_ptr<memory_object_store> store,
                upload_state_store& states) -> bool {
    const std::string name = "embeddings-batch";
    constexpr std::size_t shards = 3;
    std::vector<byte_buffer> payloads;
    for (std::size_t i = 0; i < shards; ++i) {
        payloads.push_back(make_payload(part_size * (i + 2) + 17, static_cast<unsigned>(i + 10)));
    }

    std::cout << "== Upload set (" << shards << " shards)" << std::endl;

    {
        auto created = upload_set::create(store, "vectors", "batch/shard-", shards,
                                          upload_config{part_size});
        if (!created) {
            std::cerr << "Error: " << created.error().message << std::endl;
            return false;
        }
        auto set = std::move(created.value());
        for (std::size_t i = 0; i < shards; ++i) {
            auto half = std::span<const std::byte>(payloads[i]).first(payloads[i].size() / 2);
            auto sent = set.send(i, half);
            if (!sent) {
                std::cerr << "Error: " << sent.error().message << std::endl;
                return false;
            }
        }
        auto saved = states.save_set_state(name, set.states());
        if (!saved) {
            std::cerr << "Error: " << saved.error().message << std::endl;
            return false;
        }
        std::cout << "  interrupted after sending half of every shard" << std::endl;
    }

    auto restored = states.load_set_state(name);
    if (!restored) {
        std::cerr << "Error: " << restored.error().message << std::endl;
        return false;
    }
    auto resumed = upload_set::resume(store, restored.value());
    if (!resumed) {
        std::cerr << "Error: " << resumed.error().message << std::endl;
        return false;
    }
    auto set = std::move(resumed.value());

    for (std::size_t i = 0; i < shards; ++i) {
        auto offset = restored.value().uploads[i].uploaded_bytes;
        std::cout << "  shard " << i << " resumes at byte " << offset << std::endl;
        auto sent = set.send(i, std::span<const std::byte>(payloads[i])
                                    .subspan(static_cast<std::size_t>(offset)));
        if (!sent) {
            std::cerr << "Error: " << sent.error().message << std::endl;
            return false;
        }
    }

    auto done = std::move(set).complete();
    if (!done) {
        std::cerr << "Error: " << done.error().message << std::endl;
        return false;
    }

    auto removed = states.delete_state(name);
    if (!removed) {
        std::cerr << "Warning: " << removed.error().message << std::endl;
    }

    bool ok = true;
    for (std::size_t i = 0; i < shards; ++i) {
        auto stored = store->object_data("vectors", "batch/shard-" + std::to_string(i));
        ok = ok && stored && *stored == payloads[i];
    }
    std::cout << "  completed, objects " << (ok ? "match" : "DIFFER") << std::endl;
    return ok;
}

}  // namespace

int main() {
    get_logger().initialize();

    upload_state_store states(upload_state_store_config{
        std::filesystem::temp_directory_path() / "vector_trans_resume_example"});
    std::cout << "State directory: " << states.config().state_directory << std::endl;

    auto store = std::make_shared<memory_object_store>();

    if (!single_upload(store, states) || !set_upload(store, states)) {
        return 1;
    }

    auto expired = states.cleanup_expired_states();
    std::cout << "Removed " << expired << " expired state records" << std::endl;
    return 0;
}
