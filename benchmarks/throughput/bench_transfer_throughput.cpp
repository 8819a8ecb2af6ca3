/**
 * @file bench_transfer_throughput.cpp
 * @brief End-to-end throughput of ranged downloads and multipart uploads
 *
 * Both engines run against memory_object_store so the numbers measure the
 * library's own overhead (copies, task hand-offs, queueing).
 */

#include <benchmark/benchmark.h>

#include <kcenon/vector_transfer/vector_transfer.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <memory>
#include <span>
#include <string>

namespace kcenon::vector_transfer::benchmark {

/**
 * @brief Ranged record download, optionally through the prefetch stream
 *
 * Args: object size, record size, prefetch depth (0 = read directly)
 */
static void BM_Download_Records(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto record_size = static_cast<std::size_t>(state.range(1));
    const auto depth = static_cast<std::size_t>(state.range(2));

    auto store = std::make_shared<memory_object_store>();
    const auto usable = object_size - object_size % record_size;
    store->put_object("bench", "records.bin",
                      test_data_generator::generate_random_data(usable, 42));
    auto pool = adapters::task_pool_factory::shared_default();

    for (auto _ : state) {
        ranged_reader reader(store, "bench", "records.bin", stream_cursor{0},
                             download_config{record_size});
        if (depth == 0) {
            for (auto item = reader.next(); item && item.value(); item = reader.next()) {
                ::benchmark::DoNotOptimize(item.value()->data());
            }
        } else {
            prefetch_stream stream(std::move(reader), depth, pool);
            for (auto item = stream.next(); item && item.value(); item = stream.next()) {
                ::benchmark::DoNotOptimize(item.value()->data());
            }
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(usable) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(usable));
}

/**
 * @brief Multipart upload of an object written in fixed-size sends
 *
 * Args: object size, part size, write size
 */
static void BM_Upload_Multipart(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<uint64_t>(state.range(1));
    const auto write_size = static_cast<std::size_t>(state.range(2));

    auto data = test_data_generator::generate_random_data(object_size, 42);
    auto store = std::make_shared<memory_object_store>();
    auto pool = adapters::task_pool_factory::shared_default();

    for (auto _ : state) {
        auto created = multipart_upload::create(store, "bench", "upload.bin",
                                                upload_config{part_size}, pool);
        if (!created) {
            state.SkipWithError("create failed");
            return;
        }
        auto upload = std::move(created.value());

        std::span<const std::byte> remaining(data);
        while (!remaining.empty()) {
            auto piece = remaining.first(std::min(write_size, remaining.size()));
            remaining = remaining.subspan(piece.size());
            if (!upload.send(piece)) {
                state.SkipWithError("send failed");
                return;
            }
        }
        if (!std::move(upload).complete()) {
            state.SkipWithError("complete failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(object_size) + " in " + format_bytes(part_size) + " parts");
}

BENCHMARK(BM_Download_Records)
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::record_768), 0})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::record_768), 2})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::record_768), 16})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::record_1536), 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Upload_Multipart)
    ->Args({static_cast<int64_t>(sizes::medium_object),
            static_cast<int64_t>(4 * sizes::MB),
            static_cast<int64_t>(sizes::default_piece)})
    ->Args({static_cast<int64_t>(sizes::large_object),
            static_cast<int64_t>(8 * sizes::MB),
            static_cast<int64_t>(sizes::large_piece)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::vector_transfer::benchmark
