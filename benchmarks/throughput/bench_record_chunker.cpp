/**
 * @file bench_record_chunker.cpp
 * @brief Benchmarks for regrouping network pieces into records
 */

#include <benchmark/benchmark.h>

#include <kcenon/vector_transfer/download/record_chunker.h>
#include <kcenon/vector_transfer/download/typed_download.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::vector_transfer::benchmark {

/**
 * @brief record_chunker over pieces of a given size
 *
 * Args: object size, piece size, record size
 */
static void BM_RecordChunker_Regroup(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto piece_size = static_cast<std::size_t>(state.range(1));
    const auto record_size = static_cast<std::size_t>(state.range(2));

    const auto usable = object_size - object_size % record_size;
    auto data = test_data_generator::generate_random_data(usable, 42);
    uint64_t records = 0;

    for (auto _ : state) {
        state.PauseTiming();
        auto source = std::make_unique<buffered_byte_stream>(data, piece_size);
        state.ResumeTiming();

        record_chunker chunker(std::move(source), record_size);
        while (true) {
            auto item = chunker.next();
            if (!item) {
                state.SkipWithError("chunker failed");
                return;
            }
            if (!item.value()) {
                break;
            }
            ::benchmark::DoNotOptimize(item.value()->data());
        }
        records = chunker.records_emitted();
    }

    state.SetBytesProcessed(static_cast<int64_t>(usable) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(records) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(usable));
}

/**
 * @brief Whole-object read into a typed vector
 */
static void BM_ReadExact_Floats(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto piece_size = static_cast<std::size_t>(state.range(1));

    auto data = test_data_generator::generate_embeddings(object_size / sizeof(float), 1, 7);
    std::vector<float> dest(data.size() / sizeof(float));

    for (auto _ : state) {
        state.PauseTiming();
        buffered_byte_stream source(data, piece_size);
        state.ResumeTiming();

        auto written = read_exact(source, std::as_writable_bytes(std::span<float>(dest)));
        if (!written) {
            state.SkipWithError("read_exact failed");
            return;
        }
        ::benchmark::DoNotOptimize(dest.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data.size()) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_RecordChunker_Regroup)
    ->Args({static_cast<int64_t>(sizes::medium_object),
            static_cast<int64_t>(sizes::small_piece),
            static_cast<int64_t>(sizes::record_768)})
    ->Args({static_cast<int64_t>(sizes::medium_object),
            static_cast<int64_t>(sizes::default_piece),
            static_cast<int64_t>(sizes::record_768)})
    ->Args({static_cast<int64_t>(sizes::medium_object),
            static_cast<int64_t>(sizes::large_piece),
            static_cast<int64_t>(sizes::record_1536)})
    ->Args({static_cast<int64_t>(sizes::medium_object),
            static_cast<int64_t>(sizes::default_piece),
            static_cast<int64_t>(16)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ReadExact_Floats)
    ->Args({static_cast<int64_t>(sizes::small_object), static_cast<int64_t>(sizes::default_piece)})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::default_piece)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::vector_transfer::benchmark
