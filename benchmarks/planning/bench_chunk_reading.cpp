/**
 * @file bench_chunk_reading.cpp
 * @brief Benchmarks for chunk planning and local chunk reads
 */

#include <benchmark/benchmark.h>

#include <kcenon/chunk_upload/core/chunk_planner.h>
#include <kcenon/chunk_upload/core/local_source.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::chunk_upload::benchmark {

/**
 * @brief Plan every chunk of a file from offset zero
 */
static void BM_PlanChunks(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));

    for (auto _ : state) {
        uint64_t offset = 0;
        while (true) {
            auto plan = plan_chunk(file_size, chunk_size, offset);
            if (!plan) {
                state.SkipWithError("planning failed");
                return;
            }
            ::benchmark::DoNotOptimize(plan.value());
            if (plan.value().is_final) {
                break;
            }
            offset = plan.value().end();
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(remaining_chunks(file_size, chunk_size, 0)) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Read a file chunk by chunk the way an upload call does
 */
static void BM_ReadChunks(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("read_test.bin", file_size, 42);

    for (auto _ : state) {
        auto source = local_source::open(path);
        if (!source) {
            state.SkipWithError("failed to open source");
            return;
        }

        for (uint64_t offset = 0; offset < file_size; offset += chunk_size) {
            auto plan = plan_chunk(file_size, chunk_size, offset);
            if (!plan) {
                state.SkipWithError("planning failed");
                return;
            }
            auto bytes = source.value().read(plan.value().offset, plan.value().length);
            if (!bytes) {
                state.SkipWithError("read failed");
                return;
            }
            ::benchmark::DoNotOptimize(bytes.value().data());
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_PlanChunks)
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({20000000, static_cast<int64_t>(sizes::default_chunk)});

BENCHMARK(BM_ReadChunks)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::chunk_upload::benchmark
