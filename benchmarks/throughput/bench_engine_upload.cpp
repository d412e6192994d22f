/**
 * @file bench_engine_upload.cpp
 * @brief Benchmarks for whole-file uploads through the engine call boundary
 *
 * Uses the in-memory transport from the test fixtures so that only the
 * engine's own work is measured: validation, reconciliation, local reads,
 * verification and finalization.
 */

#include <benchmark/benchmark.h>

#include <kcenon/chunk_upload/chunk_upload.h>

#include "fixtures/memory_transport.h"
#include "utils/benchmark_helpers.h"

namespace kcenon::chunk_upload::benchmark {

static void BM_EngineUpload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));

    get_logger().set_level(log_level::error);

    temp_file_manager temp_files;
    (void)temp_files.create_random_file("site/data.bin", file_size, 7);

    auto server = std::make_shared<test::memory_server>();
    auto built = upload_engine::builder()
                     .with_local_root(temp_files.base_dir() / "site")
                     .with_default_chunk_size(chunk_size)
                     .with_transport_factory(test::make_memory_factory(server))
                     .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto& engine = built.value();

    connection_profile profile;
    profile.host = "bench.local";
    profile.user = "bench";
    profile.credential = "bench";
    profile.remote_dir = "/bench";
    profile.chunk_size = chunk_size;

    for (auto _ : state) {
        file_transfer_state progress("data.bin");
        while (!progress.complete) {
            auto outcome = engine.transfer_chunk(profile.make_request(progress.file, progress.offset));
            if (!progress.apply(outcome)) {
                state.SkipWithError(outcome.failure ? outcome.failure->message.c_str()
                                                    : "upload failed");
                return;
            }
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_EngineUpload)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::chunk_upload::benchmark
