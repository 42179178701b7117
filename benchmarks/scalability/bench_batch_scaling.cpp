/**
 * @file bench_batch_scaling.cpp
 * @brief Scalability benchmarks for batch partitioning and full engine runs
 */

#include <benchmark/benchmark.h>

#include "../utils/benchmark_helpers.h"

#include <filesystem>

namespace kcenon::bulk_upload::benchmark {

// ============================================================================
// Adaptive Concurrency Benchmarks
// ============================================================================

static void BM_ConcurrencyFor(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    std::vector<uint64_t> file_sizes;
    file_sizes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        file_sizes.push_back((i % 40 + 1) * sizes::MB);
    }

    for (auto _ : state) {
        auto c = concurrency_controller::concurrency_for(file_sizes);
        ::benchmark::DoNotOptimize(c);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(count));
}
BENCHMARK(BM_ConcurrencyFor)->Arg(100)->Arg(1000)->Arg(1500);

static void BM_Partition(::benchmark::State& state) {
    const auto total = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        auto ranges = batch_scheduler::partition(total, 1000);
        ::benchmark::DoNotOptimize(ranges.data());
    }
}
BENCHMARK(BM_Partition)->Arg(1200)->Arg(10000)->Arg(100000);

// ============================================================================
// Engine Scaling Benchmarks
// ============================================================================

static void BM_EngineRun(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto latency = std::chrono::microseconds(state.range(1));
    const auto files = generate_files(file_count, sizes::photo);

    auto queue_dir = std::filesystem::temp_directory_path() / "bulk_upload_bench_queue";

    auto built = upload_engine::builder()
                     .with_transport(std::make_shared<loopback_transport>(latency))
                     .with_destination_client(std::make_shared<loopback_destination_client>())
                     .with_content_source(std::make_shared<payload_source>(4 * sizes::KB))
                     .with_inter_chunk_pause(std::chrono::milliseconds(0))
                     .with_retry_queue_directory(queue_dir)
                     .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto& engine = built.value();

    for (auto _ : state) {
        auto completion = engine.run_upload(files, "bench-token", 1000);
        if (!completion) {
            state.SkipWithError(completion.error().message.c_str());
            break;
        }
        ::benchmark::DoNotOptimize(completion.value().stats.success_count);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_count));

    std::error_code ec;
    std::filesystem::remove_all(queue_dir, ec);
}
BENCHMARK(BM_EngineRun)
    ->Args({100, 0})
    ->Args({1200, 0})
    ->Args({1200, 500})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::bulk_upload::benchmark

BENCHMARK_MAIN();
