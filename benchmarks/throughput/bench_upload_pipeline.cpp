/**
 * @file bench_upload_pipeline.cpp
 * @brief Throughput benchmarks for form encoding and the batch scheduler
 *
 * Measures:
 * - multipart/form-data encoding at typical photo sizes
 * - scheduler throughput over a loopback transport
 */

#include <benchmark/benchmark.h>

#include "../utils/benchmark_helpers.h"

namespace kcenon::bulk_upload::benchmark {

// ============================================================================
// Multipart Encoding Benchmarks
// ============================================================================

static void BM_MultipartEncode(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    std::vector<uint8_t> payload(size, 0x42);

    for (auto _ : state) {
        multipart_form form("bench-boundary");
        form.add_field("key", "uploads/IMG_0001.jpg");
        form.add_field("policy", "eyJleHBpcmF0aW9uIjoiMjAzMCJ9");
        form.add_field("x-amz-signature", "0123456789abcdef");
        form.set_file("IMG_0001.jpg", "image/jpeg", payload);
        auto body = form.encode();
        ::benchmark::DoNotOptimize(body.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(size));
}
BENCHMARK(BM_MultipartEncode)
    ->Arg(64 * sizes::KB)
    ->Arg(sizes::photo)
    ->Arg(8 * sizes::MB);

// ============================================================================
// Scheduler Throughput Benchmarks
// ============================================================================

static void BM_SchedulerLoopback(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto files = generate_files(file_count, sizes::photo);

    auto transport = std::make_shared<loopback_transport>();
    auto task = std::make_shared<upload_task>(transport, std::make_shared<payload_source>(4 * sizes::KB));
    auto pool = adapters::worker_pool_factory::create(24, "bench_pool");

    scheduler_config config;
    config.batch_size = 1000;
    config.inter_chunk_pause = std::chrono::milliseconds(0);
    batch_scheduler scheduler(config, std::make_shared<loopback_destination_client>(), pool, task);

    for (auto _ : state) {
        cancellation_token token;
        progress_reporter reporter;
        reporter.reset("bench");
        auto report = scheduler.run(files, "bench-token", token, reporter);
        ::benchmark::DoNotOptimize(report.stats.success_count);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_count));
    state.counters["payload_bytes"] = static_cast<double>(transport->bytes_sent());
}
BENCHMARK(BM_SchedulerLoopback)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(2500)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::bulk_upload::benchmark

BENCHMARK_MAIN();
