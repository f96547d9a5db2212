// Query throughput benchmark: seeds a store with N synthetic leads, then runs
// a fixed mix of selects (filtered, ordered, paginated, OR-filtered) and
// updates against it.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each query shape.

#include "common/logger.hpp"
#include "store/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// Runs `op` `iterations` times; an op returning false counts as a failure.
BenchResult bench(std::size_t iterations, const std::function<bool(std::size_t)>& op,
                  std::size_t& failures) {
    std::vector<int64_t> latencies;
    latencies.reserve(iterations);

    for (std::size_t i = 0; i < iterations; ++i) {
        auto t0 = clock::now();
        const bool ok = op(i);
        auto t1 = clock::now();
        if (!ok) ++failures;
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    mockdb::init_default_logger(spdlog::level::warn);

    std::size_t num_rows = 2'000;
    std::size_t iterations = 1'000;
    if (argc > 1) {
        num_rows = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_rows == 0) num_rows = 2'000;
    }
    if (argc > 2) {
        iterations = static_cast<std::size_t>(std::atol(argv[2]));
        if (iterations == 0) iterations = 1'000;
    }

    mockdb::StoreConfig cfg;
    cfg.log_level  = "warn";
    cfg.seed_leads = static_cast<uint32_t>(num_rows);
    mockdb::Store store{cfg};

    fprintf(stdout,
        "mockdb Query Benchmark\n"
        "======================\n"
        "Rows:       %zu leads\n"
        "Iterations: %zu per query shape\n",
        store.data().size("leads"), iterations);

    std::size_t failures = 0;

    auto filtered = bench(iterations, [&](std::size_t) {
        return store.from("leads").select().eq("status", "active").gte("score", 50)
                    .execute().ok();
    }, failures);

    auto paged = bench(iterations, [&](std::size_t i) {
        const auto from = static_cast<int64_t>((i * 20) % num_rows);
        return store.from("leads").select().order("score", {.ascending = false})
                    .range(from, from + 19).execute().ok();
    }, failures);

    auto any_of = bench(iterations, [&](std::size_t) {
        return store.from("leads").select().or_("status.eq.new,status.eq.active")
                    .like("email", "%example.com").execute().ok();
    }, failures);

    auto updates = bench(iterations, [&](std::size_t i) {
        return store.from("leads").update({{"score", static_cast<int64_t>(i % 101)}})
                    .eq("status", "won").execute().ok();
    }, failures);

    print_result("Filtered select (eq + gte)", filtered);
    print_result("Ordered page (order + range)", paged);
    print_result("OR + like select", any_of);
    print_result("Filtered update", updates);

    fprintf(stdout, "\nFailures: %zu\n\n", failures);
    return failures == 0 ? 0 : 1;
}
