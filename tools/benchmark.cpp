// Throughput benchmark for the segment store.
//
// Opens a storage::Engine in a scratch directory and runs three phases:
// (1) N SETs of distinct keys, (2) N GETs of those keys, (3) N overwrites over
// a small key set, which keeps rotation and compaction busy.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "storage/engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace {

using steady = std::chrono::steady_clock;
using ns     = std::chrono::nanoseconds;

constexpr uint64_t    kSegmentSize = 4 * 1024 * 1024;
constexpr std::size_t kHotKeys     = 64;

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

// Times `op` once per iteration; stops at the first failure.
template <typename Op>
BenchResult run_phase(std::size_t n, Op op) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        auto t0 = steady::now();
        auto ec = op(i);
        auto t1 = steady::now();
        if (ec) {
            spdlog::error("bench: operation {} failed: {}", i, ec.message());
            break;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 10'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 10'000;
    }

    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "caskdb_bench";
    std::error_code fs_ec;
    fs::remove_all(dir, fs_ec);

    cask::storage::EngineOptions options;
    options.segment_size_limit = kSegmentSize;
    options.sync_writes = false;

    fprintf(stdout,
        "caskdb Engine Benchmark\n"
        "=======================\n"
        "Ops/phase: %zu\n"
        "Segment:   %llu bytes, fsync off\n"
        "Directory: %s\n",
        num_ops, static_cast<unsigned long long>(kSegmentSize), dir.c_str());

    int rc = 0;
    {
        cask::storage::Engine engine{dir, options};
        if (auto ec = engine.open()) {
            fprintf(stderr, "Cannot open %s: %s\n", dir.c_str(), ec.message().c_str());
            return 1;
        }

        auto set_result = run_phase(num_ops, [&](std::size_t i) {
            return engine.set("key" + std::to_string(i), "val" + std::to_string(i));
        });

        auto get_result = run_phase(num_ops, [&](std::size_t i) {
            std::optional<std::string> value;
            return engine.get("key" + std::to_string(i), value);
        });

        auto overwrite_result = run_phase(num_ops, [&](std::size_t i) {
            return engine.set("hot" + std::to_string(i % kHotKeys),
                              std::string(128, static_cast<char>('a' + i % 26)));
        });

        print_result("SET (distinct keys)", set_result);
        print_result("GET", get_result);
        print_result("SET (overwrite hot keys)", overwrite_result);

        const auto stats = engine.stats();
        fprintf(stdout,
            "\n── Engine ──\n"
            "  Segments:     %zu\n"
            "  Live keys:    %zu\n"
            "  Bytes:        %llu\n"
            "  Compactions:  %llu\n\n",
            stats.segments, stats.live_keys,
            static_cast<unsigned long long>(stats.total_bytes),
            static_cast<unsigned long long>(stats.compactions));

        if (set_result.total_ops != num_ops || get_result.total_ops != num_ops ||
            overwrite_result.total_ops != num_ops) {
            rc = 1;
        }
    }

    fs::remove_all(dir, fs_ec);
    return rc;
}
