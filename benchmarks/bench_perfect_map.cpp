/**
 * @file bench_perfect_map.cpp
 * @brief Build time, lookup latency and footprint of perfect_map
 *
 * Usage: bench_perfect_map [key_count...]
 */

#include <perfdict/perfdict.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

using namespace perfdict;
using namespace std::chrono;

// ===== UTILITIES =====

std::vector<std::string> generate_keys(size_t count, size_t min_len = 8, size_t max_len = 32) {
    std::vector<std::string> keys;
    keys.reserve(count);

    std::mt19937_64 rng{42};
    std::uniform_int_distribution<size_t> len_dist(min_len, max_len);
    std::uniform_int_distribution<int> char_dist('a', 'z');

    for (size_t i = 0; i < count; ++i) {
        std::string key;
        size_t len = len_dist(rng);
        key.reserve(len);
        for (size_t j = 0; j < len; ++j) {
            key += static_cast<char>(char_dist(rng));
        }
        keys.push_back(std::move(key));
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

template<typename Duration>
double to_milliseconds(Duration d) {
    return duration_cast<microseconds>(d).count() / 1000.0;
}

// ===== BENCHMARK RUNNER =====

struct benchmark_result {
    std::string label;
    size_t key_count{0};
    size_t attempts{0};
    double build_time_ms{0};
    double avg_query_ns{0};
    double p50_query_ns{0};
    double p99_query_ns{0};
    double index_bits_per_key{0};
    double measured_fp_rate{0};
};

benchmark_result run(const std::string& label,
                     const std::vector<std::string>& keys,
                     const perfect_map_config& cfg,
                     size_t query_iterations) {
    benchmark_result result;
    result.label = label;
    result.key_count = keys.size();

    std::vector<uint64_t> values(keys.size());
    std::iota(values.begin(), values.end(), 0);

    build_stats stats;
    auto build_start = steady_clock::now();
    auto m = perfect_map<uint64_t>::build_from(keys, values, cfg, &stats);
    auto build_end = steady_clock::now();

    if (!m) {
        std::cerr << "Failed to build " << label << ": " << error_message(m.error()) << std::endl;
        return result;
    }

    result.build_time_ms = to_milliseconds(build_end - build_start);
    result.attempts = stats.attempts;
    result.index_bits_per_key = m->statistics().index_bits_per_key;

    // Lookups are timed in batches of 64; a single lookup is below clock resolution
    constexpr size_t batch = 64;
    std::mt19937_64 rng{123};
    std::uniform_int_distribution<size_t> key_dist(0, keys.size() - 1);
    std::vector<double> batch_times;
    batch_times.reserve(query_iterations / batch);

    volatile uint64_t sink = 0;
    for (size_t i = 0; i < query_iterations / batch; ++i) {
        size_t picks[batch];
        for (auto& p : picks) p = key_dist(rng);

        auto q_start = steady_clock::now();
        for (auto p : picks) {
            sink = sink + m->get_or(keys[p], 0);
        }
        auto q_end = steady_clock::now();
        batch_times.push_back(duration_cast<nanoseconds>(q_end - q_start).count() / double(batch));
    }

    std::sort(batch_times.begin(), batch_times.end());
    result.avg_query_ns = std::accumulate(batch_times.begin(), batch_times.end(), 0.0) / batch_times.size();
    result.p50_query_ns = batch_times[batch_times.size() / 2];
    result.p99_query_ns = batch_times[static_cast<size_t>(batch_times.size() * 0.99)];

    size_t accepted = 0;
    constexpr size_t probes = 100000;
    for (size_t i = 0; i < probes; ++i) {
        // Generated keys are lowercase only, so these never collide with them
        if (m->contains("#" + std::to_string(i))) ++accepted;
    }
    result.measured_fp_rate = double(accepted) / probes;

    return result;
}

void print_header() {
    std::cout << std::left
              << std::setw(14) << "Config"
              << std::setw(10) << "Keys"
              << std::setw(10) << "Attempts"
              << std::setw(12) << "Build(ms)"
              << std::setw(10) << "Avg(ns)"
              << std::setw(10) << "p50(ns)"
              << std::setw(10) << "p99(ns)"
              << std::setw(12) << "Bits/Key"
              << std::setw(12) << "FP rate"
              << std::endl;
    std::cout << std::string(100, '-') << std::endl;
}

void print_result(const benchmark_result& r) {
    std::cout << std::left << std::fixed << std::setprecision(2)
              << std::setw(14) << r.label
              << std::setw(10) << r.key_count
              << std::setw(10) << r.attempts
              << std::setw(12) << r.build_time_ms
              << std::setw(10) << r.avg_query_ns
              << std::setw(10) << r.p50_query_ns
              << std::setw(10) << r.p99_query_ns
              << std::setw(12) << r.index_bits_per_key
              << std::setprecision(6) << std::setw(12) << r.measured_fp_rate
              << std::endl;
}

// ===== MAIN BENCHMARK =====

int main(int argc, char** argv) {
    std::vector<size_t> key_counts = {1000, 10000, 100000, 1000000};
    size_t query_iterations = 1 << 20;

    if (argc > 1) {
        key_counts.clear();
        for (int i = 1; i < argc; ++i) {
            key_counts.push_back(std::stoul(argv[i]));
        }
    }

    std::cout << "perfect_map benchmark\n";

    for (size_t key_count : key_counts) {
        auto keys = generate_keys(key_count);
        std::cout << "\n=== " << keys.size() << " unique keys ===\n\n";
        print_header();

        print_result(run("c=2.5 b=0", keys, {.fingerprint_bits = 0}, query_iterations));
        print_result(run("c=2.5 b=8", keys, {.fingerprint_bits = 8}, query_iterations));
        print_result(run("c=2.5 b=16", keys, {.fingerprint_bits = 16}, query_iterations));
        print_result(run("c=3.0 b=16", keys, {.load_factor = 3.0, .fingerprint_bits = 16}, query_iterations));
        print_result(run("c=2.1 b=16", keys,
                         {.load_factor = 2.1, .fingerprint_bits = 16, .max_attempts = 1000}, query_iterations));
        print_result(run("c=2.5 t=4", keys, {.threads = 4}, query_iterations));

        // Baseline: the standard hash map over the same keys
        {
            std::unordered_map<std::string, uint64_t> baseline;
            auto start = steady_clock::now();
            for (size_t i = 0; i < keys.size(); ++i) baseline.emplace(keys[i], i);
            auto built = steady_clock::now();

            std::mt19937_64 rng{123};
            std::uniform_int_distribution<size_t> key_dist(0, keys.size() - 1);
            volatile uint64_t sink = 0;
            auto q_start = steady_clock::now();
            for (size_t i = 0; i < query_iterations; ++i) {
                sink = sink + baseline.find(keys[key_dist(rng)])->second;
            }
            auto q_end = steady_clock::now();

            std::cout << std::left << std::fixed << std::setprecision(2)
                      << std::setw(14) << "unordered_map"
                      << std::setw(10) << keys.size()
                      << std::setw(10) << "-"
                      << std::setw(12) << to_milliseconds(built - start)
                      << std::setw(10)
                      << duration_cast<nanoseconds>(q_end - q_start).count() / double(query_iterations)
                      << std::endl;
        }
    }

    return 0;
}
