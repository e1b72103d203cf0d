#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace bench {

struct Result {
    std::string  name;
    double       mean_ns_per_op = 0.0;
    double       p50_ns         = 0.0;
    double       p99_ns         = 0.0;
    double       max_ns         = 0.0;
    std::size_t  iterations     = 0;
    std::size_t  runs           = 1;
    std::size_t  batch_size     = 1;
};

using Clock = std::chrono::steady_clock;

inline double elapsed_ns(Clock::time_point start, Clock::time_point end) noexcept {
    return static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
}

// Nearest-rank percentile over an already sorted sample.
inline double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    auto idx = static_cast<std::size_t>(p * static_cast<double>(sorted.size() - 1) + 0.5);
    return sorted[std::min(idx, sorted.size() - 1)];
}

// Times fn(i) for i in [warmup, iterations) in batches of batch_size and
// reports per-op statistics of the batch averages.
template <typename F>
Result run_batched(std::string_view name,
                   std::size_t      iterations,
                   std::size_t      batch_size,
                   F&&              fn,
                   std::size_t      warmup = 0)
{
    Result res;
    res.name       = std::string(name);
    res.iterations = iterations;
    res.batch_size = std::max<std::size_t>(batch_size, 1);

    warmup = std::min(warmup, iterations);
    for (std::size_t i = 0; i < warmup; ++i) {
        fn(i);
    }

    std::vector<double> samples;
    for (std::size_t i = warmup; i < iterations; i += res.batch_size) {
        const std::size_t end = std::min(iterations, i + res.batch_size);

        auto t0 = Clock::now();
        for (std::size_t j = i; j < end; ++j) {
            fn(j);
        }
        auto t1 = Clock::now();

        samples.push_back(elapsed_ns(t0, t1) / static_cast<double>(end - i));
    }

    if (samples.empty()) {
        return res;
    }

    std::sort(samples.begin(), samples.end());
    res.mean_ns_per_op = std::accumulate(samples.begin(), samples.end(), 0.0)
                       / static_cast<double>(samples.size());
    res.p50_ns = percentile(samples, 0.50);
    res.p99_ns = percentile(samples, 0.99);
    res.max_ns = samples.back();
    return res;
}

// Averages `runs` results produced by make_run(run_index).
template <typename F>
Result run_multi(std::string_view name, std::size_t runs, F&& make_run)
{
    Result agg;
    agg.name = std::string(name);
    agg.runs = runs;

    for (std::size_t r = 0; r < runs; ++r) {
        Result s = make_run(r);
        agg.iterations      = s.iterations;
        agg.batch_size      = s.batch_size;
        agg.mean_ns_per_op += s.mean_ns_per_op;
        agg.p50_ns         += s.p50_ns;
        agg.p99_ns         += s.p99_ns;
        agg.max_ns          = std::max(agg.max_ns, s.max_ns);
    }

    if (runs > 0) {
        const double inv = 1.0 / static_cast<double>(runs);
        agg.mean_ns_per_op *= inv;
        agg.p50_ns         *= inv;
        agg.p99_ns         *= inv;
    }
    return agg;
}

inline void print(const Result& s)
{
    std::cout << "[bench] " << s.name
              << " (runs=" << s.runs
              << ", iters=" << s.iterations
              << ", batch=" << s.batch_size << ")\n";

    if (s.mean_ns_per_op <= 0.0) {
        std::cout << "  no samples\n";
        return;
    }

    std::cout << "  mean ns/op: " << s.mean_ns_per_op
              << ", " << 1e3 / s.mean_ns_per_op << " Mops/s\n"
              << "  p50 ns:     " << s.p50_ns << "\n"
              << "  p99 ns:     " << s.p99_ns << "\n"
              << "  max ns:     " << s.max_ns << "\n";
}

} // namespace bench
