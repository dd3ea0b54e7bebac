#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace ttyecho::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    double avg_ms;
    double min_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 重复执行多次：平均值作为吞吐依据，最小值反映无干扰时的耗时。
template <typename Func>
inline void run_benchmark(std::string_view name, std::size_t data_size, int iterations, Func &&func) {
    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(iterations));

    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }

    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    const double avg_ms = timings.empty() ? 0.0 : total_ms / static_cast<double>(timings.size());
    const double min_ms = timings.empty() ? 0.0 : *std::min_element(timings.begin(), timings.end());

    double throughput_mbps = 0.0;
    if (avg_ms > 0.0) {
        const double seconds = avg_ms / 1000.0;
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / seconds;
    }

    results().push_back({name, data_size, avg_ms, min_ms, throughput_mbps});
}

inline std::string format_size(std::size_t n) {
    if (n >= 1024 * 1024) {
        return std::to_string(n / (1024 * 1024)) + " MB";
    }
    if (n >= 1024) {
        return std::to_string(n / 1024) + " KB";
    }
    return std::to_string(n) + " B";
}

inline void print_results() {
    std::cout << "\n" << std::string(110, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12) << "Size" << std::setw(14)
              << "Avg (ms)" << std::setw(14) << "Min (ms)" << std::setw(20) << "Throughput (MB/s)"
              << "\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(50) << r.name << std::setw(12) << format_size(r.data_size)
                  << std::fixed << std::setprecision(3) << std::setw(14) << r.avg_ms << std::setw(14)
                  << r.min_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << std::setw(20) << r.throughput_mbps;
        } else {
            std::cout << std::setw(20) << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace ttyecho::benchmarks

#define BENCH_RUN(name, size, iterations, code) \
    ::ttyecho::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
