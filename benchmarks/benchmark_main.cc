#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace bae::benchmark {
    void register_sample_format_benchmarks(ankerl::nanobench::Bench& bench);
    void register_panning_benchmarks(ankerl::nanobench::Bench& bench);
    void register_track_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running bae benchmarks...\n\n";

    ankerl::nanobench::Bench bench;
    bench.title("bae Sample Format Benchmarks");
    bench.relative(true);
    bench.performanceCounters(true);

    bae::benchmark::register_sample_format_benchmarks(bench);
    bae::benchmark::register_panning_benchmarks(bench);
    bae::benchmark::register_track_benchmarks(bench);

    return 0;
}
