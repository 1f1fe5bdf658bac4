#ifndef ZWIRE_BENCH_COMMON_HPP
#define ZWIRE_BENCH_COMMON_HPP

#include <chrono>
#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iomanip>

#include <zwire.h>

// --- Configuration ---
static const std::vector<size_t> VALUE_SIZES = {16, 64, 256, 1024, 65536};
static const int DEFAULT_ITERATIONS = 100000;

// --- Stopwatch ---
class stopwatch_t {
public:
    void start() { _start = std::chrono::steady_clock::now(); }
    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - _start).count();
    }

private:
    std::chrono::steady_clock::time_point _start;
};

inline void print_result(const std::string &source_type,
                         const std::string &pattern,
                         size_t size,
                         double throughput,
                         double latency)
{
    std::cout << "RESULT,zwire," << pattern << "," << source_type << ","
              << size << ",throughput," << std::fixed << std::setprecision(2)
              << throughput << std::endl;
    std::cout << "RESULT,zwire," << pattern << "," << source_type << ","
              << size << ",latency," << std::fixed << std::setprecision(2)
              << latency << std::endl;
}

inline bool bench_debug_enabled()
{
    static const bool enabled = std::getenv("BENCH_DEBUG") != NULL;
    return enabled;
}

inline int bench_iterations()
{
    static int iterations = -1;
    if (iterations > 0)
        return iterations;

    const char *env = std::getenv("BENCH_ITERATIONS");
    const int val = env && *env ? std::atoi(env) : 0;
    iterations = val > 0 ? val : DEFAULT_ITERATIONS;
    return iterations;
}

inline void report_failure(const char *what_)
{
    std::cerr << what_ << " failed: " << zwire_strerror(zwire_errno())
              << std::endl;
}

#endif
