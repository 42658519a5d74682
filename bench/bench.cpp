/**
 * @file bench.cpp
 * @brief Performance benchmarks for RESP3 decoding.
 *
 * Measures decoding throughput on synthetic messages for regression
 * testing during development.
 *
 * Usage:
 *   ./build/bench              # Run with default 1000 iterations
 *   ./build/bench 10000        # Run with custom iteration count
 *
 * @authors resp3 contributors
 */

#include <resp3/resp3.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory_resource>
#include <string>

using namespace resp3;

static constexpr int DEFAULT_ITERATIONS = 1000;

/// Flat array of simple strings, like a KEYS reply
static std::string make_flat_array(std::size_t count) {
    std::string message = "*" + std::to_string(count) + "\r\n";
    for (std::size_t i = 0; i < count; ++i) {
        message += "+key:" + std::to_string(i) + "\r\n";
    }
    return message;
}

/// Map of blob strings, like an HGETALL reply
static std::string make_map(std::size_t count) {
    std::string message = "%" + std::to_string(count) + "\r\n";
    for (std::size_t i = 0; i < count; ++i) {
        std::string field = "field:" + std::to_string(i);
        std::string value = "value-" + std::to_string(i * 7);
        message += "+" + field + "\r\n";
        message += "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
    }
    return message;
}

/// Array of small mixed aggregates
static std::string make_nested(std::size_t count) {
    std::string message = "*" + std::to_string(count) + "\r\n";
    for (std::size_t i = 0; i < count; ++i) {
        message += "*4\r\n:" + std::to_string(i) + "\r\n,3.25\r\n#t\r\n~2\r\n_\r\n+x\r\n";
    }
    return message;
}

static void bench_decode(const char* name, const std::string& message, bool use_arena,
                         int iterations) {
    // Warmup run
    {
        Value value;
        if (decode(message, value) != Error::Ok) {
            std::printf("%-20s FAIL (message does not decode)\n", name);
            return;
        }
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (use_arena) {
            // Value must be released before the arena that backs it
            std::pmr::monotonic_buffer_resource arena;
            Value value;
            (void)decode(message, value, &arena);
        } else {
            Value value;
            (void)decode(message, value);
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(message.size()) / per_iter_us;

    std::printf("%-20s %10.2f µs/msg  %8.1f MB/s  (%zu bytes, %s)\n", name, per_iter_us,
                throughput_mbps, message.size(), use_arena ? "arena" : "heap");
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("RESP3 Decoding Benchmarks (C++ Implementation)\n");
    std::printf("==============================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::string flat = make_flat_array(10000);
    std::string map = make_map(10000);
    std::string nested = make_nested(5000);

    bench_decode("flat array", flat, false, iterations);
    bench_decode("flat array", flat, true, iterations);
    bench_decode("map", map, false, iterations);
    bench_decode("map", map, true, iterations);
    bench_decode("nested", nested, false, iterations);
    bench_decode("nested", nested, true, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
