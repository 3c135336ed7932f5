/**
 * @file bench.cpp
 * @brief Performance benchmarks for BitLongVec get/set.
 *
 * Measures slot access throughput across bit widths for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bench             # Run with default 20 iterations
 *   ./build/bench 100         # Run with custom iteration count
 */

#include <bitlongvec/bitlongvec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace bitlongvec;

static constexpr int DEFAULT_ITERATIONS = 20;
static constexpr std::size_t NUM_SLOTS = std::size_t{1} << 20;
static constexpr std::size_t BIT_WIDTHS[] = {1, 4, 7, 10, 14, 32, 33, 63, 64};

static void print_row(const char* op, std::size_t bit_width, double total_ns, int iterations) {
    double ops = static_cast<double>(NUM_SLOTS) * static_cast<double>(iterations);
    double ns_per_op = total_ns / ops;
    double mops = ops * 1000.0 / total_ns;

    std::printf("%-6s %4zu bits  %8.3f ns/op  %10.1f Mops/s\n", op, bit_width, ns_per_op, mops);
}

static void bench_width(std::size_t bit_width, int iterations) {
    BitLongVec vec;
    Error result = BitLongVec::create(NUM_SLOTS, bit_width, vec);
    if (result != Error::Ok) {
        std::printf("%4zu bits  SKIP (%s)\n", bit_width, error_string(result));
        return;
    }

    const word_t mask = vec.max_value();

    // Warmup run
    for (std::size_t i = 0; i < NUM_SLOTS; ++i) {
        vec.set_unchecked(i, i & mask);
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int iter = 0; iter < iterations; ++iter) {
        for (std::size_t i = 0; i < NUM_SLOTS; ++i) {
            vec.set_unchecked(i, (i + static_cast<std::size_t>(iter)) & mask);
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    print_row("set", bit_width, std::chrono::duration<double, std::nano>(end - start).count(),
              iterations);

    // Accumulate so the reads cannot be optimised away
    word_t checksum = 0;
    start = std::chrono::high_resolution_clock::now();
    for (int iter = 0; iter < iterations; ++iter) {
        for (std::size_t i = 0; i < NUM_SLOTS; ++i) {
            checksum += vec.get_unchecked(i);
        }
    }
    end = std::chrono::high_resolution_clock::now();
    print_row("get", bit_width, std::chrono::duration<double, std::nano>(end - start).count(),
              iterations);

    if (checksum == 1) {
        std::printf("(checksum %llu)\n", static_cast<unsigned long long>(checksum));
    }
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("bitlongvec Benchmarks\n");
    std::printf("=====================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Slots: %zu\n\n", NUM_SLOTS);

    for (std::size_t bit_width : BIT_WIDTHS) {
        bench_width(bit_width, iterations);
    }

    return 0;
}
