/**
 * @file bench.cpp
 * @brief Performance benchmarks for tailbits operations.
 *
 * Measures per-operation latency on random sets for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/tailbits_bench              # Run with default 1000 iterations
 *   ./build/tailbits_bench 10000        # Run with custom iteration count
 */

#include <tailbits/tailbits.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace tailbits;

static constexpr int DEFAULT_ITERATIONS = 1000;
static constexpr std::size_t SET_BITS = 1U << 16U;

/// Accumulates results so the optimizer cannot drop the measured work
static std::size_t sink = 0;

template <typename F>
static void bench(const char* name, int iterations, F&& op) {
    // Warmup run
    op();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        op();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double mbits_per_s = static_cast<double>(SET_BITS) / per_iter_us;

    std::printf("%-20s %10.3f µs/op  %10.1f Mbit/s\n", name, per_iter_us, mbits_per_s);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iterations must be positive\n");
            return 1;
        }
    }

    const BitSet a = BitSet::random(SET_BITS, 1U);
    const BitSet b = BitSet::random(SET_BITS, 2U);
    const BitSet indefinite = BitSet::random(SET_BITS / 2, 3U).not_();

    std::printf("tailbits %s benchmark (%zu bits, %d iterations)\n\n", version(), SET_BITS,
                iterations);

    bench("and", iterations, [&] { sink += a.and_(b).word_count(); });
    bench("or (indefinite)", iterations, [&] { sink += a.or_(indefinite).word_count(); });
    bench("xor", iterations, [&] { sink += a.xor_(b).word_count(); });
    bench("not", iterations, [&] { sink += a.not_().word_count(); });
    bench("equals", iterations, [&] { sink += a.equals(b) ? 1U : 0U; });
    bench("cardinality", iterations, [&] { sink += a.cardinality(); });
    bench("msb", iterations, [&] { sink += a.msb(); });
    bench("lsb", iterations, [&] { sink += a.lsb(); });
    bench("iterate", iterations, [&] {
        for (std::size_t index : a) {
            sink += index;
        }
    });
    bench("set_range", iterations, [&] {
        BitSet c = a.clone();
        c.set_range(3, static_cast<index_t>(SET_BITS - 3));
        sink += c.word_count();
    });
    bench("flip range", iterations, [&] {
        BitSet c = a.clone();
        c.flip(17, static_cast<index_t>(SET_BITS / 2));
        sink += c.word_count();
    });
    bench("lshift 37", iterations, [&] {
        BitSet c = a.clone();
        c.lshift(37);
        sink += c.word_count();
    });
    bench("rshift 37", iterations, [&] {
        BitSet c = a.clone();
        c.rshift(37);
        sink += c.word_count();
    });
    bench("to_string(16)", iterations, [&] { sink += a.to_string(16).size(); });

    std::printf("\n(checksum %zu)\n", sink);
    return 0;
}
