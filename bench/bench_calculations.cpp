/**
 * @file  bench/bench_calculations.cpp
 * @brief Google Benchmark suite for the fincalc calculators.
 *
 * Benchmarks
 * ----------
 *   BM_Amortization_Schedule   — full schedule, 1..40 years
 *   BM_Npv                     — discounting over N flows
 *   BM_Irr                     — Newton-Raphson over N flows
 *   BM_Median / BM_Mode        — sort copy vs. string-keyed grouping
 *
 * Build (CMake):
 *   cmake -DFINCALC_BENCH=ON ..
 *   cmake --build build --target bench_calculations
 *   ./build/bench_calculations --benchmark_format=json
 *
 * Throughput units: items/second (rows or values processed).
 */

#include "benchmark/benchmark.h"

#include "fincalc/investment.hpp"
#include "fincalc/loan.hpp"
#include "fincalc/statistics.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

using fincalc::investment::InvestmentAnalyzer;
using fincalc::loan::LoanCalculator;
using fincalc::statistics::StatisticsCalculator;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Initial outlay followed by N−1 level inflows; IRR ≈ 10 % for large N.
static std::vector<double> make_cash_flows(std::size_t n) {
    std::vector<double> flows(n, 100.0);
    flows.front() = -1000.0;
    return flows;
}

/// Values with a bounded set of repeats so mode has real work to do.
static std::vector<double> make_samples(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = std::fmod(static_cast<double>(i) * 7.31, 997.0);
    }
    return v;
}

// ── Loan ───────────────────────────────────────────────────────────────────────

static void BM_Amortization_Schedule(benchmark::State& state) {
    const int years = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto schedule = LoanCalculator::amortization_schedule(250000.0, 6.5, years);
        benchmark::DoNotOptimize(schedule);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * years * 12);
}
BENCHMARK(BM_Amortization_Schedule)->Arg(1)->Arg(15)->Arg(30)->Arg(40);

// ── Investment ─────────────────────────────────────────────────────────────────

static void BM_Npv(benchmark::State& state) {
    const auto flows = make_cash_flows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto npv = InvestmentAnalyzer::npv(1000.0, flows, 0.08);
        benchmark::DoNotOptimize(npv);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Npv)->RangeMultiplier(4)->Range(16, 4096);

static void BM_Irr(benchmark::State& state) {
    const auto flows = make_cash_flows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto irr = InvestmentAnalyzer::irr(flows);
        benchmark::DoNotOptimize(irr);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Irr)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

// ── Statistics ─────────────────────────────────────────────────────────────────

static void BM_Median(benchmark::State& state) {
    const auto samples = make_samples(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto median = StatisticsCalculator::median(samples);
        benchmark::DoNotOptimize(median);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Median)->RangeMultiplier(8)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Mode(benchmark::State& state) {
    const auto samples = make_samples(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto mode = StatisticsCalculator::mode(samples);
        benchmark::DoNotOptimize(mode);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Mode)->RangeMultiplier(8)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
