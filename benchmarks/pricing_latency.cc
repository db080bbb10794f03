// SPDX-License-Identifier: MIT
/// @file pricing_latency.cc
/// @brief Latency benchmark: per-call time for flex, commit, recommend and quotes
///
/// Uses the shipped 26-tier schedule. Spend levels are chosen to land in the
/// first, middle and last tiers so the cost of the tier walk is visible.
///
/// Usage:
///   ./build/benchmarks/pricing_latency

#include "src/pricing/price_quote.hpp"
#include "src/pricing/pricing_engine.hpp"
#include "src/pricing/reference_schedule.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace spendcalc;

namespace {

const PricingEngine& GetEngine() {
    static PricingEngine* engine = [] {
        auto table = make_reference_table();
        if (!table) throw std::runtime_error("reference table failed validation");
        auto created = PricingEngine::create(*table);
        if (!created) throw std::runtime_error("engine creation failed");
        return new PricingEngine(std::move(*created));
    }();
    return *engine;
}

// Spend by argument index: first tier, middle tier, last tier
double SpendFor(int64_t index) {
    switch (index) {
        case 0:  return 50'000.0;
        case 1:  return 10'000'000.0;
        default: return 240'000'000.0;
    }
}

}  // namespace

static void BM_FlexPrice(benchmark::State& state) {
    const auto& engine = GetEngine();
    const double spend = SpendFor(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.flex_price(spend));
    }
}
BENCHMARK(BM_FlexPrice)->Arg(0)->Arg(1)->Arg(2);

static void BM_CommitPrice(benchmark::State& state) {
    const auto& engine = GetEngine();
    const double spend = SpendFor(state.range(0));
    const double commit = spend * 0.75;
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.commit_price(spend, commit));
    }
}
BENCHMARK(BM_CommitPrice)->Arg(0)->Arg(1)->Arg(2);

static void BM_RecommendCommitTier(benchmark::State& state) {
    const auto& engine = GetEngine();
    const double spend = SpendFor(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.recommend_commit_tier(spend));
    }
}
BENCHMARK(BM_RecommendCommitTier)->Arg(0)->Arg(1)->Arg(2);

static void BM_QuoteBatch(benchmark::State& state) {
    const auto& engine = GetEngine();
    std::vector<QuoteRequest> requests;
    requests.reserve(static_cast<size_t>(state.range(0)));
    for (int64_t i = 0; i < state.range(0); ++i) {
        double spend = 50'000.0 + static_cast<double>(i) * 10'000.0;
        requests.push_back({.spend = spend, .commit_amount = spend * 0.8});
    }
    for (auto _ : state) {
        auto result = quote_batch(engine, requests);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_QuoteBatch)->Arg(100)->Arg(10'000);

BENCHMARK_MAIN();
