// SPDX-License-Identifier: MIT
/// @file rate_solver_benchmark.cc
/// @brief Equivalent-rate solve latency (bisection vs Brent), analysis and batch throughput
///
/// Usage:
///   ./build/benchmarks/rate_solver_benchmark --benchmark_filter=Solve

#include "payplan/plan/comparative_analyzer.hpp"
#include "payplan/plan/plan_evaluation.hpp"
#include "payplan/plan/rate_solver.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

using namespace payplan;

namespace {

PaymentPlan make_plan(size_t i) {
    const size_t n = 6 + (i % 43);
    const double purchase = 200.0 + 37.5 * static_cast<double>(i % 97);
    const double fee = purchase * (0.005 + 0.0002 * static_cast<double>(i % 31));
    return PaymentPlan{
        .purchase_amount = purchase,
        .num_payments = n,
        .monthly_payment = purchase / static_cast<double>(n) + fee,
        .monthly_fee = fee
    };
}

const PaymentPlan kPublishedPlan{
    .purchase_amount = 1196.00,
    .num_payments = 18,
    .monthly_payment = 80.73,
    .monthly_fee = 14.28
};

}  // namespace

static void BM_Solve_Bisection(benchmark::State& state) {
    RateSolver solver;
    for (auto _ : state) {
        auto result = solver.solve(kPublishedPlan);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("bisection");
}
BENCHMARK(BM_Solve_Bisection);

static void BM_Solve_Brent(benchmark::State& state) {
    RateSolverConfig config;
    config.method = RootMethod::Brent;
    RateSolver solver(config);
    for (auto _ : state) {
        auto result = solver.solve(kPublishedPlan);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("brent");
}
BENCHMARK(BM_Solve_Brent);

static void BM_Analyze(benchmark::State& state) {
    for (auto _ : state) {
        auto result = analyze(kPublishedPlan, 27.0);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Analyze);

static void BM_EvaluatePlans_Sequential(benchmark::State& state) {
    const size_t n_plans = static_cast<size_t>(state.range(0));
    std::vector<PaymentPlan> plans;
    plans.reserve(n_plans);
    for (size_t i = 0; i < n_plans; ++i) {
        plans.push_back(make_plan(i));
    }

    for (auto _ : state) {
        for (const auto& plan : plans) {
            auto evaluation = evaluate_plan(plan, 27.0);
            benchmark::DoNotOptimize(evaluation);
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_plans));
    state.SetLabel("sequential");
}
BENCHMARK(BM_EvaluatePlans_Sequential)->Arg(64)->Arg(1024);

static void BM_EvaluatePlans_Batch(benchmark::State& state) {
    const size_t n_plans = static_cast<size_t>(state.range(0));
    std::vector<PaymentPlan> plans;
    plans.reserve(n_plans);
    for (size_t i = 0; i < n_plans; ++i) {
        plans.push_back(make_plan(i));
    }

    for (auto _ : state) {
        auto batch = evaluate_plans(plans, 27.0);
        benchmark::DoNotOptimize(batch);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_plans));
    state.SetLabel("batch (OpenMP)");
}
BENCHMARK(BM_EvaluatePlans_Batch)->Arg(64)->Arg(1024);

BENCHMARK_MAIN();
