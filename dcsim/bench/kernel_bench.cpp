#include <dcsim/algo/first_fit_allocator.hpp>

#include <dcsim/core/event_queue.hpp>
#include <dcsim/core/kernel.hpp>
#include <dcsim/core/simulation.hpp>
#include <dcsim/core/types.hpp>

#include <benchmark/benchmark.h>

#include <memory>

using namespace dcsim::core;
using namespace dcsim::algo;

// ---------------------------------------------------------------------------
// BM_EventQueue: push + pop N events
// ---------------------------------------------------------------------------

static void BM_EventQueue(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        EventQueue queue;
        for (int64_t i = 0; i < n; ++i) {
            // Interleave times so inserts do not all land at the end
            queue.push(TopicKind::SimLog, time_from_nanoseconds((i * 7919) % n), {});
        }
        int64_t popped = 0;
        while (queue.pop()) {
            ++popped;
        }
        benchmark::DoNotOptimize(popped);
    }
}
BENCHMARK(BM_EventQueue)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_KernelDispatch: N events through the bus to one wildcard subscriber
// ---------------------------------------------------------------------------

static void BM_KernelDispatch(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        Kernel kernel;
        kernel.set_event_log_enabled(false);
        int64_t seen = 0;
        kernel.subscribe(TopicPattern::any(), "counter", [&seen](const Event&) { ++seen; });
        for (int64_t i = 0; i < n; ++i) {
            kernel.schedule(Topic::named("bench.tick"), time_from_seconds(static_cast<double>(i)));
        }
        state.ResumeTiming();

        kernel.run();
        benchmark::DoNotOptimize(seen);
    }
}
BENCHMARK(BM_KernelDispatch)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_Admission: N requests against a 64-PM pool, first-fit, no trace
// ---------------------------------------------------------------------------

static void BM_Admission(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        Simulation sim;
        sim.kernel().set_event_log_enabled(false);
        for (int i = 0; i < 64; ++i) {
            sim.add_pm("pm-" + std::to_string(i), Resources{16, 65536, 0});
        }
        sim.set_allocator(std::make_unique<FirstFitAllocator>());

        for (int64_t i = 0; i < n; ++i) {
            auto handle = sim.reserve_request();
            RequestArrival arrival;
            arrival.request = handle.request;
            arrival.vm = handle.vm;
            arrival.name = "r" + std::to_string(i);
            arrival.demand = Resources{static_cast<uint64_t>(1 + i % 4), 2048, 0};
            sim.submit_request(time_from_seconds(static_cast<double>(i) * 0.01), std::move(arrival));
        }

        auto report = sim.run();
        benchmark::DoNotOptimize(report.events_processed);
    }
}
BENCHMARK(BM_Admission)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
