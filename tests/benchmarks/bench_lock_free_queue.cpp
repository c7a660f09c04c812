#include <benchmark/benchmark.h>
#include "containers/lock_free_queue.hpp"
#include "common/logger.hpp"
#include "common/types.hpp"
#include <atomic>
#include <cstdio>
#include <thread>

using namespace exchange;

namespace {

// Same ring shape the logger drains
using LogRing = LockFreeRingBuffer<LogEntry, 8192>;

LogEntry make_entry() {
    LogEntry entry{};
    snprintf(entry.message, sizeof(entry.message), "Executed: BUY 10 @ 101.00 between order 4 and 3");
    entry.level = LogLevel::Info;
    return entry;
}

} // anonymous namespace

static void BM_QueueLogEntryTransport(benchmark::State& state) {
    LogRing queue;
    LogEntry entry = make_entry();
    for (auto _ : state) {
        entry.timestamp_ns = now_ns();
        queue.try_push(entry);
        LogEntry out;
        queue.try_pop(out);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_QueueLogEntryTransport);

// Producer formats and pushes while a drain thread pops, as Logger does
static void BM_QueueLogEntryDrain(benchmark::State& state) {
    LogRing queue;
    std::atomic<bool> running{true};

    std::thread drain([&]() {
        LogEntry out;
        while (running.load(std::memory_order_relaxed)) {
            queue.try_pop(out);
        }
        while (queue.try_pop(out)) {}
    });

    LogEntry entry = make_entry();
    int64_t pushed = 0;
    for (auto _ : state) {
        entry.timestamp_ns = now_ns();
        while (!queue.try_push(entry)) {}
        ++pushed;
    }

    running.store(false, std::memory_order_relaxed);
    drain.join();

    state.SetItemsProcessed(pushed);
    state.SetBytesProcessed(pushed * static_cast<int64_t>(sizeof(LogEntry)));
}
BENCHMARK(BM_QueueLogEntryDrain)->UseRealTime();

BENCHMARK_MAIN();
