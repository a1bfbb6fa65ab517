#include <benchmark/benchmark.h>
#include <stdexcept>
#include <string>
#include "vital_log.hpp"
#include "null_transport.hpp"

static std::unique_ptr<vital::WriterSink> makeSink(vital::LogLevel level) {
    return vital::WriterSink::configure()
        .minLevel(level)
        .writeTo<vital::NullTransport>()
        .build();
}

static const vital::Kvs& someKvs() {
    static const vital::Kvs kvs = {{"foo", "bar"}, {"qux", "dog"}};
    return kvs;
}

// ---------------------------------------------------------------------------
// BM_WriterSink_EmitEvent
// ---------------------------------------------------------------------------
static void BM_WriterSink_EmitEvent(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::TRACE);
    for (auto _ : state) {
        sink->emitEvent("myjob", "myevent", someKvs());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_EmitEvent);

static void BM_WriterSink_EmitEventErr(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::TRACE);
    const std::runtime_error testErr("my test error");
    for (auto _ : state) {
        sink->emitEventErr("myjob", "myevent", testErr, someKvs());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_EmitEventErr);

static void BM_WriterSink_EmitTiming(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::TRACE);
    for (auto _ : state) {
        sink->emitTiming("myjob", "myevent", 234203, someKvs());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_EmitTiming);

static void BM_WriterSink_EmitComplete(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::TRACE);
    for (auto _ : state) {
        sink->emitComplete("myjob", vital::CompletionStatus::Success, 234203, someKvs());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_EmitComplete);

// ---------------------------------------------------------------------------
// BM_WriterSink_Filtered
// Event rejected by its "level" key; measures the predicate alone.
// ---------------------------------------------------------------------------
static void BM_WriterSink_Filtered(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::ERROR);
    const vital::Kvs kvs = {{"level", "debug"}, {"foo", "bar"}};
    for (auto _ : state) {
        sink->emitEvent("myjob", "myevent", kvs);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_Filtered);

// ---------------------------------------------------------------------------
// BM_WriterSink_KvsSize
// Cost of sorting and rendering metadata as the map grows.
// ---------------------------------------------------------------------------
static void BM_WriterSink_KvsSize(benchmark::State& state) {
    auto sink = makeSink(vital::LogLevel::TRACE);
    vital::Kvs kvs;
    for (int64_t i = 0; i < state.range(0); ++i) {
        kvs["key" + std::to_string(i)] = "value" + std::to_string(i);
    }
    for (auto _ : state) {
        sink->emitEvent("myjob", "myevent", kvs);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WriterSink_KvsSize)->Arg(0)->Arg(4)->Arg(16)->Arg(64);

BENCHMARK_MAIN();
