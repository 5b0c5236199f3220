#include <benchmark/benchmark.h>
#include "citadel/call_table.hpp"
#include <string>

using namespace citadel;

static CallRecord make_record(const std::string& session, int64_t client_id) {
    CallRecord rec;
    rec.session_id = session;
    rec.client_id = RequestId{client_id};
    rec.method = "tools/call";
    rec.created_at = CallTable::Clock::now();
    rec.on_complete = [](Response) {};
    return rec;
}

// Insert followed by resolve, with `range(0)` calls already outstanding
static void BM_InsertResolve(benchmark::State& state) {
    CallTable table;
    for (int64_t i = 0; i < state.range(0); ++i) {
        (void)table.insert(make_record("background", i));
    }
    int64_t client_id = 0;
    for (auto _ : state) {
        auto id = table.insert(make_record("session", client_id++));
        auto rec = table.resolve(id);
        benchmark::DoNotOptimize(rec);
    }
}
BENCHMARK(BM_InsertResolve)->Arg(0)->Arg(100)->Arg(10000)->MinTime(1.0);

static void BM_FindByClientId(benchmark::State& state) {
    CallTable table;
    for (int64_t i = 0; i < state.range(0); ++i) {
        (void)table.insert(make_record("session-" + std::to_string(i % 16), i));
    }
    for (auto _ : state) {
        auto id = table.find("session-3", RequestId{int64_t{3}});
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_FindByClientId)->Arg(100)->Arg(10000)->MinTime(1.0);

static void BM_ExpireNothing(benchmark::State& state) {
    CallTable table;
    for (int64_t i = 0; i < state.range(0); ++i) {
        (void)table.insert(make_record("session", i));
    }
    for (auto _ : state) {
        auto expired = table.expire(std::chrono::hours(1));
        benchmark::DoNotOptimize(expired);
    }
}
BENCHMARK(BM_ExpireNothing)->Arg(100)->Arg(10000)->MinTime(1.0);

// Several sessions sharing one backend connection
static void BM_ContendedInsertResolve(benchmark::State& state) {
    static CallTable table;
    const std::string session = "session-" + std::to_string(state.thread_index());
    int64_t client_id = 0;
    for (auto _ : state) {
        auto id = table.insert(make_record(session, client_id++));
        auto rec = table.resolve(id);
        benchmark::DoNotOptimize(rec);
    }
}
BENCHMARK(BM_ContendedInsertResolve)->Threads(1)->Threads(4)->Threads(8)->MinTime(1.0);
