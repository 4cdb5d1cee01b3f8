/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "nanots/calendar/CalendarTime.hpp"
#include "nanots/timestamp/Timestamp.hpp"
#include "nanots/timestamp/atomic.hpp"

#include <cstdlib>
#include <new>
#include <random>
#include <vector>

//-------------------------------------------------------------------------

using namespace nanots;

using namespace std::chrono_literals;

//-------------------------------------------------------------------------

struct InstantsFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        std::mt19937_64 rng{static_cast<uint64_t>(state.range(0))};
        std::uniform_int_distribution<int64_t> dist{
            kMinTimestamp.value() / 2, kMaxTimestamp.value() / 2};
        timestamps.clear();
        times.clear();
        for (int i = 0; i < kCount; ++i) {
            timestamps.emplace_back(dist(rng));
            times.push_back(timestamps.back().toTime());
        }
    }

    static constexpr int kCount = 1024;

    std::vector<Timestamp> timestamps;
    std::vector<CalendarTime> times;
};

struct MemoryManager : benchmark::MemoryManager
{
    benchmark::MemoryManager::Result stats;

    void Start() override
    {
        stats.num_allocs = 0;
        stats.max_bytes_used = 0;
        stats.total_allocated_bytes = 0;
        stats.net_heap_growth = 0;
    }

    void Stop(benchmark::MemoryManager::Result& result) override { result = stats; }
};

static MemoryManager s_mngr;

void* operator new(size_t size)
{
    void* ptr = std::malloc(size);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    ++s_mngr.stats.num_allocs;
    s_mngr.stats.total_allocated_bytes += static_cast<int64_t>(size);
    return ptr;
}

void operator delete(void* ptr) noexcept
{
    std::free(ptr);
}

void operator delete(void* ptr, size_t) noexcept
{
    std::free(ptr);
}

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(InstantsFixture, TimestampAdd)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto ts : timestamps) {
            benchmark::DoNotOptimize(ts.add(1500ms));
        }
    }
    state.SetItemsProcessed(state.iterations() * kCount);
}
BENCHMARK_REGISTER_F(InstantsFixture, TimestampAdd)->Arg(42);

BENCHMARK_DEFINE_F(InstantsFixture, CalendarTimeAdd)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto& t : times) {
            benchmark::DoNotOptimize(t.add(1500ms));
        }
    }
    state.SetItemsProcessed(state.iterations() * kCount);
}
BENCHMARK_REGISTER_F(InstantsFixture, CalendarTimeAdd)->Arg(42);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(InstantsFixture, TimestampSub)(benchmark::State& state)
{
    for (auto _ : state) {
        for (int i = 1; i < kCount; ++i) {
            benchmark::DoNotOptimize(timestamps[i].sub(timestamps[i - 1]));
        }
    }
    state.SetItemsProcessed(state.iterations() * (kCount - 1));
}
BENCHMARK_REGISTER_F(InstantsFixture, TimestampSub)->Arg(42);

BENCHMARK_DEFINE_F(InstantsFixture, CalendarTimeSub)(benchmark::State& state)
{
    for (auto _ : state) {
        for (int i = 1; i < kCount; ++i) {
            benchmark::DoNotOptimize(times[i].sub(times[i - 1]));
        }
    }
    state.SetItemsProcessed(state.iterations() * (kCount - 1));
}
BENCHMARK_REGISTER_F(InstantsFixture, CalendarTimeSub)->Arg(42);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(InstantsFixture, TimestampTruncate)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto ts : timestamps) {
            benchmark::DoNotOptimize(ts.truncate(1min));
        }
    }
    state.SetItemsProcessed(state.iterations() * kCount);
}
BENCHMARK_REGISTER_F(InstantsFixture, TimestampTruncate)->Arg(42);

BENCHMARK_DEFINE_F(InstantsFixture, CalendarTimeTruncate)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto& t : times) {
            benchmark::DoNotOptimize(t.truncate(1min));
        }
    }
    state.SetItemsProcessed(state.iterations() * kCount);
}
BENCHMARK_REGISTER_F(InstantsFixture, CalendarTimeTruncate)->Arg(42);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(InstantsFixture, Conversion)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto& t : times) {
            benchmark::DoNotOptimize(Timestamp::fromTime(t).toTime());
        }
    }
    state.SetItemsProcessed(state.iterations() * kCount);
}
BENCHMARK_REGISTER_F(InstantsFixture, Conversion)->Arg(42);

//-------------------------------------------------------------------------

static void AtomicCompareAndSwap(benchmark::State& state)
{
    static Timestamp s_shared{};
    for (auto _ : state) {
        auto current = atomicLoad(s_shared);
        while (!atomicCompareAndSwap(s_shared, current, current.add(1ns))) {
            current = atomicLoad(s_shared);
        }
    }
}
BENCHMARK(AtomicCompareAndSwap);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::RegisterMemoryManager(&s_mngr);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::RegisterMemoryManager(nullptr);
}

//-------------------------------------------------------------------------
