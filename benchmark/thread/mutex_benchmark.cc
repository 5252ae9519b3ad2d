// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include <chrono>
#include <cstdint>
#include <mutex>  // NOLINT(build/c++11)

#include <benchmark/benchmark.h>

#include "qlock/thread/adaptive_mutex.h"
#include "qlock/thread/futex_mutex.h"
#include "qlock/thread/mcs_lock.h"
#include "qlock/thread/tas_lock.h"
#include "qlock/thread/ticket_lock.h"
#include "qlock/thread/ttas_lock.h"

namespace {

void BM_AdaptiveMutex(benchmark::State &state) {
    static qlock::adaptive_mutex *mu = new qlock::adaptive_mutex;
    for (auto _ : state) {
        qlock::mutex_lock lock(mu);
    }
}
BENCHMARK(BM_AdaptiveMutex)->UseRealTime()->Threads(1)->ThreadPerCpu();

void BM_AdaptiveMutexTimed(benchmark::State &state) {
    static qlock::adaptive_mutex *mu = new qlock::adaptive_mutex;
    for (auto _ : state) {
        if (mu->try_lock_for(std::chrono::microseconds(state.range(0)))) {
            mu->unlock();
        }
    }
}
BENCHMARK(BM_AdaptiveMutexTimed)->UseRealTime()->Threads(1)->ThreadPerCpu()->Arg(10)->Arg(1000);

void delay_ns(int64_t ns, int *data) {
    const auto end = std::chrono::steady_clock::now() + std::chrono::nanoseconds(ns);
    while (std::chrono::steady_clock::now() < end) {
        ++(*data);
        benchmark::DoNotOptimize(*data);
    }
}

template<typename MutexType>
void BM_Uncontended(benchmark::State &state) {
    MutexType mu;
    for (auto _ : state) {
        std::lock_guard<MutexType> l(mu);
    }
}

template<typename MutexType>
void BM_Contended(benchmark::State &state) {
    struct Shared {
        MutexType mu;
        int data = 0;
    };
    static auto *shared = new Shared;
    int local = 0;
    for (auto _ : state) {
        // Model both local work outside of the critical section and some
        // work inside of it. Local work is multiplied by the number of
        // threads to keep the ratio between local work and the critical
        // section roughly equal regardless of the number of threads.
        delay_ns(100 * state.threads(), &local);
        std::lock_guard<MutexType> l(shared->mu);
        delay_ns(state.range(0), &shared->data);
    }
}

void contended_args(benchmark::internal::Benchmark *b) {
    b->UseRealTime();
    // ThreadPerCpu poorly handles non-power-of-two CPU counts.
    for (int threads : {1, 2, 4, 6, 8, 12, 16, 24, 32, 48, 64}) {
        b->Threads(threads);
    }
    // Some empirically chosen amounts of work in critical section.
    // 1 is low contention, 200 is high contention and few values in between.
    for (int work : {1, 20, 50, 200}) {
        b->Arg(work);
    }
}

BENCHMARK_TEMPLATE(BM_Uncontended, qlock::adaptive_mutex);
BENCHMARK_TEMPLATE(BM_Uncontended, qlock::futex_mutex);
BENCHMARK_TEMPLATE(BM_Uncontended, qlock::tas_lock);
BENCHMARK_TEMPLATE(BM_Uncontended, qlock::ttas_lock);
BENCHMARK_TEMPLATE(BM_Uncontended, qlock::ticket_lock);
BENCHMARK_TEMPLATE(BM_Uncontended, qlock::mcs_lock);
BENCHMARK_TEMPLATE(BM_Uncontended, std::mutex);

BENCHMARK_TEMPLATE(BM_Contended, qlock::adaptive_mutex)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, qlock::futex_mutex)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, qlock::tas_lock)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, qlock::ttas_lock)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, qlock::ticket_lock)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, qlock::mcs_lock)->Apply(contended_args);
BENCHMARK_TEMPLATE(BM_Contended, std::mutex)->Apply(contended_args);

}  // namespace
