// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// lock_bench runs N threads that repeatedly acquire a lock, do some work,
// release it and do some more work, for a fixed measuring window. For every
// lock it reports how many lock operations each thread completed.
//
//   lock_bench --locks=adaptive_mutex,std_mutex --threads=1-8 \
//              --locked_ns=10,100-500 --unlocked_ns=0 --measure_ms=500

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>   // NOLINT(build/c++11)
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "qlock/log/logging.h"
#include "qlock/thread/adaptive_mutex.h"
#include "qlock/thread/futex_mutex.h"
#include "qlock/thread/mcs_lock.h"
#include "qlock/thread/parker.h"
#include "qlock/thread/spin_wait.h"
#include "qlock/thread/tas_lock.h"
#include "qlock/thread/ticket_lock.h"
#include "qlock/thread/ttas_lock.h"
#include "tools/lock_bench/bench_options.h"

DEFINE_string(locks, "adaptive_mutex,futex_mutex,std_mutex,ticket_lock,mcs_lock,ttas_lock,tas_lock",
              "Comma separated locks to measure; the first one is the baseline "
              "for the relative throughput column");
DEFINE_string(threads, "1,2,4,8", "Thread counts, e.g. 1,2,4-8");
DEFINE_int32(measure_ms, 1000, "Length of the measuring window of each run");
DEFINE_string(locked_ns, "10", "Work inside the lock per operation, e.g. 10,50-200");
DEFINE_string(unlocked_ns, "0", "Work outside the lock per operation, e.g. 0,100-1000");

namespace qlock {

namespace bench {

namespace {

constexpr uint64_t kRedrawEvery = 10000;

struct run_config {
    int num_threads = 1;
    std::chrono::milliseconds measure{1000};
    work_range locked;
    work_range unlocked;
};

void run_work(uint64_t units) {
    for (uint64_t i = 0; i < units; ++i) {
        thread_internal::spin_wait::pause(1);
    }
}

// Average cost in nanoseconds of one pause iteration of run_work().
uint64_t calibrate_ns_per_unit() {
    constexpr int kAttempts = 10;
    constexpr uint64_t kUnits = 10000;
    uint64_t total = 0;
    for (int i = 0; i < kAttempts; ++i) {
        run_work(kUnits);
        const auto start = std::chrono::steady_clock::now();
        run_work(kUnits);
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start).count();
        total += std::max<uint64_t>(1, static_cast<uint64_t>(elapsed) / kUnits);
    }
    return total / kAttempts;
}

template<typename Lock>
std::vector<double> run_one(const run_config &config) {
    struct QLOCK_CACHE_LINE_ALIGNED context {
        Lock lock;
        QLOCK_CACHE_LINE_ALIGNED std::atomic<bool> start{false};
        std::atomic<bool> running{true};
    };
    context ctx;
    std::vector<double> results(config.num_threads, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < config.num_threads; ++i) {
        threads.emplace_back([&ctx, &config, &results, i] {
            uint64_t prng = reinterpret_cast<uintptr_t>(&results[i]) ^ 0x9e3779b97f4a7c15ULL;
            uint64_t locked = config.locked.pick(&prng);
            uint64_t unlocked = config.unlocked.pick(&prng);
            uint64_t ops = 0;
            while (!ctx.start.load(std::memory_order_acquire)) {
                thread_internal::spin_wait::yield();
            }
            while (ctx.running.load(std::memory_order_relaxed)) {
                ctx.lock.lock();
                run_work(locked);
                ctx.lock.unlock();
                run_work(unlocked);
                ++ops;
                if (ops % kRedrawEvery == 0) {
                    locked = config.locked.pick(&prng);
                    unlocked = config.unlocked.pick(&prng);
                }
            }
            results[i] = static_cast<double>(ops);
        });
    }
    ctx.start.store(true, std::memory_order_release);
    std::this_thread::sleep_for(config.measure);
    ctx.running.store(false, std::memory_order_relaxed);
    for (auto &t : threads) {
        t.join();
    }
    return results;
}

using runner = std::function<std::vector<double>(const run_config &)>;

const std::map<std::string, runner> &registry() {
    static const std::map<std::string, runner> locks = {
            {"adaptive_mutex", run_one<adaptive_mutex>},
            {"futex_mutex",    run_one<futex_mutex>},
            {"std_mutex",      run_one<std::mutex>},
            {"ticket_lock",    run_one<ticket_lock>},
            {"mcs_lock",       run_one<mcs_lock>},
            {"ttas_lock",      run_one<ttas_lock>},
            {"tas_lock",       run_one<tas_lock>},
    };
    return locks;
}

int run(const std::vector<std::string> &lock_names) {
    std::string error;
    std::vector<int> thread_counts;
    std::vector<work_range> locked;
    std::vector<work_range> unlocked;
    if (!parse_thread_list(FLAGS_threads, &thread_counts, &error) ||
        !parse_work_list(FLAGS_locked_ns, &locked, &error) ||
        !parse_work_list(FLAGS_unlocked_ns, &unlocked, &error)) {
        QLOCK_RAW_ERROR("{}", error);
        return 1;
    }
    if (FLAGS_measure_ms <= 0) {
        QLOCK_RAW_ERROR("--measure_ms must be positive, got {}", FLAGS_measure_ms);
        return 1;
    }

    const uint64_t ns_per_unit = calibrate_ns_per_unit();
    QLOCK_RAW_INFO("parker backend: {}, one work unit takes ~{}ns",
                   thread_internal::parker::mode_name(), ns_per_unit);

    for (const work_range &u : unlocked) {
        for (const work_range &l : locked) {
            for (int n : thread_counts) {
                run_config config;
                config.num_threads = n;
                config.measure = std::chrono::milliseconds(FLAGS_measure_ms);
                config.locked = l.scaled(ns_per_unit);
                config.unlocked = u.scaled(ns_per_unit);

                fmt::print("measure={}ms threads={} locked={} unlocked={}\n{}\n{} relative\n",
                           FLAGS_measure_ms, n, l.to_string(), u.to_string(),
                           std::string(84, '-'), format_header());
                double baseline = 0;
                for (const std::string &name : lock_names) {
                    const result r = summarize(name, registry().at(name)(config));
                    if (baseline == 0) {
                        baseline = r.sum;
                    }
                    fmt::print("{} {:>7.2f}x\n", format_row(r),
                               baseline > 0 ? r.sum / baseline : 0.0);
                }
                fmt::print("\n");
            }
        }
    }
    return 0;
}

}  // namespace

}  // namespace bench

}  // namespace qlock

int main(int argc, char *argv[]) {
    gflags::SetUsageMessage("Measure lock throughput under contention");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    std::vector<std::string> lock_names;
    for (const std::string &name : qlock::bench::split_csv(FLAGS_locks)) {
        if (qlock::bench::registry().count(name) == 0) {
            QLOCK_RAW_ERROR("unknown lock `{}'", name);
            return 1;
        }
        lock_names.push_back(name);
    }
    return qlock::bench::run(lock_names);
}
