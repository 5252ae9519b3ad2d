// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/adaptive_mutex.h"

#include <atomic>
#include <chrono>
#include <mutex>   // NOLINT(build/c++11)
#include <random>
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include "gtest/gtest.h"
#include "qlock/base/profile.h"

namespace qlock {

namespace thread_internal {

struct adaptive_mutex_peer {
    // A racy snapshot of the newest queued waiter.
    static const wait_node *head(const adaptive_mutex &mu) {
        return lock_word::head(mu.word_.load(std::memory_order_acquire));
    }
};

}  // namespace thread_internal

}  // namespace qlock

namespace {

using qlock::thread_internal::adaptive_mutex_peer;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

QLOCK_CONST_INIT qlock::adaptive_mutex global_mu;
int global_counter QLOCK_GUARDED_BY(global_mu) = 0;

static_assert(sizeof(qlock::adaptive_mutex) == sizeof(uintptr_t),
              "adaptive_mutex must stay one word");

// Spin until `mu` has a queued waiter. Only used to line threads up.
void wait_for_waiters(const qlock::adaptive_mutex &mu) {
    while (!mu.has_waiters()) {
        std::this_thread::yield();
    }
}

TEST(AdaptiveMutexTest, LockUnlock) {
    qlock::adaptive_mutex mu;
    EXPECT_FALSE(mu.is_locked());
    mu.lock();
    EXPECT_TRUE(mu.is_locked());
    EXPECT_FALSE(mu.try_lock());
    mu.unlock();
    EXPECT_FALSE(mu.is_locked());
    EXPECT_TRUE(mu.try_lock());
    mu.unlock();
}

TEST(AdaptiveMutexTest, GlobalMutex) {
    {
        qlock::mutex_lock l(&global_mu);
        ++global_counter;
    }
    std::thread t([] {
        qlock::mutex_lock l(&global_mu);
        ++global_counter;
    });
    t.join();
    qlock::mutex_lock l(&global_mu);
    EXPECT_EQ(global_counter, 2);
}

// One thread holds the mutex while another blocks on it; the value written
// under the lock must be visible to the next holder.
TEST(AdaptiveMutexTest, HandoffAcrossThreads) {
    qlock::adaptive_mutex mu;
    int counter = 0;

    mu.lock();
    std::thread t([&] {
        mu.lock();
        ++counter;
        mu.unlock();
    });
    wait_for_waiters(mu);
    std::this_thread::sleep_for(milliseconds(10));
    ++counter;
    mu.unlock();
    t.join();

    mu.lock();
    EXPECT_EQ(counter, 2);
    mu.unlock();
    EXPECT_FALSE(mu.has_waiters());
}

TEST(AdaptiveMutexTest, ManyThreadsIncrement) {
    constexpr int kThreads = 8;
    constexpr int kIterations = 100000;
    qlock::adaptive_mutex mu;
    int64_t counter = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < kIterations; ++j) {
                std::lock_guard<qlock::adaptive_mutex> l(mu);
                ++counter;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(counter, int64_t{kThreads} * kIterations);
    EXPECT_FALSE(mu.is_locked());
    EXPECT_FALSE(mu.has_waiters());
}

TEST(AdaptiveMutexTest, ExpiredTimedLockReturnsAtOnce) {
    qlock::adaptive_mutex mu;
    std::atomic<bool> release{false};
    std::thread holder([&] {
        mu.lock();
        while (!release.load()) {
            std::this_thread::sleep_for(milliseconds(1));
        }
        mu.unlock();
    });
    while (!mu.is_locked()) {
        std::this_thread::yield();
    }

    const auto start = steady_clock::now();
    EXPECT_FALSE(mu.try_lock_until(steady_clock::now() - std::chrono::seconds(1)));
    EXPECT_FALSE(mu.try_lock_for(milliseconds(0)));
    EXPECT_FALSE(mu.try_lock_for(milliseconds(-5)));
    EXPECT_LT(steady_clock::now() - start, milliseconds(500));
    // Nothing was queued.
    EXPECT_FALSE(mu.has_waiters());

    release.store(true);
    holder.join();

    // An expired deadline still succeeds when the mutex is free.
    EXPECT_TRUE(mu.try_lock_until(steady_clock::now() - std::chrono::seconds(1)));
    mu.unlock();
}

TEST(AdaptiveMutexTest, TimedLockTimesOut) {
    qlock::adaptive_mutex mu;
    mu.lock();
    std::thread waiter([&] {
        const auto start = steady_clock::now();
        EXPECT_FALSE(mu.try_lock_for(milliseconds(50)));
        EXPECT_GE(steady_clock::now() - start, milliseconds(40));
    });
    waiter.join();
    // The abandoned node is still queued until the next release drains it.
    mu.unlock();
    EXPECT_FALSE(mu.has_waiters());
    EXPECT_FALSE(mu.is_locked());
}

TEST(AdaptiveMutexTest, TimedLockSucceedsWhenReleased) {
    qlock::adaptive_mutex mu;
    mu.lock();
    std::thread waiter([&] {
        EXPECT_TRUE(mu.try_lock_for(std::chrono::seconds(30)));
        mu.unlock();
    });
    wait_for_waiters(mu);
    std::this_thread::sleep_for(milliseconds(10));
    mu.unlock();
    waiter.join();
    EXPECT_FALSE(mu.is_locked());
    EXPECT_FALSE(mu.has_waiters());
}

// A waiter queued behind an abandoned timed node must still be woken by the
// release that finds the abandoned node first.
TEST(AdaptiveMutexTest, AbandonedNodeDoesNotSwallowWake) {
    qlock::adaptive_mutex mu;
    mu.lock();

    std::thread timed([&] { EXPECT_FALSE(mu.try_lock_for(milliseconds(20))); });
    timed.join();
    ASSERT_TRUE(mu.has_waiters());

    std::atomic<bool> acquired{false};
    std::thread blocking([&] {
        mu.lock();
        acquired.store(true);
        mu.unlock();
    });
    std::this_thread::sleep_for(milliseconds(30));
    EXPECT_FALSE(acquired.load());

    mu.unlock();
    blocking.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_FALSE(mu.has_waiters());
}

TEST(AdaptiveMutexTest, UniqueLockTimed) {
    qlock::adaptive_mutex mu;
    std::unique_lock<qlock::adaptive_mutex> l(mu, std::chrono::milliseconds(10));
    EXPECT_TRUE(l.owns_lock());
    l.unlock();
    EXPECT_TRUE(l.try_lock_until(steady_clock::now() + milliseconds(10)));
}

// Waiters that queued one after another, with no newcomers around, are woken
// oldest first.
TEST(AdaptiveMutexTest, FifoWakeOrder) {
    constexpr int kWaiters = 4;
    qlock::adaptive_mutex mu;
    std::vector<int> order;
    std::vector<std::thread> threads;

    mu.lock();
    for (int i = 0; i < kWaiters; ++i) {
        const auto *previous_head = adaptive_mutex_peer::head(mu);
        threads.emplace_back([&, i] {
            mu.lock();
            order.push_back(i);
            mu.unlock();
        });
        // Nobody else touches the queue while we hold the mutex, so a new
        // head is this thread's node.
        while (adaptive_mutex_peer::head(mu) == previous_head) {
            std::this_thread::yield();
        }
    }
    mu.unlock();
    for (auto &t : threads) {
        t.join();
    }

    ASSERT_EQ(order.size(), static_cast<size_t>(kWaiters));
    for (int i = 0; i < kWaiters; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(AdaptiveMutexTest, LivenessUnderRepeatedContention) {
    constexpr int kThreads = 16;
    constexpr int kIterations = 5000;
    qlock::adaptive_mutex mu;
    std::vector<int> per_thread(kThreads, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            std::minstd_rand rng(i);
            for (int j = 0; j < kIterations; ++j) {
                qlock::mutex_lock l(&mu);
                ++per_thread[i];
                if (rng() % 64 == 0) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    for (int n : per_thread) {
        EXPECT_EQ(n, kIterations);
    }
    EXPECT_FALSE(mu.has_waiters());
}

TEST(AdaptiveMutexTest, TimedWaitersMixedWithBlockingWaiters) {
    constexpr int kBlocking = 4;
    constexpr int kTimed = 4;
    constexpr int kIterations = 5000;
    qlock::adaptive_mutex mu;
    int64_t counter = 0;
    std::atomic<int64_t> timed_successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kBlocking; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < kIterations; ++j) {
                qlock::mutex_lock l(&mu);
                ++counter;
            }
        });
    }
    for (int i = 0; i < kTimed; ++i) {
        threads.emplace_back([&, i] {
            std::minstd_rand rng(100 + i);
            for (int j = 0; j < kIterations; ++j) {
                if (mu.try_lock_for(std::chrono::microseconds(rng() % 200))) {
                    ++counter;
                    // Hold the lock a little so some timed waiters give up.
                    if (rng() % 16 == 0) {
                        std::this_thread::sleep_for(std::chrono::microseconds(100));
                    }
                    mu.unlock();
                    timed_successes.fetch_add(1);
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    mu.lock();
    EXPECT_EQ(counter, int64_t{kBlocking} * kIterations + timed_successes.load());
    mu.unlock();
    EXPECT_FALSE(mu.has_waiters());
}

}  // namespace
