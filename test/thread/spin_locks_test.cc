// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>   // NOLINT(build/c++11)
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include "gtest/gtest.h"
#include "qlock/thread/adaptive_mutex.h"
#include "qlock/thread/futex_mutex.h"
#include "qlock/thread/mcs_lock.h"
#include "qlock/thread/tas_lock.h"
#include "qlock/thread/ticket_lock.h"
#include "qlock/thread/ttas_lock.h"

namespace qlock {

namespace {

template<typename Lock>
class LockTest : public testing::Test {
  protected:
    Lock lock_;
};

using lock_types = testing::Types<tas_lock, ttas_lock, ticket_lock, mcs_lock,
                                  futex_mutex, adaptive_mutex>;
TYPED_TEST_SUITE(LockTest, lock_types);

TYPED_TEST(LockTest, TryLock) {
    EXPECT_TRUE(this->lock_.try_lock());
    EXPECT_TRUE(this->lock_.is_locked());
    EXPECT_FALSE(this->lock_.try_lock());
    this->lock_.unlock();
    EXPECT_FALSE(this->lock_.is_locked());
    this->lock_.lock();
    EXPECT_FALSE(this->lock_.try_lock());
    this->lock_.unlock();
}

TYPED_TEST(LockTest, TryLockFromOtherThread) {
    this->lock_.lock();
    bool acquired = true;
    std::thread t([&] { acquired = this->lock_.try_lock(); });
    t.join();
    EXPECT_FALSE(acquired);
    this->lock_.unlock();
}

TYPED_TEST(LockTest, MutualExclusion) {
    constexpr int kThreads = 8;
    constexpr int kIterations = 20000;
    int64_t counter = 0;
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < kIterations; ++j) {
                std::lock_guard<TypeParam> l(this->lock_);
                if (inside.fetch_add(1, std::memory_order_relaxed) != 0) {
                    overlap.store(true);
                }
                ++counter;
                inside.fetch_sub(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_FALSE(overlap.load());
    EXPECT_EQ(counter, int64_t{kThreads} * kIterations);
    EXPECT_FALSE(this->lock_.is_locked());
}

// Many more runnable threads than cores, released together. Spinners must
// give up their time slice so that a preempted holder gets to run.
TYPED_TEST(LockTest, MoreThreadsThanCores) {
    const int cores = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    const int threads_count = std::min(16, std::max(4, 2 * cores));
    constexpr int kIterations = 5000;
    int64_t counter = 0;
    std::atomic<int> ready{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < threads_count; ++i) {
        threads.emplace_back([&] {
            ready.fetch_add(1);
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            for (int j = 0; j < kIterations; ++j) {
                std::lock_guard<TypeParam> l(this->lock_);
                ++counter;
            }
        });
    }
    while (ready.load() != threads_count) {
        std::this_thread::yield();
    }
    const auto start = std::chrono::steady_clock::now();
    go.store(true, std::memory_order_release);
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(60));
    EXPECT_EQ(counter, int64_t{threads_count} * kIterations);
}

TEST(McsLockTest, ExplicitNodesNest) {
    mcs_lock outer;
    mcs_lock inner;
    mcs_lock::node outer_node;
    mcs_lock::node inner_node;
    outer.lock(&outer_node);
    inner.lock(&inner_node);
    EXPECT_TRUE(outer.is_locked());
    EXPECT_TRUE(inner.is_locked());
    inner.unlock(&inner_node);
    outer.unlock(&outer_node);
    EXPECT_FALSE(outer.is_locked());
    EXPECT_FALSE(inner.is_locked());
}

TEST(TicketLockTest, ServesInArrivalOrder) {
    constexpr int kWaiters = 3;
    ticket_lock lock;
    std::vector<int> order;
    std::vector<std::thread> threads;
    std::atomic<int> started{0};

    lock.lock();
    for (int i = 0; i < kWaiters; ++i) {
        threads.emplace_back([&, i] {
            started.fetch_add(1);
            lock.lock();
            order.push_back(i);
            lock.unlock();
        });
        while (started.load() != i + 1) {
            std::this_thread::yield();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    lock.unlock();
    for (auto &t : threads) {
        t.join();
    }
    ASSERT_EQ(order.size(), static_cast<size_t>(kWaiters));
    for (int i = 0; i < kWaiters; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

}  // namespace

}  // namespace qlock
