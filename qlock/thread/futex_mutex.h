// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// futex_mutex is the classic three state futex lock:
//
//   0  unlocked
//   1  locked, nobody sleeping
//   2  locked, and a thread may be sleeping on the word
//
// unlock() only enters the kernel when it swaps out state 2. Off Linux there
// is no futex; sleeping is replaced by yielding the thread.

#ifndef QLOCK_THREAD_FUTEX_MUTEX_H_
#define QLOCK_THREAD_FUTEX_MUTEX_H_

#include <atomic>
#include <cstdint>

#include "qlock/base/profile.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

class QLOCK_LOCKABLE futex_mutex {
  public:
    constexpr futex_mutex() : state_(kUnlocked) {}

    ~futex_mutex();

    futex_mutex(const futex_mutex &) = delete;

    futex_mutex &operator=(const futex_mutex &) = delete;

    void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        if (!try_lock()) {
            lock_slow();
        }
    }

    bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        int32_t expected = kUnlocked;
        return state_.compare_exchange_strong(expected, kLocked, std::memory_order_acquire,
                                              std::memory_order_relaxed);
    }

    void unlock() QLOCK_UNLOCK_FUNCTION() {
        if (state_.exchange(kUnlocked, std::memory_order_release) == kContended) {
            unlock_slow();
        }
    }

    bool is_locked() const { return state_.load(std::memory_order_relaxed) != kUnlocked; }

  private:
    static constexpr int32_t kUnlocked = 0;
    static constexpr int32_t kLocked = 1;
    static constexpr int32_t kContended = 2;

    void lock_slow() QLOCK_COLD;

    void unlock_slow() QLOCK_COLD;

    std::atomic<int32_t> state_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_FUTEX_MUTEX_H_
