// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// tas_lock is the simplest possible spin lock: every attempt is an atomic
// exchange. Failed attempts back off exponentially, which keeps the cache
// line from bouncing between the spinners on every cycle. Once the backoff
// reaches its cap a waiter yields its time slice instead.
//
// It never blocks in the kernel and makes no fairness promise. It exists as a
// baseline for benchmarks; prefer adaptive_mutex.

#ifndef QLOCK_THREAD_TAS_LOCK_H_
#define QLOCK_THREAD_TAS_LOCK_H_

#include <atomic>

#include "qlock/base/profile.h"
#include "qlock/thread/spin_wait.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

class QLOCK_LOCKABLE tas_lock {
  public:
    constexpr tas_lock() : locked_(false) {}

    tas_lock(const tas_lock &) = delete;

    tas_lock &operator=(const tas_lock &) = delete;

    void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        int backoff = 1;
        while (locked_.exchange(true, std::memory_order_acquire)) {
            if (backoff < kMaxBackoff) {
                thread_internal::spin_wait::pause(backoff);
                backoff <<= 1;
            } else {
                thread_internal::spin_wait::yield();
            }
        }
    }

    bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        return !locked_.exchange(true, std::memory_order_acquire);
    }

    void unlock() QLOCK_UNLOCK_FUNCTION() {
        locked_.store(false, std::memory_order_release);
    }

    bool is_locked() const { return locked_.load(std::memory_order_relaxed); }

  private:
    static constexpr int kMaxBackoff = 64;

    std::atomic<bool> locked_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_TAS_LOCK_H_
