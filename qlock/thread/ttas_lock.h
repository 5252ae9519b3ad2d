// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// Test-and-test-and-set spin lock. Waiters spin on a plain load, so the
// cache line stays shared until the holder releases it, and only then race
// with an exchange.

#ifndef QLOCK_THREAD_TTAS_LOCK_H_
#define QLOCK_THREAD_TTAS_LOCK_H_

#include <atomic>

#include "qlock/base/profile.h"
#include "qlock/thread/spin_wait.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

class QLOCK_LOCKABLE ttas_lock {
  public:
    constexpr ttas_lock() : locked_(false) {}

    ttas_lock(const ttas_lock &) = delete;

    ttas_lock &operator=(const ttas_lock &) = delete;

    void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        thread_internal::spin_wait spinner;
        for (;;) {
            if (!locked_.exchange(true, std::memory_order_acquire)) {
                return;
            }
            while (locked_.load(std::memory_order_relaxed)) {
                if (!spinner.spin()) {
                    thread_internal::spin_wait::yield();
                }
            }
        }
    }

    bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        return !locked_.load(std::memory_order_relaxed) &&
               !locked_.exchange(true, std::memory_order_acquire);
    }

    void unlock() QLOCK_UNLOCK_FUNCTION() {
        locked_.store(false, std::memory_order_release);
    }

    bool is_locked() const { return locked_.load(std::memory_order_relaxed); }

  private:
    std::atomic<bool> locked_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_TTAS_LOCK_H_
