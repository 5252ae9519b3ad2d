// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// -----------------------------------------------------------------------------
// File: adaptive_mutex.h
// -----------------------------------------------------------------------------
//
// adaptive_mutex is a one-word exclusive lock. The whole state, a LOCKED bit,
// a WAKING bit and the address of an intrusive stack of waiters, is packed
// into a single uintptr_t (see internal/lock_word.h), so an adaptive_mutex is
// as small as a pointer and can be constant initialized.
//
// Acquisition first tries an atomic bit-test-and-set, then spins for a bounded
// time while nobody is queued, and finally pushes a stack allocated wait_node
// onto the word and parks. Release clears LOCKED and, if there are waiters and
// no other releaser is busy with the queue, claims WAKING, links the stack
// into FIFO order and wakes the oldest waiter.
//
// Wake policy: a woken waiter is not handed the lock, it races for LOCKED
// again. Threads arriving at lock() may therefore barge ahead of queued
// waiters; among queued waiters the wake order is strictly FIFO.
//
// adaptive_mutex meets the standard Lockable and TimedLockable requirements,
// so std::lock_guard and std::unique_lock work with it.

#ifndef QLOCK_THREAD_ADAPTIVE_MUTEX_H_
#define QLOCK_THREAD_ADAPTIVE_MUTEX_H_

#include <atomic>
#include <chrono>
#include <cstdint>

#include "qlock/base/profile.h"
#include "qlock/log/logging.h"
#include "qlock/thread/internal/kernel_timeout.h"
#include "qlock/thread/internal/lock_word.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

namespace thread_internal {
struct adaptive_mutex_peer;
}  // namespace thread_internal

class QLOCK_LOCKABLE adaptive_mutex {
  public:
    constexpr adaptive_mutex() noexcept : word_(thread_internal::lock_word::kUnlocked) {}

    // REQUIRES: unlocked, and no thread is waiting for the mutex.
    ~adaptive_mutex();

    adaptive_mutex(const adaptive_mutex &) = delete;

    adaptive_mutex &operator=(const adaptive_mutex &) = delete;

    // Block until this mutex is free, then acquire it exclusively.
    QLOCK_FORCE_INLINE void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        if (!try_lock()) {
            lock_slow();
        }
    }

    // Acquire the mutex if it is free, without blocking. Succeeds even when
    // waiters are queued, as long as nobody holds the mutex.
    QLOCK_FORCE_INLINE bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        return (word_.fetch_or(thread_internal::lock_word::kLocked,
                               std::memory_order_acquire) &
                thread_internal::lock_word::kLocked) == 0;
    }

    // Release the mutex.
    // REQUIRES: held by the calling thread.
    QLOCK_FORCE_INLINE void unlock() QLOCK_UNLOCK_FUNCTION() {
        const uintptr_t v = word_.fetch_and(~thread_internal::lock_word::kLocked,
                                            std::memory_order_release);
        QLOCK_DCHECK(thread_internal::lock_word::is_locked(v),
                     "unlock() of an adaptive_mutex that is not locked");
        if (!thread_internal::lock_word::is_waking(v) &&
            thread_internal::lock_word::has_waiters(v)) {
            unlock_slow();
        }
    }

    // Try to acquire the mutex until `deadline`. Returns false, without
    // blocking, when the deadline already passed and the mutex is held.
    template<typename Clock, typename Duration>
    bool try_lock_until(const std::chrono::time_point<Clock, Duration> &deadline)
    QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        if (try_lock()) {
            return true;
        }
        return lock_slow_until(thread_internal::kernel_timeout::from_time_point(deadline));
    }

    template<typename Rep, typename Period>
    bool try_lock_for(const std::chrono::duration<Rep, Period> &timeout)
    QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        if (try_lock()) {
            return true;
        }
        if (timeout <= std::chrono::duration<Rep, Period>::zero()) {
            return false;
        }
        return lock_slow_until(thread_internal::kernel_timeout::from_now(timeout));
    }

    // A racy snapshot; only meaningful for debugging and tests.
    bool is_locked() const {
        return thread_internal::lock_word::is_locked(word_.load(std::memory_order_relaxed));
    }

    // A racy snapshot of whether any thread is queued.
    bool has_waiters() const {
        return thread_internal::lock_word::has_waiters(word_.load(std::memory_order_relaxed));
    }

  private:
    void lock_slow() QLOCK_COLD;

    bool lock_slow_until(thread_internal::kernel_timeout t) QLOCK_COLD;

    void unlock_slow() QLOCK_COLD;

    // Claims WAKING and removes the oldest waiter from the queue. Returns
    // nullptr when there is nothing to wake or the drain is left to someone
    // else.
    thread_internal::wait_node *dequeue_oldest();

    std::atomic<uintptr_t> word_;

    // Lets tests look at the queue head.
    friend struct thread_internal::adaptive_mutex_peer;
};

// mutex_lock
//
// Arranges to acquire an adaptive_mutex for the duration of a C++ scope.
//
// Example:
//
//   qlock::adaptive_mutex mu;
//   int counter QLOCK_GUARDED_BY(mu);
//
//   void increment() {
//     qlock::mutex_lock l(&mu);
//     ++counter;
//   }
class QLOCK_SCOPED_LOCKABLE mutex_lock {
  public:
    explicit mutex_lock(adaptive_mutex *mu) QLOCK_EXCLUSIVE_LOCK_FUNCTION(mu)
            : mu_(mu) {
        mu_->lock();
    }

    mutex_lock(const mutex_lock &) = delete;  // NOLINT(runtime/mutex)
    mutex_lock(mutex_lock &&) = delete;  // NOLINT(runtime/mutex)
    mutex_lock &operator=(const mutex_lock &) = delete;

    mutex_lock &operator=(mutex_lock &&) = delete;

    ~mutex_lock() QLOCK_UNLOCK_FUNCTION() { mu_->unlock(); }

  private:
    adaptive_mutex *const mu_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_ADAPTIVE_MUTEX_H_
