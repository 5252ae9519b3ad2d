// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// parker is a one-shot event controlling the runnability of the single thread
// that owns it.  Each blocking episode runs the same protocol:
//
//   owner:   prepare();  <publish the parker somewhere>;  park();
//   other:   unpark();
//
// unpark() may run before, during or after park(); in every interleaving
// park() returns once unpark() has been called, and never blocks past it.
// Exactly one park() and at most one unpark() are allowed per episode.
//
// The blocking primitive is chosen at build time (see QLOCK_PARKER_MODE).
// When the chosen OS facility turns out to be unavailable at runtime the
// parker degrades to spinning on its own state word, which is slower but
// satisfies the same contract.

#ifndef QLOCK_THREAD_PARKER_H_
#define QLOCK_THREAD_PARKER_H_

#include "qlock/base/profile.h"

#ifdef QLOCK_PLATFORM_WINDOWS
#include <sdkddkver.h>
#else
#include <pthread.h>
#endif

#ifdef __linux__
#include <linux/futex.h>
#endif

#include <atomic>
#include <cstdint>

#include "qlock/thread/internal/kernel_timeout.h"

// May be chosen at compile time via -DQLOCK_FORCE_PARKER_MODE=<index>
#define QLOCK_PARKER_MODE_FUTEX 0
#define QLOCK_PARKER_MODE_CONDVAR 1
#define QLOCK_PARKER_MODE_KEYED_EVENT 2
#define QLOCK_PARKER_MODE_ALERT_BY_ID 3
#define QLOCK_PARKER_MODE_SPIN 4

#if defined(QLOCK_FORCE_PARKER_MODE)
#define QLOCK_PARKER_MODE QLOCK_FORCE_PARKER_MODE
#elif defined(_WIN32) && defined(_WIN32_WINNT_WIN8) && _WIN32_WINNT >= _WIN32_WINNT_WIN8
#define QLOCK_PARKER_MODE QLOCK_PARKER_MODE_ALERT_BY_ID
#elif defined(_WIN32)
#define QLOCK_PARKER_MODE QLOCK_PARKER_MODE_KEYED_EVENT
#elif defined(__linux__) && defined(FUTEX_CLOCK_REALTIME)
// FUTEX_CLOCK_REALTIME requires Linux >= 2.6.28.
#define QLOCK_PARKER_MODE QLOCK_PARKER_MODE_FUTEX
#elif defined(QLOCK_PLATFORM_POSIX)
#define QLOCK_PARKER_MODE QLOCK_PARKER_MODE_CONDVAR
#else
#define QLOCK_PARKER_MODE QLOCK_PARKER_MODE_SPIN
#endif

#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_FUTEX && !defined(__linux__)
#error QLOCK_PARKER_MODE_FUTEX requires Linux
#endif
#if (QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_KEYED_EVENT || \
     QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_ALERT_BY_ID) && !defined(_WIN32)
#error the keyed event and alert-by-id parkers require Windows
#endif
#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_CONDVAR && defined(_WIN32)
#error QLOCK_PARKER_MODE_CONDVAR requires pthreads
#endif

namespace qlock {

namespace thread_internal {

class parker {
  public:
    // kWaiting and kParked together form the "waiting" state of the
    // protocol; kParked additionally records that the owner is (about to
    // be) blocked in the kernel, which is the only case unpark() has to pay
    // for a wake syscall.
    enum state : int32_t {
        kEmpty = 0,
        kWaiting = 1,
        kParked = 2,
        kNotified = 3,
        kAbandoned = 4,
    };

    parker();

    // Not copyable or movable
    parker(const parker &) = delete;

    parker &operator=(const parker &) = delete;

    // REQUIRES: no park() in flight.
    ~parker();

    // Start a new blocking episode. Only the thread about to park may call it.
    void prepare();

    // Blocks the calling thread until unpark() is called.
    void park();

    // Blocks the calling thread until unpark() is called or `t` has passed.
    // Returns true if notified. An already expired `t` returns false at once
    // (unless already notified) without entering the kernel. After a false
    // return the episode is still open: the caller must either park again or
    // abandon().
    bool park_until(kernel_timeout t);

    // Notify the owner. Returns false, without touching the owner, if the
    // owner abandoned the episode; the caller then becomes responsible for
    // whatever object embeds this parker.
    bool unpark();

    // Give up an episode after park_until() timed out. Returns true if the
    // parker is now abandoned, false if an unpark() got in first, in which
    // case the episode completed normally.
    bool abandon();

    int32_t current_state() const {
        return state_.load(std::memory_order_acquire);
    }

    // Human readable name of the backend compiled in.
    static const char *mode_name();

    // False if the compiled backend is unusable on this machine and parkers
    // are spinning instead.
    static bool os_blocking_available();

  private:
    // Result of one os level wait.
    enum class wait_result {
        kWoken,        // returned, possibly spuriously
        kTimedOut,     // deadline passed
        kUnsupported,  // backend unusable, fall back to spinning
    };

    bool spin_until_notified(kernel_timeout t);

    bool leave_parked_after_timeout();

#if QLOCK_PARKER_MODE != QLOCK_PARKER_MODE_CONDVAR
    wait_result os_wait(kernel_timeout t);

    // What os_wake() needs to reach the owner. It is read before the
    // notification is published: once the owner can observe kNotified it
    // may free the parker.
    uintptr_t os_wake_key() const;

    static void os_wake(uintptr_t key);

    void os_consume_pending_wake();
#endif

    std::atomic<int32_t> state_;

#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_CONDVAR
    pthread_mutex_t mu_;
    pthread_cond_t cv_;
    bool os_ready_;
#elif QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_ALERT_BY_ID
    // Windows thread id of the owner, recorded by prepare().
    unsigned long thread_id_;  // NOLINT(runtime/int)
#endif
};

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_THREAD_PARKER_H_
