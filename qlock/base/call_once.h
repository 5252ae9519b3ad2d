// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// -----------------------------------------------------------------------------
// File: call_once.h
// -----------------------------------------------------------------------------
//
// This header file provides a qlock version of `std::call_once` for invoking
// a given function at most once, across all threads. Unlike `std::call_once`
// it never touches a pthread mutex or futex, so the parker backends can use it
// to create their process-wide OS resources before any parker exists.
//
// The control word moves kOnceInit -> kOnceRunning -> kOnceDone (kOnceWaiter
// marks a running word that other threads are waiting on). Resources created
// through it are never torn down before process exit.

#ifndef QLOCK_BASE_CALL_ONCE_H_
#define QLOCK_BASE_CALL_ONCE_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <utility>

#include "qlock/base/profile.h"
#include "qlock/thread/spin_wait.h"

namespace qlock {

class once_flag;

namespace base_internal {
std::atomic<uint32_t> *control_word(qlock::once_flag *flag);
}  // namespace base_internal

// call_once()
//
// For all invocations using a given `once_flag`, invokes a given `fn` exactly
// once across all threads. The first call to `call_once()` with a particular
// `once_flag` argument will run the specified function with the provided
// `args`; other calls with the same `once_flag` argument will not run the
// function, but will wait for the provided function to finish running (if it
// is still running).
//
// Example:
//
//   static qlock::once_flag keyed_event_once;
//   static HANDLE keyed_event;
//
//   HANDLE get_keyed_event() {
//     qlock::call_once(keyed_event_once, create_keyed_event, &keyed_event);
//     return keyed_event;
//   }
template<typename Callable, typename... Args>
void call_once(qlock::once_flag &flag, Callable &&fn, Args &&... args);

// once_flag
//
// Objects of this type are used to distinguish calls to `call_once()` and
// ensure the provided function is only invoked once across all threads. This
// type is not copyable or movable. However, it has a `constexpr`
// constructor, and is safe to use as a namespace-scoped global variable.
class once_flag {
  public:
    constexpr once_flag() : control_(0) {}

    once_flag(const once_flag &) = delete;

    once_flag &operator=(const once_flag &) = delete;

    // True once the function passed to call_once() has returned.
    bool is_done() const;

  private:
    friend std::atomic<uint32_t> *base_internal::control_word(once_flag *flag);

    std::atomic<uint32_t> control_;
};

//------------------------------------------------------------------------------
// End of public interfaces.
// Implementation details follow.
//------------------------------------------------------------------------------

namespace base_internal {

// Bit patterns for call_once state machine values.  Internal implementation
// detail, not for use by clients.
//
// The bit patterns are arbitrarily chosen from unlikely values, to aid in
// debugging.  However, kOnceInit must be 0, so that a zero-initialized
// once_flag will be valid for immediate use.
enum {
    kOnceInit = 0,
    kOnceRunning = 0x65C2937B,
    kOnceWaiter = 0x05A308D2,
    // A very small constant is chosen for kOnceDone so that it fit in a single
    // compare with immediate instruction for most common ISAs.
    kOnceDone = 221,    // Random Number
};

template<typename Callable, typename... Args>
QLOCK_NO_INLINE
void call_once_impl(std::atomic<uint32_t> *control, Callable &&fn,
                    Args &&... args) {
    static const thread_internal::spin_lock_wait_transition trans[] = {
            {kOnceInit,    kOnceRunning, true},
            {kOnceRunning, kOnceWaiter,  false},
            {kOnceDone,    kOnceDone,    true}};

    // Short circuit the simplest case to avoid procedure call overhead.
    // spin_lock_wait() returns either kOnceInit or kOnceDone. If it returns
    // kOnceDone, it must have loaded the control word with
    // std::memory_order_acquire and seen a value of kOnceDone.
    uint32_t old_control = kOnceInit;
    if (control->compare_exchange_strong(old_control, kOnceRunning,
                                         std::memory_order_relaxed) ||
        thread_internal::spin_lock_wait(control, QLOCK_ARRAYSIZE(trans),
                                        trans) == kOnceInit) {
        std::invoke(std::forward<Callable>(fn), std::forward<Args>(args)...);
        control->store(base_internal::kOnceDone, std::memory_order_release);
    }  // else *control is already kOnceDone
}

QLOCK_FORCE_INLINE std::atomic<uint32_t> *control_word(once_flag *flag) {
    return &flag->control_;
}

}  // namespace base_internal

inline bool once_flag::is_done() const {
    return control_.load(std::memory_order_acquire) == base_internal::kOnceDone;
}

template<typename Callable, typename... Args>
void call_once(qlock::once_flag &flag, Callable &&fn, Args &&... args) {
    std::atomic<uint32_t> *once = base_internal::control_word(&flag);
    uint32_t s = once->load(std::memory_order_acquire);
    if (QLOCK_UNLIKELY(s != base_internal::kOnceDone)) {
        base_internal::call_once_impl(once, std::forward<Callable>(fn),
                                      std::forward<Args>(args)...);
    }
}

}  // namespace qlock

#endif  // QLOCK_BASE_CALL_ONCE_H_
