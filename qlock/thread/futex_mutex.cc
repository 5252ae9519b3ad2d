// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/futex_mutex.h"

#include <errno.h>

#include "qlock/log/logging.h"
#include "qlock/thread/internal/futex.h"
#include "qlock/thread/spin_wait.h"

namespace qlock {

namespace {

void sleep_while_contended(std::atomic<int32_t> *state, int32_t contended) {
#ifdef QLOCK_PLATFORM_LINUX
    const int err = thread_internal::futex::wait_until(
            state, contended, thread_internal::kernel_timeout::never());
    if (err == 0 || err == -EAGAIN || err == -EINTR) {
        return;
    }
    if (err != -ENOSYS) {
        QLOCK_RAW_CRITICAL("futex wait failed: {}", -err);
    }
#else
    (void) state;
    (void) contended;
#endif
    thread_internal::spin_wait::yield();
}

}  // namespace

futex_mutex::~futex_mutex() {
    QLOCK_DCHECK(state_.load(std::memory_order_relaxed) == kUnlocked,
                 "futex_mutex destroyed while held");
}

void futex_mutex::lock_slow() {
    thread_internal::spin_wait spinner;
    while (spinner.spin()) {
        int32_t s = state_.load(std::memory_order_relaxed);
        if (s == kUnlocked) {
            if (state_.compare_exchange_weak(s, kLocked, std::memory_order_acquire,
                                             std::memory_order_relaxed)) {
                return;
            }
        } else if (s == kContended) {
            break;
        }
    }

    // From here on we take the lock as contended: we cannot tell whether
    // other sleepers remain, so our unlock() has to issue a wake.
    while (state_.exchange(kContended, std::memory_order_acquire) != kUnlocked) {
        sleep_while_contended(&state_, kContended);
    }
}

void futex_mutex::unlock_slow() {
#ifdef QLOCK_PLATFORM_LINUX
    const int err = thread_internal::futex::wake(&state_, 1);
    // EFAULT: the word was freed by a thread that acquired and destroyed the
    // mutex right after our exchange; there is nobody left to wake.
    if (err < 0 && err != -EFAULT && err != -ENOSYS) {
        QLOCK_RAW_CRITICAL("futex wake failed: {}", -err);
    }
#endif
}

}  // namespace qlock
