// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#ifndef QLOCK_THREAD_INTERNAL_FUTEX_H_
#define QLOCK_THREAD_INTERNAL_FUTEX_H_

#include "qlock/base/profile.h"

#ifdef QLOCK_PLATFORM_LINUX

#include <errno.h>
#include <linux/futex.h>
#include <sys/syscall.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>

#include "qlock/thread/internal/kernel_timeout.h"

// Some Android headers are missing these definitions even though they
// support these futex operations.
#ifndef SYS_futex
#define SYS_futex __NR_futex
#endif
#ifndef FUTEX_WAIT_BITSET
#define FUTEX_WAIT_BITSET 9
#endif
#ifndef FUTEX_PRIVATE_FLAG
#define FUTEX_PRIVATE_FLAG 128
#endif
#ifndef FUTEX_CLOCK_REALTIME
#define FUTEX_CLOCK_REALTIME 256
#endif
#ifndef FUTEX_BITSET_MATCH_ANY
#define FUTEX_BITSET_MATCH_ANY 0xFFFFFFFF
#endif

namespace qlock {

namespace thread_internal {

// Thin wrapper over the private futex operations. Both calls return 0 (or
// the number of woken threads) on success and -errno on failure.
class futex {
  public:
    static int wait_until(std::atomic<int32_t> *v, int32_t val,
                          kernel_timeout t) {
        long err = 0;  // NOLINT(runtime/int)
        if (t.has_timeout()) {
            // https://locklessinc.com/articles/futex_cheat_sheet/
            // Unlike FUTEX_WAIT, FUTEX_WAIT_BITSET uses absolute time.
            struct timespec abs_timeout = t.make_abs_timespec();
            // Atomically check that the futex value is still `val`, and if it
            // is, sleep until abs_timeout or until woken by FUTEX_WAKE.
            err = syscall(
                    SYS_futex, reinterpret_cast<int32_t *>(v),
                    FUTEX_WAIT_BITSET | FUTEX_PRIVATE_FLAG | FUTEX_CLOCK_REALTIME, val,
                    &abs_timeout, nullptr, FUTEX_BITSET_MATCH_ANY);
        } else {
            // Atomically check that the futex value is still `val`, and if it
            // is, sleep until woken by FUTEX_WAKE.
            err = syscall(SYS_futex, reinterpret_cast<int32_t *>(v),
                          FUTEX_WAIT | FUTEX_PRIVATE_FLAG, val, nullptr);
        }
        if (err != 0) {
            err = -errno;
        }
        return static_cast<int>(err);
    }

    static int wake(std::atomic<int32_t> *v, int32_t count) {
        long err = syscall(SYS_futex, reinterpret_cast<int32_t *>(v),  // NOLINT(runtime/int)
                           FUTEX_WAKE | FUTEX_PRIVATE_FLAG, count);
        if (QLOCK_UNLIKELY(err < 0)) {
            err = -errno;
        }
        return static_cast<int>(err);
    }
};

static_assert(sizeof(std::atomic<int32_t>) == sizeof(int32_t),
              "futex words must be plain 32-bit integers");

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_PLATFORM_LINUX

#endif  // QLOCK_THREAD_INTERNAL_FUTEX_H_
