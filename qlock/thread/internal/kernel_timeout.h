// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// An optional absolute timeout, with nanosecond granularity,
// compatible with std::chrono::system_clock. Suitable for in-register
// parameter-passing (e.g. syscalls.)
// Constructible from a std::chrono time point (for a timeout to be respected)
// or from nothing (for no timeout.)
// This is a private low-level API for use by a handful of low-level
// components that are friendly to the parker.

#ifndef QLOCK_THREAD_INTERNAL_KERNEL_TIMEOUT_H_
#define QLOCK_THREAD_INTERNAL_KERNEL_TIMEOUT_H_

#include <time.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

namespace qlock {

namespace thread_internal {

class kernel_timeout {
  public:
    // A timeout that should expire at <t>.  Any value, in the full
    // representable range, is valid, but a value at or before the unix
    // epoch is treated as already expired.
    explicit kernel_timeout(std::chrono::system_clock::time_point t)
            : ns_(make_ns(t)) {}

    // No timeout.
    kernel_timeout() : ns_(0) {}

    // A more explicit factory for those who prefer it.  Equivalent to {}.
    static kernel_timeout never() { return {}; }

    // A deadline expressed on any clock, typically std::chrono::steady_clock.
    // It is converted to a system_clock deadline by measuring the remaining
    // time on its own clock.
    template<typename Clock, typename Duration>
    static kernel_timeout from_time_point(
            const std::chrono::time_point<Clock, Duration> &deadline) {
        const auto remaining = deadline - Clock::now();
        if (remaining <= Duration::zero()) {
            return kernel_timeout(std::chrono::system_clock::time_point::min());
        }
        return from_now(remaining);
    }

    template<typename Rep, typename Period>
    static kernel_timeout from_now(const std::chrono::duration<Rep, Period> &d) {
        const auto now = std::chrono::system_clock::now();
        const auto limit = std::chrono::system_clock::time_point::max() - now;
        if (d >= limit) {
            return never();
        }
        return kernel_timeout(
                now + std::chrono::duration_cast<std::chrono::system_clock::duration>(d));
    }

    // We explicitly do not support other custom formats: timespec, int64_t nanos.
    // Unify on this and std::chrono::system_clock::time_point.

    bool has_timeout() const { return ns_ != 0; }

    // True if a timeout is set and it is not in the future.
    bool expired() const {
        return has_timeout() && ns_ <= now_ns();
    }

    // Convert to parameter for sem_timedwait/futex/similar.  Only for approved
    // users.  Do not call if !has_timeout.
    struct timespec make_abs_timespec() const;

    // Nanoseconds left before the timeout, 0 if it already passed. Do not call
    // if !has_timeout.
    int64_t in_nanoseconds_from_now() const {
        return std::max<int64_t>(0, ns_ - now_ns());
    }

  private:
    // internal rep, not user visible: ns after unix epoch.
    // zero = no timeout.
    // Negative we treat as an unlikely (and certainly expired!) but valid
    // timeout.
    int64_t ns_;

    static int64_t now_ns() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
    }

    static int64_t make_ns(std::chrono::system_clock::time_point t) {
        const auto since_epoch = t.time_since_epoch();
        if (since_epoch <= std::chrono::system_clock::duration::zero()) {
            // A timeout of 0 means no timeout, so anything in the past (or at
            // the epoch) collapses to the earliest representable deadline.
            return 1;
        }
        const auto max_ns = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(std::numeric_limits<int64_t>::max()));
        if (since_epoch >= max_ns) {
            return std::numeric_limits<int64_t>::max();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
    }
};

inline struct timespec kernel_timeout::make_abs_timespec() const {
    int64_t n = ns_;
    static const int64_t kNanosPerSecond = 1000 * 1000 * 1000;
    if (n == 0) {
        // Kernel interfaces want a real timespec; hand them the epoch plus one
        // nanosecond, which is already expired.
        n = 1;
    }

    // Kernel APIs validate timespecs as being at or after the epoch,
    // despite the kernel time type being signed.  However, no one can
    // tell the difference between a timeout at or before the epoch (since
    // all such timeouts have expired!)
    if (n < 0) n = 0;

    struct timespec abstime;
    int64_t seconds = (std::min)(n / kNanosPerSecond,
                                 int64_t{(std::numeric_limits<time_t>::max)()});
    abstime.tv_sec = static_cast<time_t>(seconds);
    abstime.tv_nsec = static_cast<decltype(abstime.tv_nsec)>(n % kNanosPerSecond);
    return abstime;
}

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_THREAD_INTERNAL_KERNEL_TIMEOUT_H_
