// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// spin_wait is the bounded busy-wait policy a thread runs through before it
// commits to blocking in the kernel.  A round of spin() does one of:
//
//   rounds 1..3   2, 4 and 8 cpu pause hints
//   rounds 4..6   a batch of kBatchPauses pause hints
//   rounds 7..10  one os thread yield
//
// after which spin() returns false and the caller is expected to block.
// spin_wait never spins unboundedly.

#ifndef QLOCK_THREAD_SPIN_WAIT_H_
#define QLOCK_THREAD_SPIN_WAIT_H_

#include <atomic>
#include <cstdint>

#include "qlock/base/profile.h"

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace qlock {

namespace thread_internal {

class spin_wait {
  public:
    static constexpr int kPauseRounds = 3;
    static constexpr int kBatchRounds = 3;
    static constexpr int kYieldRounds = 4;
    static constexpr int kBatchPauses = 32;
    static constexpr int kMaxRounds = kPauseRounds + kBatchRounds + kYieldRounds;

    constexpr spin_wait() : count_(0) {}

    // Runs one round of the policy. Returns false, without waiting, once the
    // budget is exhausted; the caller should block instead.
    bool spin();

    // Restart the policy, e.g. after being woken from a park.
    void reset() { count_ = 0; }

    int count() const { return count_; }

    bool exhausted() const { return count_ >= kMaxRounds; }

    // Issue `n` cpu relax hints.
    static void pause(int n);

    // Give up the rest of the time slice.
    static void yield();

  private:
    int count_;
};

QLOCK_FORCE_INLINE void spin_wait::pause(int n) {
    for (int i = 0; i < n; ++i) {
#if defined(QLOCK_PROCESSOR_X86) && (defined(__GNUC__) || defined(__clang__))
        __asm__ __volatile__("pause" ::: "memory");
#elif defined(QLOCK_PROCESSOR_X86) && defined(_MSC_VER)
        _mm_pause();
#elif defined(QLOCK_PROCESSOR_ARM) && (defined(__GNUC__) || defined(__clang__))
        __asm__ __volatile__("yield" ::: "memory");
#else
        std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
    }
}

// spin_lock_wait() waits until it can perform one of several transitions from
// "from" to "to".  It returns when it performs a transition where done==true.
struct spin_lock_wait_transition {
    uint32_t from;
    uint32_t to;
    bool done;
};

// wait until *w can transition from trans[i].from to trans[i].to for some i
// satisfying 0<=i<n && trans[i].done, atomically make the transition,
// then return the old value of *w.   Make any other atomic transitions
// where !trans[i].done, but continue waiting.
uint32_t spin_lock_wait(std::atomic<uint32_t> *w, int n,
                        const spin_lock_wait_transition trans[]);

// Returns a suggested delay in nanoseconds for iteration number "loop" of a
// wait that has outlived its spin_wait budget.
int spin_lock_suggested_delay_ns(int loop);

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_THREAD_SPIN_WAIT_H_
