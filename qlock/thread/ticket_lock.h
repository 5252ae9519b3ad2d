// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// ticket_lock hands the lock out in strict arrival order. A thread takes the
// next ticket and spins until `owner_` reaches it, yielding once its
// spin_wait budget is used up. Strict FIFO still makes it degrade when there
// are more runnable threads than cores: a preempted ticket holder stalls
// everyone queued behind it until the scheduler runs it again.

#ifndef QLOCK_THREAD_TICKET_LOCK_H_
#define QLOCK_THREAD_TICKET_LOCK_H_

#include <atomic>
#include <cstdint>

#include "qlock/base/profile.h"
#include "qlock/thread/spin_wait.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

class QLOCK_LOCKABLE ticket_lock {
  public:
    constexpr ticket_lock() : next_(0), owner_(0) {}

    ticket_lock(const ticket_lock &) = delete;

    ticket_lock &operator=(const ticket_lock &) = delete;

    void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        const uint32_t ticket = next_.fetch_add(1, std::memory_order_relaxed);
        thread_internal::spin_wait spinner;
        for (;;) {
            const uint32_t owner = owner_.load(std::memory_order_acquire);
            if (owner == ticket) {
                return;
            }
            if (spinner.exhausted()) {
                // The holder or someone ahead of us may be preempted.
                thread_internal::spin_wait::yield();
                continue;
            }
            spinner.spin();
            // Spin longer the further back in line we are.
            thread_internal::spin_wait::pause(static_cast<int>(ticket - owner));
        }
    }

    bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        uint32_t owner = owner_.load(std::memory_order_acquire);
        return next_.compare_exchange_strong(owner, owner + 1,
                                             std::memory_order_acquire,
                                             std::memory_order_relaxed);
    }

    void unlock() QLOCK_UNLOCK_FUNCTION() {
        // Only the holder writes owner_.
        owner_.store(owner_.load(std::memory_order_relaxed) + 1,
                     std::memory_order_release);
    }

    bool is_locked() const {
        return next_.load(std::memory_order_relaxed) !=
               owner_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<uint32_t> next_;
    QLOCK_CACHE_LINE_ALIGNED std::atomic<uint32_t> owner_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_TICKET_LOCK_H_
