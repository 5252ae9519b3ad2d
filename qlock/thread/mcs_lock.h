// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// mcs_lock is the Mellor-Crummey and Scott queue lock. Every waiter spins on
// a flag in its own node rather than on the shared word, and the lock passes
// directly to the next node in arrival order.
//
// The explicit form takes a node owned by the caller, which must stay alive
// and unused until the matching unlock():
//
//   qlock::mcs_lock::node n;
//   lock.lock(&n);
//   ...
//   lock.unlock(&n);
//
// The plain lock() / unlock() form satisfies Lockable by using a node owned
// by the calling thread. It therefore supports holding only one mcs_lock at a
// time per thread; use the explicit form to nest them.

#ifndef QLOCK_THREAD_MCS_LOCK_H_
#define QLOCK_THREAD_MCS_LOCK_H_

#include <atomic>

#include "qlock/base/profile.h"
#include "qlock/thread/thread_annotations.h"

namespace qlock {

class QLOCK_LOCKABLE mcs_lock {
  public:
    struct QLOCK_CACHE_LINE_ALIGNED node {
        node() : next(nullptr), locked(false) {}

        node(const node &) = delete;

        node &operator=(const node &) = delete;

        std::atomic<node *> next;
        // True while the owner of this node waits for its predecessor.
        std::atomic<bool> locked;
    };

    constexpr mcs_lock() : tail_(nullptr) {}

    ~mcs_lock();

    mcs_lock(const mcs_lock &) = delete;

    mcs_lock &operator=(const mcs_lock &) = delete;

    void lock(node *n) QLOCK_EXCLUSIVE_LOCK_FUNCTION() {
        n->next.store(nullptr, std::memory_order_relaxed);
        n->locked.store(true, std::memory_order_relaxed);
        node *prev = tail_.exchange(n, std::memory_order_acq_rel);
        if (prev != nullptr) {
            wait_for_predecessor(prev, n);
        }
    }

    bool try_lock(node *n) QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
        n->next.store(nullptr, std::memory_order_relaxed);
        node *expected = nullptr;
        return tail_.compare_exchange_strong(expected, n, std::memory_order_acquire,
                                             std::memory_order_relaxed);
    }

    // REQUIRES: `n` is the node the lock was acquired with.
    void unlock(node *n) QLOCK_UNLOCK_FUNCTION() {
        node *next = n->next.load(std::memory_order_acquire);
        if (next == nullptr) {
            node *expected = n;
            if (tail_.compare_exchange_strong(expected, nullptr,
                                              std::memory_order_release,
                                              std::memory_order_relaxed)) {
                return;
            }
            next = wait_for_successor(n);
        }
        next->locked.store(false, std::memory_order_release);
    }

    void lock() QLOCK_EXCLUSIVE_LOCK_FUNCTION() { lock(local_node()); }

    bool try_lock() QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(true) { return try_lock(local_node()); }

    void unlock() QLOCK_UNLOCK_FUNCTION() { unlock(local_node()); }

    bool is_locked() const { return tail_.load(std::memory_order_relaxed) != nullptr; }

  private:
    static node *local_node();

    static void wait_for_predecessor(node *prev, node *n) QLOCK_COLD;

    // A successor swapped itself into tail_ but has not linked itself yet.
    static node *wait_for_successor(node *n) QLOCK_COLD;

    std::atomic<node *> tail_;
};

}  // namespace qlock

#endif  // QLOCK_THREAD_MCS_LOCK_H_
