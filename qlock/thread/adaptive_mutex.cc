// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/adaptive_mutex.h"

#include <memory>

#include "qlock/thread/internal/wait_node.h"
#include "qlock/thread/spin_wait.h"

namespace qlock {

using thread_internal::lock_word;
using thread_internal::wait_node;
using thread_internal::kernel_timeout;
using thread_internal::spin_wait;

adaptive_mutex::~adaptive_mutex() {
    const uintptr_t v = word_.load(std::memory_order_relaxed);
    QLOCK_DCHECK(!lock_word::has_waiters(v),
                 "adaptive_mutex destroyed while threads are waiting for it");
    QLOCK_DCHECK(!lock_word::is_locked(v), "adaptive_mutex destroyed while locked");
}

void adaptive_mutex::lock_slow() {
    spin_wait spinner;
    // One node serves every park episode of this call: a thread only returns
    // from park() after a releaser has unlinked its node.
    wait_node node;
    uintptr_t v = word_.load(std::memory_order_relaxed);
    for (;;) {
        if (!lock_word::is_locked(v)) {
            if (word_.compare_exchange_weak(v, v | lock_word::kLocked,
                                            std::memory_order_acquire,
                                            std::memory_order_relaxed)) {
                return;
            }
            continue;
        }

        wait_node *head = lock_word::head(v);
        // Spinning only pays off while nobody is queued; once there is a
        // queue the mutex is contended enough to go straight to sleep.
        if (head == nullptr && spinner.spin()) {
            v = word_.load(std::memory_order_relaxed);
            continue;
        }

        node.next = head;
        node.prev = nullptr;
        node.tail = head == nullptr ? &node : nullptr;
        node.event.prepare();
        if (!word_.compare_exchange_weak(v, lock_word::with_head(v, &node),
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
            continue;
        }

        node.event.park();
        spinner.reset();
        v = word_.load(std::memory_order_relaxed);
    }
}

bool adaptive_mutex::lock_slow_until(kernel_timeout t) {
    spin_wait spinner;
    // Allocated lazily and reused; on a successful abandon() ownership passes
    // to whichever releaser dequeues the node.
    std::unique_ptr<wait_node> node;
    uintptr_t v = word_.load(std::memory_order_relaxed);
    for (;;) {
        if (!lock_word::is_locked(v)) {
            if (word_.compare_exchange_weak(v, v | lock_word::kLocked,
                                            std::memory_order_acquire,
                                            std::memory_order_relaxed)) {
                return true;
            }
            continue;
        }
        if (t.expired()) {
            return false;
        }

        wait_node *head = lock_word::head(v);
        if (head == nullptr && spinner.spin()) {
            v = word_.load(std::memory_order_relaxed);
            continue;
        }

        if (!node) {
            node = std::make_unique<wait_node>();
            node->heap_owned = true;
        }
        node->next = head;
        node->prev = nullptr;
        node->tail = head == nullptr ? node.get() : nullptr;
        node->event.prepare();
        if (!word_.compare_exchange_weak(v, lock_word::with_head(v, node.get()),
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
            continue;
        }

        if (!node->event.park_until(t) && node->event.abandon()) {
            // Still linked; the releaser that dequeues it frees it.
            node.release();
            return false;
        }
        // Woken, possibly just as the deadline passed. Either way the node is
        // unlinked again; one more look at the word decides.
        spinner.reset();
        v = word_.load(std::memory_order_relaxed);
    }
}

void adaptive_mutex::unlock_slow() {
    for (;;) {
        wait_node *waiter = dequeue_oldest();
        if (waiter == nullptr) {
            return;
        }
        if (waiter->event.unpark()) {
            return;
        }
        // The waiter timed out and left its node behind. Nobody was woken,
        // so look for the next one.
        QLOCK_DCHECK(waiter->heap_owned, "a blocking waiter abandoned its node");
        delete waiter;
    }
}

wait_node *adaptive_mutex::dequeue_oldest() {
    uintptr_t v = word_.load(std::memory_order_relaxed);
    for (;;) {
        // Nothing to do if the queue is empty, another releaser is already
        // draining, or the mutex was grabbed again; its holder will drain.
        if ((v & lock_word::kFlagMask) != 0 || !lock_word::has_waiters(v)) {
            return nullptr;
        }
        if (word_.compare_exchange_weak(v, v | lock_word::kWaking,
                                        std::memory_order_acquire,
                                        std::memory_order_relaxed)) {
            v |= lock_word::kWaking;
            break;
        }
    }

    // WAKING is ours: we are the only thread touching prev and tail. Every
    // load of the word below is an acquire so that the fields written by
    // the enqueuers before their release CAS are visible.
    for (;;) {
        wait_node *head = lock_word::head(v);
        wait_node *tail = head->tail;
        if (tail == nullptr) {
            wait_node *current = head;
            for (;;) {
                wait_node *next = current->next;
                next->prev = current;
                current = next;
                if (current->tail != nullptr) {
                    tail = current->tail;
                    break;
                }
            }
            head->tail = tail;
        }

        if (lock_word::is_locked(v)) {
            if (word_.compare_exchange_weak(v, v & ~lock_word::kWaking,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                return nullptr;
            }
            continue;
        }

        wait_node *new_tail = tail->prev;
        if (new_tail != nullptr) {
            head->tail = new_tail;
            word_.fetch_and(~lock_word::kWaking, std::memory_order_release);
            return tail;
        }

        // `tail` is the only waiter: empty the queue but keep LOCKED, which
        // may have been set since `v` was loaded.
        if (word_.compare_exchange_weak(v, v & lock_word::kLocked,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
            return tail;
        }
        // A newer node was pushed or LOCKED got set; WAKING is still ours.
    }
}

}  // namespace qlock
