// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/mcs_lock.h"

#include "qlock/log/logging.h"
#include "qlock/thread/spin_wait.h"

namespace qlock {

mcs_lock::~mcs_lock() {
    QLOCK_DCHECK(tail_.load(std::memory_order_relaxed) == nullptr,
                 "mcs_lock destroyed while held");
}

mcs_lock::node *mcs_lock::local_node() {
    static thread_local node n;
    return &n;
}

void mcs_lock::wait_for_predecessor(node *prev, node *n) {
    prev->next.store(n, std::memory_order_release);
    thread_internal::spin_wait spinner;
    while (n->locked.load(std::memory_order_acquire)) {
        if (!spinner.spin()) {
            thread_internal::spin_wait::yield();
        }
    }
}

mcs_lock::node *mcs_lock::wait_for_successor(node *n) {
    thread_internal::spin_wait spinner;
    for (;;) {
        node *next = n->next.load(std::memory_order_acquire);
        if (next != nullptr) {
            return next;
        }
        if (!spinner.spin()) {
            thread_internal::spin_wait::yield();
        }
    }
}

}  // namespace qlock
