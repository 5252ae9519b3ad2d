// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#ifndef QLOCK_THREAD_INTERNAL_WAIT_NODE_H_
#define QLOCK_THREAD_INTERNAL_WAIT_NODE_H_

#include <cstdint>

#include "qlock/thread/parker.h"

namespace qlock {

namespace thread_internal {

// A waiter of adaptive_mutex. It normally lives on the stack of the blocked
// thread, which does not leave the frame until the node has been dequeued
// and its parker notified.
//
// The address of a wait_node is stored in the high bits of the mutex word,
// so the low kLowZeroBits of the address must be zero.
struct alignas(16) wait_node {
    static constexpr int kLowZeroBits = 4;
    static constexpr uintptr_t kAlignment = uintptr_t{1} << kLowZeroBits;

    wait_node() : next(nullptr), prev(nullptr), tail(nullptr), heap_owned(false) {}

    wait_node(const wait_node &) = delete;

    wait_node &operator=(const wait_node &) = delete;

    // Older waiter; written once by the enqueuing thread before publication.
    wait_node *next;
    // Newer waiter; written only by the thread holding WAKING.
    wait_node *prev;
    // Oldest waiter. Only meaningful on the current head, where it caches the
    // result of the last walk so later drains skip the converted prefix.
    wait_node *tail;
    // Set for nodes of timed waiters, which are allocated with new. If such a
    // node is abandoned the thread that dequeues it deletes it.
    bool heap_owned;
    parker event;
};

static_assert(alignof(wait_node) >= wait_node::kAlignment,
              "wait_node is not aligned enough to leave room for the flag bits");

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_THREAD_INTERNAL_WAIT_NODE_H_
