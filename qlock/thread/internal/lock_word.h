// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// Layout of the adaptive_mutex word:
//
//   bit 0      kLocked   the mutex is held
//   bit 1      kWaking   a releaser is draining the wait queue
//   bit 2..3   zero
//   bit 4..    address of the newest wait_node, or zero for an empty queue

#ifndef QLOCK_THREAD_INTERNAL_LOCK_WORD_H_
#define QLOCK_THREAD_INTERNAL_LOCK_WORD_H_

#include <cstdint>

#include "qlock/thread/internal/wait_node.h"

namespace qlock {

namespace thread_internal {

struct lock_word {
    static constexpr uintptr_t kUnlocked = 0;
    static constexpr uintptr_t kLocked = 1;
    static constexpr uintptr_t kWaking = 2;
    static constexpr uintptr_t kFlagMask = kLocked | kWaking;
    static constexpr uintptr_t kWaiterMask = ~(wait_node::kAlignment - 1);

    static_assert((kFlagMask & kWaiterMask) == 0,
                  "flag bits overlap the wait_node address bits");

    static wait_node *head(uintptr_t v) {
        return reinterpret_cast<wait_node *>(v & kWaiterMask);
    }

    static uintptr_t flags(uintptr_t v) { return v & kFlagMask; }

    static bool is_locked(uintptr_t v) { return (v & kLocked) != 0; }

    static bool is_waking(uintptr_t v) { return (v & kWaking) != 0; }

    static bool has_waiters(uintptr_t v) { return (v & kWaiterMask) != 0; }

    // Replace the queue head of `v`, keeping its flags.
    static uintptr_t with_head(uintptr_t v, const wait_node *node) {
        return (v & ~kWaiterMask) | reinterpret_cast<uintptr_t>(node);
    }

    static uintptr_t pack(const wait_node *node, uintptr_t flag_bits) {
        return reinterpret_cast<uintptr_t>(node) | (flag_bits & kFlagMask);
    }
};

}  // namespace thread_internal

}  // namespace qlock

#endif  // QLOCK_THREAD_INTERNAL_LOCK_WORD_H_
