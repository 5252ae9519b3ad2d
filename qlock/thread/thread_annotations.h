// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// -----------------------------------------------------------------------------
// File: thread_annotations.h
// -----------------------------------------------------------------------------
//
// This header file contains macro definitions for thread safety annotations
// that allow developers to document the locking policies of multi-threaded
// code. The annotations can also help program analysis tools to identify
// potential thread safety issues.
//
// These annotations are implemented using compiler attributes. Using the macros
// defined here instead of raw attributes allow for portability and future
// compatibility.

#ifndef QLOCK_THREAD_THREAD_ANNOTATIONS_H_
#define QLOCK_THREAD_THREAD_ANNOTATIONS_H_

#include "qlock/base/profile.h"

#if defined(__clang__)
#define QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(x) __attribute__((x))
#else
#define QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(x)  // no-op
#endif

// QLOCK_GUARDED_BY()
//
// Documents if a shared field or global variable needs to be protected by a
// mutex. QLOCK_GUARDED_BY() allows the user to specify a particular mutex that
// should be held when accessing the annotated variable.
//
// Example:
//
//   class Foo {
//     qlock::adaptive_mutex mu_;
//     int p1_ QLOCK_GUARDED_BY(mu_);
//     ...
//   };
#define QLOCK_GUARDED_BY(x) \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(guarded_by(x))

// QLOCK_LOCKABLE
//
// Documents if a class/type is a lockable type (such as the `adaptive_mutex`
// class).
#define QLOCK_LOCKABLE \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(lockable)

// QLOCK_SCOPED_LOCKABLE
//
// Documents if a class does RAII locking (such as the `mutex_lock` class).
// The constructor should use `LOCK_FUNCTION()` to specify the mutex that is
// acquired, and the destructor should use `UNLOCK_FUNCTION()` with no
// arguments; the analysis will assume that the destructor unlocks whatever the
// constructor locked.
#define QLOCK_SCOPED_LOCKABLE \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(scoped_lockable)

// QLOCK_EXCLUSIVE_LOCK_FUNCTION()
//
// Documents functions that acquire a lock in the body of a function, and do
// not release it.
#define QLOCK_EXCLUSIVE_LOCK_FUNCTION(...) \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(exclusive_lock_function(__VA_ARGS__))

// QLOCK_UNLOCK_FUNCTION()
//
// Documents functions that expect a lock to be held on entry to the function,
// and release it in the body of the function.
#define QLOCK_UNLOCK_FUNCTION(...) \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(unlock_function(__VA_ARGS__))

// QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION()
//
// Documents functions that try to acquire a lock, and return success or failure
// (or a non-boolean value that can be interpreted as a boolean).
// The first argument should be `true` for functions that return `true` on
// success, or `false` for functions that return `false` on success. The second
// argument specifies the mutex that is locked on success. If unspecified, this
// mutex is assumed to be `this`.
#define QLOCK_EXCLUSIVE_TRYLOCK_FUNCTION(...) \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(exclusive_trylock_function(__VA_ARGS__))

// QLOCK_NO_THREAD_SAFETY_ANALYSIS
//
// Turns off thread safety checking within the body of a particular function.
// This annotation is used to mark functions that are known to be correct, but
// the locking behavior is more complicated than the analyzer can handle.
#define QLOCK_NO_THREAD_SAFETY_ANALYSIS \
  QLOCK_INTERNAL_THREAD_ANNOTATION_ATTRIBUTE(no_thread_safety_analysis)

#endif  // QLOCK_THREAD_THREAD_ANNOTATIONS_H_
