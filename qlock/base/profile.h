// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#ifndef QLOCK_BASE_PROFILE_H_
#define QLOCK_BASE_PROFILE_H_

#include <cstddef>

// Platform detection. Only the platforms a parker backend exists for are
// distinguished, everything else is treated as generic posix.
#if defined(_WIN32) || defined(_WIN64)
#define QLOCK_PLATFORM_WINDOWS 1
#elif defined(__linux__) || defined(__linux)
#define QLOCK_PLATFORM_LINUX 1
#define QLOCK_PLATFORM_POSIX 1
#else
#define QLOCK_PLATFORM_POSIX 1
#endif

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#define QLOCK_PROCESSOR_X86 1
#elif defined(__aarch64__) || defined(_M_ARM64) || defined(__arm__) || defined(_M_ARM)
#define QLOCK_PROCESSOR_ARM 1
#endif

// QLOCK_STRINGIFY
//
// Example usage:
//     printf("Line: %s", QLOCK_STRINGIFY(__LINE__));
#ifndef QLOCK_STRINGIFY
#define QLOCK_STRINGIFY(x)     QLOCK_STRINGIFYIMPL(x)
#define QLOCK_STRINGIFYIMPL(x) #x
#endif

#ifndef QLOCK_COMPILER_HAS_ATTRIBUTE
#ifdef __has_attribute
#define QLOCK_COMPILER_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define QLOCK_COMPILER_HAS_ATTRIBUTE(x) 0
#endif
#endif

#if defined(__GNUC__) || defined(__clang__)
#define QLOCK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define QLOCK_UNLIKELY(x) (x)
#endif

#if defined(_MSC_VER)
#define QLOCK_FORCE_INLINE __forceinline
#define QLOCK_NO_INLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define QLOCK_FORCE_INLINE inline __attribute__((always_inline))
#define QLOCK_NO_INLINE __attribute__((noinline))
#else
#define QLOCK_FORCE_INLINE inline
#define QLOCK_NO_INLINE
#endif

// QLOCK_COLD
//
// Tells the compiler that a function is unlikely to be executed. Used on the
// contended paths so the fast paths stay compact.
#if QLOCK_COMPILER_HAS_ATTRIBUTE(cold) || (defined(__GNUC__) && !defined(__clang__))
#define QLOCK_COLD __attribute__((cold))
#else
#define QLOCK_COLD
#endif

#if defined(__clang__) && QLOCK_COMPILER_HAS_ATTRIBUTE(require_constant_initialization)
#define QLOCK_CONST_INIT [[clang::require_constant_initialization]]
#else
#define QLOCK_CONST_INIT
#endif

#ifndef QLOCK_CACHE_LINE_SIZE
#if defined(__aarch64__) && defined(__APPLE__)
#define QLOCK_CACHE_LINE_SIZE 128
#else
#define QLOCK_CACHE_LINE_SIZE 64
#endif
#endif

#define QLOCK_CACHE_LINE_ALIGNED alignas(QLOCK_CACHE_LINE_SIZE)

// QLOCK_ARRAYSIZE()
//
// Returns the number of elements in an array as a compile-time constant.
namespace qlock {
namespace base_internal {

template<typename T, size_t N>
auto array_size_helper(const T (&array)[N]) -> char (&)[N];

}  // namespace base_internal
}  // namespace qlock

#define QLOCK_ARRAYSIZE(array) \
  (sizeof(::qlock::base_internal::array_size_helper(array)))

#endif  // QLOCK_BASE_PROFILE_H_
