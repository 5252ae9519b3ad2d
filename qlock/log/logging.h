// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#ifndef QLOCK_LOG_LOGGING_H_
#define QLOCK_LOG_LOGGING_H_

#include <cstdlib>
#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>

#include "qlock/base/profile.h"

namespace qlock {

void create_log_ptr();

// Process-wide logger used by the library. It is created lazily on first use
// and never torn down, so it stays usable from destructors of static locks.
class log_singleton {
  public:
    friend void create_log_ptr();

    // Replace the default stderr logger, e.g. to capture output in tests.
    static void set_logger(std::shared_ptr<spdlog::logger> &log_ptr) {
        get_logger();
        _log_ptr = log_ptr;
    }

    static std::shared_ptr<spdlog::logger> get_logger() {
        static std::once_flag log_once;
        std::call_once(log_once, create_log_ptr);
        return _log_ptr;
    }

  private:
    static std::shared_ptr<spdlog::logger> _log_ptr;
};

}  // namespace qlock

#define QLOCK_RAW_TRACE(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->trace("[ " __FILE__ "(" QLOCK_STRINGIFY(__LINE__) ") ] " __VA_ARGS__);    \
    }while(0)

#define QLOCK_RAW_DEBUG(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->debug("[ " __FILE__ "(" QLOCK_STRINGIFY(__LINE__) ") ] " __VA_ARGS__);    \
    }while(0)

#define QLOCK_RAW_INFO(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->info(__VA_ARGS__);    \
    }while(0)

#define QLOCK_RAW_WARN(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->warn(__VA_ARGS__);    \
    }while(0)

#define QLOCK_RAW_ERROR(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->error("[ " __FILE__ "(" QLOCK_STRINGIFY(__LINE__) ") ] " __VA_ARGS__);   \
    }while(0)

#define QLOCK_RAW_CRITICAL(...)                                   \
    do {                                                     \
    qlock::log_singleton::get_logger()->critical("[ " __FILE__ "(" QLOCK_STRINGIFY(__LINE__) ") ] " __VA_ARGS__);   \
    qlock::log_singleton::get_logger()->flush();             \
    ::exit(1);                                               \
    }while(0)

#define QLOCK_CHECK(condition, message)                             \
  do {                                                                 \
    if (QLOCK_UNLIKELY(!(condition))) {                            \
      QLOCK_RAW_CRITICAL("Check {} failed: {}", #condition, message); \
    }                                                                  \
  } while (0)

// QLOCK_DCHECK
//
// Checks a usage contract of the lock primitives. Violations are fatal in
// debug builds and undefined behaviour in optimized ones, so the check is
// compiled out when NDEBUG is set.
#ifndef NDEBUG
#define QLOCK_DCHECK_IS_ON 1
#define QLOCK_DCHECK(condition, message) QLOCK_CHECK(condition, message)
#else
#define QLOCK_DCHECK_IS_ON 0
#define QLOCK_DCHECK(condition, message) \
  do {                                   \
    if (false) {                         \
      (void)(condition);                 \
    }                                    \
  } while (0)
#endif

#endif  // QLOCK_LOG_LOGGING_H_
