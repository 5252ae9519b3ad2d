// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/parker.h"

#ifdef QLOCK_PLATFORM_WINDOWS
#include <windows.h>
#else
#include <pthread.h>
#include <sys/time.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <time.h>

#include <atomic>
#include <cstdint>

#include "qlock/base/call_once.h"
#include "qlock/log/logging.h"
#include "qlock/thread/internal/futex.h"
#include "qlock/thread/internal/kernel_timeout.h"
#include "qlock/thread/spin_wait.h"

namespace qlock {

namespace thread_internal {

namespace {

// Moves `state` to kNotified. Returns false if the owner abandoned the
// episode. `*prev` receives the state that was replaced.
bool notify_state(std::atomic<int32_t> *state, int32_t *prev) {
    int32_t s = state->load(std::memory_order_relaxed);
    for (;;) {
        QLOCK_DCHECK(s != parker::kEmpty, "unpark() on a parker that was never prepared");
        QLOCK_DCHECK(s != parker::kNotified, "duplicate unpark() in one episode");
        if (s == parker::kAbandoned) {
            // Pairs with the release in abandon_state(): whoever frees the
            // abandoned node must see everything its owner wrote.
            std::atomic_thread_fence(std::memory_order_acquire);
            return false;
        }
        if (state->compare_exchange_weak(s, parker::kNotified,
                                         std::memory_order_acq_rel,
                                         std::memory_order_relaxed)) {
            *prev = s;
            return true;
        }
    }
}

bool abandon_state(std::atomic<int32_t> *state) {
    int32_t s = parker::kWaiting;
    if (state->compare_exchange_strong(s, parker::kAbandoned,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return true;
    }
    QLOCK_DCHECK(s == parker::kNotified, "abandon() outside of a timed out episode");
    return false;
}

void check_can_park(int32_t s) {
    QLOCK_DCHECK(s != parker::kEmpty, "park() before prepare()");
    QLOCK_DCHECK(s != parker::kParked, "park() while another park() is in flight");
    QLOCK_DCHECK(s != parker::kAbandoned, "park() on an abandoned parker");
    (void)s;
}

}  // namespace

parker::~parker() {
    QLOCK_DCHECK(state_.load(std::memory_order_relaxed) != kParked,
                 "parker destroyed while its owner is parked");
#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_CONDVAR
    if (os_ready_) {
        const int err = pthread_mutex_destroy(&mu_);
        if (err != 0) {
            QLOCK_RAW_CRITICAL("pthread_mutex_destroy failed: {}", err);
        }

        const int err2 = pthread_cond_destroy(&cv_);
        if (err2 != 0) {
            QLOCK_RAW_CRITICAL("pthread_cond_destroy failed: {}", err2);
        }
    }
#endif
}

void parker::park() {
    const bool notified = park_until(kernel_timeout::never());
    QLOCK_DCHECK(notified, "untimed park() returned without a notification");
    (void)notified;
}

// Used by every backend once the os facility is unusable, and by the spin
// backend always.
bool parker::spin_until_notified(kernel_timeout t) {
    spin_wait spinner;
    for (;;) {
        const int32_t s = state_.load(std::memory_order_acquire);
        if (s == kNotified) {
            return true;
        }
        if (t.expired()) {
            if (s == kParked) {
                return leave_parked_after_timeout();
            }
            return false;
        }
        if (!spinner.spin()) {
            spin_wait::yield();
        }
    }
}

// The owner timed out in kParked. Either it steps back to kWaiting, or an
// unpark() already won and the wake it issued has to be accounted for.
bool parker::leave_parked_after_timeout() {
    int32_t expected = kParked;
    if (state_.compare_exchange_strong(expected, kWaiting,
                                       std::memory_order_acquire,
                                       std::memory_order_acquire)) {
        return false;
    }
    QLOCK_DCHECK(expected == kNotified, "parked state changed by someone other than unpark()");
#if QLOCK_PARKER_MODE != QLOCK_PARKER_MODE_CONDVAR
    os_consume_pending_wake();
#endif
    return true;
}

#if QLOCK_PARKER_MODE != QLOCK_PARKER_MODE_CONDVAR

// Shared protocol for the backends that block on the address of state_.

parker::parker() : state_(kEmpty) {
#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_ALERT_BY_ID
    thread_id_ = 0;
#endif
}

void parker::prepare() {
    QLOCK_DCHECK(state_.load(std::memory_order_relaxed) != kParked,
                 "prepare() while the previous episode is still parked");
#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_ALERT_BY_ID
    thread_id_ = ::GetCurrentThreadId();
#endif
    state_.store(kWaiting, std::memory_order_relaxed);
}

bool parker::park_until(kernel_timeout t) {
    int32_t s = state_.load(std::memory_order_acquire);
    check_can_park(s);
    if (s == kNotified) {
        return true;
    }
    if (t.expired()) {
        return false;
    }
    if (!os_blocking_available()) {
        return spin_until_notified(t);
    }
    if (!state_.compare_exchange_strong(s, kParked, std::memory_order_acquire,
                                        std::memory_order_acquire)) {
        // Only unpark() moves a parker out of kWaiting.
        QLOCK_DCHECK(s == kNotified, "parker state changed during park()");
        return true;
    }
    for (;;) {
        const wait_result r = os_wait(t);
        if (state_.load(std::memory_order_acquire) == kNotified) {
            return true;
        }
        if (r == wait_result::kTimedOut) {
            return leave_parked_after_timeout();
        }
        if (r == wait_result::kUnsupported) {
            return spin_until_notified(t);
        }
        // Spurious wakeup, wait again.
    }
}

bool parker::unpark() {
    const uintptr_t key = os_wake_key();
    int32_t prev = kEmpty;
    if (!notify_state(&state_, &prev)) {
        return false;
    }
    if (prev == kParked) {
        os_wake(key);
    }
    return true;
}

bool parker::abandon() {
    return abandon_state(&state_);
}

#endif  // QLOCK_PARKER_MODE != QLOCK_PARKER_MODE_CONDVAR

#if QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_FUTEX

namespace {

std::atomic<bool> futex_unavailable{false};
qlock::once_flag futex_unavailable_once;

void report_futex_unavailable() {
    QLOCK_RAW_WARN("futex syscall is not available, parkers fall back to spinning");
}

}  // namespace

const char *parker::mode_name() {
    return "futex";
}

bool parker::os_blocking_available() {
    return !futex_unavailable.load(std::memory_order_relaxed);
}

parker::wait_result parker::os_wait(kernel_timeout t) {
    const int err = futex::wait_until(&state_, kParked, t);
    if (err == 0 || err == -EINTR || err == -EAGAIN) {
        // EAGAIN: the value was not kParked any more when the kernel looked.
        return wait_result::kWoken;
    }
    if (err == -ETIMEDOUT) {
        return wait_result::kTimedOut;
    }
    if (err == -ENOSYS) {
        futex_unavailable.store(true, std::memory_order_relaxed);
        qlock::call_once(futex_unavailable_once, report_futex_unavailable);
        return wait_result::kUnsupported;
    }
    QLOCK_RAW_CRITICAL("futex wait failed with error {}", err);
    return wait_result::kUnsupported;
}

uintptr_t parker::os_wake_key() const {
    return reinterpret_cast<uintptr_t>(&state_);
}

void parker::os_wake(uintptr_t key) {
    // The owner may already have observed kNotified and released the memory
    // holding state_; the wake is keyed by address only, so the worst case is
    // a spurious wakeup of whoever reuses it, which every waiter tolerates.
    const int err = futex::wake(reinterpret_cast<std::atomic<int32_t> *>(key), 1);
    if (QLOCK_UNLIKELY(err < 0) && err != -EFAULT && err != -ENOSYS) {
        QLOCK_RAW_CRITICAL("futex wake failed with error {}", err);
    }
}

void parker::os_consume_pending_wake() {
    // A futex wake that finds no waiter is simply dropped.
}

#elif QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_KEYED_EVENT

namespace {

typedef LONG qlock_ntstatus;

typedef qlock_ntstatus (NTAPI *nt_create_keyed_event_fn)(
        PHANDLE handle, ACCESS_MASK access, PVOID attributes, ULONG flags);
typedef qlock_ntstatus (NTAPI *nt_keyed_event_fn)(
        HANDLE handle, PVOID key, BOOLEAN alertable, PLARGE_INTEGER timeout);

constexpr qlock_ntstatus kStatusSuccess = 0;
constexpr qlock_ntstatus kStatusTimeout = 0x00000102;

// The process-wide keyed event. Created once, never closed.
struct keyed_event {
    HANDLE handle = nullptr;
    nt_keyed_event_fn wait = nullptr;
    nt_keyed_event_fn release = nullptr;
    bool ok = false;
};

keyed_event global_keyed_event;
qlock::once_flag keyed_event_once;

void create_keyed_event(keyed_event *ev) {
    HMODULE ntdll = ::GetModuleHandleW(L"ntdll.dll");
    if (ntdll != nullptr) {
        auto create = reinterpret_cast<nt_create_keyed_event_fn>(
                ::GetProcAddress(ntdll, "NtCreateKeyedEvent"));
        ev->wait = reinterpret_cast<nt_keyed_event_fn>(
                ::GetProcAddress(ntdll, "NtWaitForKeyedEvent"));
        ev->release = reinterpret_cast<nt_keyed_event_fn>(
                ::GetProcAddress(ntdll, "NtReleaseKeyedEvent"));
        if (create != nullptr && ev->wait != nullptr && ev->release != nullptr) {
            HANDLE handle = nullptr;
            const qlock_ntstatus st =
                    create(&handle, GENERIC_READ | GENERIC_WRITE, nullptr, 0);
            if (st >= 0) {
                ev->handle = handle;
                ev->ok = true;
                return;
            }
            QLOCK_RAW_WARN("NtCreateKeyedEvent failed with status {:#x}",
                           static_cast<unsigned long>(st));  // NOLINT(runtime/int)
        }
    }
    QLOCK_RAW_WARN("keyed events are not available, parkers fall back to spinning");
}

const keyed_event &get_keyed_event() {
    qlock::call_once(keyed_event_once, create_keyed_event, &global_keyed_event);
    return global_keyed_event;
}

}  // namespace

const char *parker::mode_name() {
    return "keyed_event";
}

bool parker::os_blocking_available() {
    return get_keyed_event().ok;
}

parker::wait_result parker::os_wait(kernel_timeout t) {
    const keyed_event &ev = get_keyed_event();
    LARGE_INTEGER timeout;
    PLARGE_INTEGER timeout_ptr = nullptr;
    if (t.has_timeout()) {
        // Negative means relative, in 100ns units.
        timeout.QuadPart = -(t.in_nanoseconds_from_now() / 100);
        timeout_ptr = &timeout;
    }
    const qlock_ntstatus st = ev.wait(ev.handle, &state_, FALSE, timeout_ptr);
    if (st == kStatusSuccess) {
        return wait_result::kWoken;
    }
    if (st == kStatusTimeout) {
        return wait_result::kTimedOut;
    }
    QLOCK_RAW_CRITICAL("NtWaitForKeyedEvent failed with status {:#x}",
                       static_cast<unsigned long>(st));  // NOLINT(runtime/int)
    return wait_result::kUnsupported;
}

uintptr_t parker::os_wake_key() const {
    return reinterpret_cast<uintptr_t>(&state_);
}

void parker::os_wake(uintptr_t key) {
    // Blocks until the owner arrives in NtWaitForKeyedEvent, which it has
    // committed to by entering kParked.
    const keyed_event &ev = get_keyed_event();
    const qlock_ntstatus st = ev.release(ev.handle, reinterpret_cast<PVOID>(key), FALSE, nullptr);
    if (st != kStatusSuccess) {
        QLOCK_RAW_CRITICAL("NtReleaseKeyedEvent failed with status {:#x}",
                           static_cast<unsigned long>(st));  // NOLINT(runtime/int)
    }
}

void parker::os_consume_pending_wake() {
    // The unparker saw kParked and is (or will be) blocked in
    // NtReleaseKeyedEvent until someone waits on our key.
    const keyed_event &ev = get_keyed_event();
    const qlock_ntstatus st = ev.wait(ev.handle, &state_, FALSE, nullptr);
    if (st != kStatusSuccess) {
        QLOCK_RAW_CRITICAL("NtWaitForKeyedEvent failed with status {:#x}",
                           static_cast<unsigned long>(st));  // NOLINT(runtime/int)
    }
}

#elif QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_ALERT_BY_ID

namespace {

typedef LONG qlock_ntstatus;

typedef qlock_ntstatus (NTAPI *nt_wait_for_alert_fn)(PVOID address,
                                                     PLARGE_INTEGER timeout);
typedef qlock_ntstatus (NTAPI *nt_alert_thread_fn)(HANDLE thread_id);

constexpr qlock_ntstatus kStatusSuccess = 0;
constexpr qlock_ntstatus kStatusAlerted = 0x00000101;
constexpr qlock_ntstatus kStatusTimeout = 0x00000102;

struct alert_api {
    nt_wait_for_alert_fn wait = nullptr;
    nt_alert_thread_fn alert = nullptr;
    bool ok = false;
};

alert_api global_alert_api;
qlock::once_flag alert_api_once;

void load_alert_api(alert_api *api) {
    HMODULE ntdll = ::GetModuleHandleW(L"ntdll.dll");
    if (ntdll != nullptr) {
        api->wait = reinterpret_cast<nt_wait_for_alert_fn>(
                ::GetProcAddress(ntdll, "NtWaitForAlertByThreadId"));
        api->alert = reinterpret_cast<nt_alert_thread_fn>(
                ::GetProcAddress(ntdll, "NtAlertThreadByThreadId"));
        api->ok = api->wait != nullptr && api->alert != nullptr;
    }
    if (!api->ok) {
        QLOCK_RAW_WARN("thread alerts are not available, parkers fall back to spinning");
    }
}

const alert_api &get_alert_api() {
    qlock::call_once(alert_api_once, load_alert_api, &global_alert_api);
    return global_alert_api;
}

}  // namespace

const char *parker::mode_name() {
    return "alert_by_id";
}

bool parker::os_blocking_available() {
    return get_alert_api().ok;
}

parker::wait_result parker::os_wait(kernel_timeout t) {
    const alert_api &api = get_alert_api();
    LARGE_INTEGER timeout;
    PLARGE_INTEGER timeout_ptr = nullptr;
    if (t.has_timeout()) {
        timeout.QuadPart = -(t.in_nanoseconds_from_now() / 100);
        timeout_ptr = &timeout;
    }
    const qlock_ntstatus st = api.wait(&state_, timeout_ptr);
    if (st == kStatusSuccess || st == kStatusAlerted) {
        return wait_result::kWoken;
    }
    if (st == kStatusTimeout) {
        return wait_result::kTimedOut;
    }
    QLOCK_RAW_CRITICAL("NtWaitForAlertByThreadId failed with status {:#x}",
                       static_cast<unsigned long>(st));  // NOLINT(runtime/int)
    return wait_result::kUnsupported;
}

uintptr_t parker::os_wake_key() const {
    return static_cast<uintptr_t>(thread_id_);
}

void parker::os_wake(uintptr_t key) {
    // `key` is the owner's thread id; the parker itself may be gone already.
    const alert_api &api = get_alert_api();
    api.alert(reinterpret_cast<HANDLE>(static_cast<ULONG_PTR>(key)));
}

void parker::os_consume_pending_wake() {
    // A stale alert only makes a later wait return early, which the wait
    // loops already tolerate.
}

#elif QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_SPIN

const char *parker::mode_name() {
    return "spin";
}

bool parker::os_blocking_available() {
    return false;
}

parker::wait_result parker::os_wait(kernel_timeout) {
    return wait_result::kUnsupported;
}

uintptr_t parker::os_wake_key() const {
    return 0;
}

void parker::os_wake(uintptr_t) {}

void parker::os_consume_pending_wake() {}

#elif QLOCK_PARKER_MODE == QLOCK_PARKER_MODE_CONDVAR

namespace {

std::atomic<bool> condvar_degraded{false};

class pthread_mutex_holder {
  public:
    explicit pthread_mutex_holder(pthread_mutex_t *mu) : mu_(mu) {
        const int err = pthread_mutex_lock(mu_);
        if (err != 0) {
            QLOCK_RAW_CRITICAL("pthread_mutex_lock failed: {}", err);
        }
    }

    pthread_mutex_holder(const pthread_mutex_holder &rhs) = delete;

    pthread_mutex_holder &operator=(const pthread_mutex_holder &rhs) = delete;

    ~pthread_mutex_holder() {
        const int err = pthread_mutex_unlock(mu_);
        if (err != 0) {
            QLOCK_RAW_CRITICAL("pthread_mutex_unlock failed: {}", err);
        }
    }

  private:
    pthread_mutex_t *mu_;
};

}  // namespace

const char *parker::mode_name() {
    return "condvar";
}

bool parker::os_blocking_available() {
    return !condvar_degraded.load(std::memory_order_relaxed);
}

parker::parker() : state_(kEmpty), os_ready_(false) {
    const int err = pthread_mutex_init(&mu_, nullptr);
    if (err != 0) {
        QLOCK_RAW_WARN("pthread_mutex_init failed: {}, parker falls back to spinning", err);
        condvar_degraded.store(true, std::memory_order_relaxed);
        return;
    }
    const int err2 = pthread_cond_init(&cv_, nullptr);
    if (err2 != 0) {
        QLOCK_RAW_WARN("pthread_cond_init failed: {}, parker falls back to spinning", err2);
        condvar_degraded.store(true, std::memory_order_relaxed);
        pthread_mutex_destroy(&mu_);
        return;
    }
    os_ready_ = true;
}

void parker::prepare() {
    QLOCK_DCHECK(state_.load(std::memory_order_relaxed) != kParked,
                 "prepare() while the previous episode is still parked");
    state_.store(kWaiting, std::memory_order_relaxed);
}

// Every state transition of a ready parker happens under mu_, so the owner
// cannot observe kNotified, return and destroy the parker while unpark()
// still holds the mutex.
bool parker::park_until(kernel_timeout t) {
    if (!os_ready_) {
        const int32_t s = state_.load(std::memory_order_acquire);
        check_can_park(s);
        return s == kNotified || spin_until_notified(t);
    }

    struct timespec abs_timeout;
    if (t.has_timeout()) {
        abs_timeout = t.make_abs_timespec();
    }

    pthread_mutex_holder h(&mu_);
    int32_t s = state_.load(std::memory_order_relaxed);
    check_can_park(s);
    if (s == kNotified) {
        return true;
    }
    if (t.expired()) {
        return false;
    }
    state_.store(kParked, std::memory_order_relaxed);
    while (state_.load(std::memory_order_relaxed) != kNotified) {
        if (!t.has_timeout()) {
            const int err = pthread_cond_wait(&cv_, &mu_);
            if (err != 0) {
                QLOCK_RAW_CRITICAL("pthread_cond_wait failed: {}", err);
            }
        } else {
            const int err = pthread_cond_timedwait(&cv_, &mu_, &abs_timeout);
            if (err == ETIMEDOUT) {
                if (state_.load(std::memory_order_relaxed) == kNotified) {
                    return true;
                }
                state_.store(kWaiting, std::memory_order_relaxed);
                return false;
            }
            if (err != 0) {
                QLOCK_RAW_CRITICAL("pthread_cond_timedwait failed: {}", err);
            }
        }
    }
    return true;
}

bool parker::unpark() {
    int32_t prev = kEmpty;
    if (!os_ready_) {
        return notify_state(&state_, &prev);
    }
    pthread_mutex_holder h(&mu_);
    if (!notify_state(&state_, &prev)) {
        return false;
    }
    if (prev == kParked) {
        const int err = pthread_cond_signal(&cv_);
        if (QLOCK_UNLIKELY(err != 0)) {
            QLOCK_RAW_CRITICAL("pthread_cond_signal failed: {}", err);
        }
    }
    return true;
}

bool parker::abandon() {
    if (!os_ready_) {
        return abandon_state(&state_);
    }
    pthread_mutex_holder h(&mu_);
    return abandon_state(&state_);
}

#else
#error Unknown QLOCK_PARKER_MODE
#endif

}  // namespace thread_internal

}  // namespace qlock
