// core/lock_policy.hpp
// Compile-time locking strategies for shared bookkeeping (frame pool, UMEM ledger)
//
// Each policy provides lock()/unlock() and is used through std::lock_guard.
//   NullLock  - no synchronization, zero overhead (single-threaded owner)
//   SpinLock  - busy-wait on an atomic flag (short critical sections, pinned cores)
//   MutexLock - std::mutex
//
// Ring operations never take these locks; rings are synchronized only by the
// acquire/release ordering of their producer/consumer indices.

#pragma once

#include <atomic>
#include <mutex>

namespace afxdp {

struct NullLock {
    void lock() noexcept {}
    void unlock() noexcept {}
};

class SpinLock {
public:
    void lock() noexcept {
        while (flag_.test_and_set(std::memory_order_acquire)) {
#if defined(__x86_64__) || defined(__i386__)
            __builtin_ia32_pause();  // Hint for spin-wait
#endif
        }
    }

    void unlock() noexcept {
        flag_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

class MutexLock {
public:
    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }

private:
    std::mutex mutex_;
};

}  // namespace afxdp
