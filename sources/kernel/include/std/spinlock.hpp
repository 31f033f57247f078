#pragma once

#include <atomic>

#include <emmintrin.h>

#include "common/compiler/compiler.hpp"

namespace stdx {
    class CAPABILITY("mutex") SpinLock {
        std::atomic_flag mLock = ATOMIC_FLAG_INIT;

    public:
        constexpr SpinLock() noexcept = default;

        void lock() noexcept ACQUIRE() {
            while (mLock.test_and_set(std::memory_order_acquire)) {
                _mm_pause();
            }
        }

        void unlock() noexcept RELEASE() {
            mLock.clear(std::memory_order_release);
        }

        [[nodiscard]]
        bool try_lock() noexcept TRY_ACQUIRE(true) {
            return !mLock.test_and_set(std::memory_order_acquire);
        }
    };

    template<typename T>
    class [[nodiscard]] SCOPED_CAPABILITY LockGuard {
        T& mLock;

    public:
        LockGuard(T& lock) noexcept ACQUIRE(lock)
            : mLock(lock)
        {
            mLock.lock();
        }

        ~LockGuard() noexcept RELEASE() {
            mLock.unlock();
        }
    };
}
