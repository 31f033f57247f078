#pragma once

#include "logger/appender.hpp"

#include "std/static_vector.hpp"
#include "std/spinlock.hpp"

#include "util/format.hpp"

#include <atomic>

namespace cm {
    /// @brief Fans log messages out to the installed appenders.
    ///
    /// There is no heap during early boot, so the appender list has a fixed capacity and
    /// messages are written synchronously. A message submitted while another is being written
    /// is dropped and counted.
    class LogQueue {
        using AppenderList = stdx::StaticVector<ILogAppender*, 4>;

        constinit static LogQueue sLogQueue;

        stdx::SpinLock mLock;
        AppenderList mAppenders GUARDED_BY(mLock);

        /// @brief Number of messages that were dropped due to the queue being busy.
        std::atomic<uint32_t> mDroppedCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mComittedCount{0};

        void write(const LogMessageView& message) REQUIRES(mLock);
    public:
        constexpr LogQueue() noexcept = default;

        OsStatus addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        /// @brief Swap one appender for another in place.
        ///
        /// Used when the boot console goes away and serial output takes over.
        OsStatus replaceAppender(ILogAppender *previous, ILogAppender *next) noexcept;

        size_t appenderCount() noexcept;

        OsStatus submit(const LogMessageView& message) noexcept;

        uint32_t getDroppedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mDroppedCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mComittedCount.load(order);
        }

        static constexpr LogQueue &getGlobalQueue() noexcept {
            return sLogQueue;
        }

        static OsStatus addGlobalAppender(ILogAppender *appender) noexcept {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };

    constinit inline LogQueue LogQueue::sLogQueue{};
}
