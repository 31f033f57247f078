#include "logger/logger.hpp"

void cm::LogQueue::write(const LogMessageView& message) {
    for (ILogAppender *appender : mAppenders) {
        appender->write(message);
    }
}

OsStatus cm::LogQueue::addAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    if (std::find(mAppenders.begin(), mAppenders.end(), appender) != mAppenders.end()) {
        return OsStatusAlreadyExists;
    }

    return mAppenders.add(appender) ? OsStatusSuccess : OsStatusOutOfMemory;
}

void cm::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    mAppenders.removeIf(appender);
}

OsStatus cm::LogQueue::replaceAppender(ILogAppender *previous, ILogAppender *next) noexcept {
    stdx::LockGuard guard(mLock);
    for (ILogAppender *&appender : mAppenders) {
        if (appender == previous) {
            appender = next;
            return OsStatusSuccess;
        }
    }

    return OsStatusNotFound;
}

size_t cm::LogQueue::appenderCount() noexcept {
    stdx::LockGuard guard(mLock);
    return mAppenders.count();
}

OsStatus cm::LogQueue::submit(const LogMessageView& message) noexcept {
    if (!mLock.try_lock()) {
        mDroppedCount.fetch_add(1, std::memory_order_relaxed);
        return OsStatusDeviceBusy;
    }

    write(message);
    mLock.unlock();

    mComittedCount.fetch_add(1, std::memory_order_relaxed);
    return OsStatusSuccess;
}

stdx::StringView cm::Logger::getName() const noexcept {
    return mName;
}

void cm::Logger::submit(LogLevel level, stdx::StringView message, std::source_location location) noexcept {
    LogMessageView view {
        .location = location,
        .message = message,
        .logger = this,
        .level = level,
    };

    mQueue->submit(view);
}

void cm::Logger::dbg(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void cm::Logger::info(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void cm::Logger::warn(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void cm::Logger::error(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void cm::Logger::fatal(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
