#pragma once

#include "std/static_string.hpp"

#include <source_location>

namespace cm {
    class Logger;
    class LogQueue;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        ePrint = 0,
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    struct LogMessageView {
        std::source_location location;
        stdx::StringView message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };
}
