#include "logger/serial_appender.hpp"

#include "logger/logger.hpp"

void cm::SerialAppender::write(const LogMessageView& message) {
    auto& [_, msg, logger, level] = message;

    if (level != LogLevel::ePrint) {
        mSerialPort.print("[");
        mSerialPort.print(logger->getName());
        mSerialPort.print("] ");
    }

    mSerialPort.print(msg);

    if (level != LogLevel::ePrint) {
        mSerialPort.print("\n");
    }
}

OsStatus cm::SerialAppender::create(SerialPort port, SerialAppender *appender) noexcept {
    if (!port.isReady()) {
        return OsStatusInvalidInput;
    }

    appender->mSerialPort = port;
    return OsStatusSuccess;
}
