#include "logger/e9_appender.hpp"

#include "logger/logger.hpp"
#include "port.hpp"

void cm::E9Appender::write(const LogMessageView& message) {
    auto& [_, msg, logger, level] = message;

    auto print = [](stdx::StringView text) {
        for (char c : text) {
            CmWriteByte(kLogPort, c);
        }
    };

    if (level != LogLevel::ePrint) {
        print("[");
        print(logger->getName());
        print("] ");
    }

    print(msg);

    if (level != LogLevel::ePrint) {
        CmWriteByte(kLogPort, '\n');
    }
}

bool cm::E9Appender::isAvailable() noexcept {
    return CmReadByte(kLogPort) == kLogPort;
}
