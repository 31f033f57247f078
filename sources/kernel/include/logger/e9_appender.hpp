#pragma once

#include "logger/appender.hpp"

namespace cm {
    /// @brief Writes log lines to the bochs/qemu debug port.
    class E9Appender final : public ILogAppender {
        void write(const LogMessageView& message) override;
    public:
        static constexpr uint16_t kLogPort = 0xE9;

        constexpr E9Appender() noexcept = default;

        /// @brief Reading the port back returns 0xE9 when an emulator is listening.
        static bool isAvailable() noexcept;
    };
}
