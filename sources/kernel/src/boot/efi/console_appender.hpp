#pragma once

#include "efi.hpp"

#include "logger/appender.hpp"

namespace boot::efi {
    /// @brief Writes log lines to the firmware text console.
    ///
    /// Only usable while boot services are active.
    class ConsoleAppender final : public cm::ILogAppender {
        SIMPLE_TEXT_OUTPUT_INTERFACE *mConsole = nullptr;

        void write(const cm::LogMessageView& message) override;

    public:
        constexpr ConsoleAppender() noexcept = default;

        constexpr ConsoleAppender(SIMPLE_TEXT_OUTPUT_INTERFACE *console) noexcept
            : mConsole(console)
        { }
    };
}
