#pragma once

#include "boot/firmware.hpp"

#include "std/string_view.hpp"

#include <source_location>

namespace boot {
    /// @brief Report a failed firmware operation and halt.
    ///
    /// @param operation What was being done when the firmware failed.
    /// @param status The status the firmware returned.
    [[noreturn]]
    void DisplayErrorAndHalt(stdx::StringView operation, EfiStatus status, std::source_location where = std::source_location::current());

    /// @brief Report an unrecoverable boot error that has no firmware status and halt.
    [[noreturn]]
    void DisplaySimpleErrorAndHalt(stdx::StringView message, std::source_location where = std::source_location::current());
}
