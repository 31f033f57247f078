#pragma once

#include "std/string_view.hpp"

#include <source_location>

extern "C" [[noreturn]] void CmHalt(void);

namespace cm {
    /// @brief Report an unrecoverable error and halt the processor.
    ///
    /// Every fatal path in both the boot and kernel phase ends here. Never returns.
    [[noreturn]]
    void BugCheck(stdx::StringView message, std::source_location where = std::source_location::current()) noexcept;
}

#define CM_PANIC(msg) cm::BugCheck(msg)
#define CM_CHECK(expr, msg) do { if (!(expr)) { cm::BugCheck(msg); } } while (0)
#define CM_ASSERT(expr) do { if (!(expr)) { cm::BugCheck(#expr); } } while (0)
