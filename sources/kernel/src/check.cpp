#include "panic.hpp"

#include "arch/intrin.hpp"
#include "logger/categories.hpp"

[[noreturn]]
void CmHalt(void) {
    for (;;) {
        arch::Intrin::cli();
        arch::Intrin::halt();
    }
}

void cm::BugCheck(stdx::StringView message, std::source_location where) noexcept {
    InitLog.fatalf("Assertion failed '", message, "'");
    stdx::StringView fn = stdx::StringView::ofString(where.function_name());
    stdx::StringView file = stdx::StringView::ofString(where.file_name());
    InitLog.fatalf(fn, " (", file, ":", where.line(), ")");
    CmHalt();
}
