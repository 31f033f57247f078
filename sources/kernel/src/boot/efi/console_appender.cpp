#include "console_appender.hpp"

namespace efi = boot::efi;

static constexpr size_t kLineSize = cm::kLogMessageSize + 32;

static size_t AppendText(CHAR16 *buffer, size_t used, stdx::StringView text) {
    for (char c : text) {
        if (used >= kLineSize - 1) break;
        buffer[used++] = CHAR16(c);
    }

    return used;
}

void efi::ConsoleAppender::write(const cm::LogMessageView& message) {
    CHAR16 line[kLineSize];
    size_t used = 0;

    used = AppendText(line, used, "[");
    used = AppendText(line, used, message.logger->getName());
    used = AppendText(line, used, "] ");
    used = AppendText(line, used, message.message);
    used = AppendText(line, used, "\r\n");
    line[used] = 0;

    uefi_call_wrapper(mConsole->OutputString, 2, mConsole, line);
}
