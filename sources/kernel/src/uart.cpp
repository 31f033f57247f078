#include "uart.hpp"

#include "port.hpp"

#include "logger/categories.hpp"

#include <immintrin.h>

using namespace cm::uart::detail;

bool cm::SerialPort::waitForTransmit() noexcept {
    uint8_t status = CmReadByte(mBasePort + kLineStatus);
    return status & kEmptyTransmit;
}

OsStatus cm::SerialPort::put(uint8_t byte, unsigned timeout) noexcept {
    while (!waitForTransmit()) {
        if (timeout-- == 0) {
            return OsStatusTimeout;
        }

        _mm_pause();
    }

    CmWriteByte(mBasePort, byte);

    return OsStatusSuccess;
}

size_t cm::SerialPort::write(std::span<const uint8_t> src, unsigned timeout) noexcept {
    size_t i = 0;
    for (; i < src.size_bytes(); i++) {
        if (put(src[i], timeout) != OsStatusSuccess) {
            break;
        }
    }

    return i;
}

size_t cm::SerialPort::print(stdx::StringView src, unsigned timeout) noexcept {
    size_t result = 0;
    for (char c : src) {
        if (c == '\0')
            continue;

        if (c == '\n') {
            if (put('\r', timeout) != OsStatusSuccess)
                break;

            result += 1;
        }

        if (put(c, timeout) != OsStatusSuccess)
            break;

        result += 1;
    }

    return result;
}

OsStatus cm::SerialPort::create(ComPortInfo info, SerialPort *port [[gnu::nonnull]]) noexcept {
    uint16_t base = info.port;

    // do initial scratch test
    if (!info.skipScratchTest) {
        static constexpr uint8_t kScratchByte = 0x55;
        CmWriteByte(base + kScratch, kScratchByte);
        if (uint8_t read = CmReadByte(base + kScratch); read != kScratchByte) {
            InitLog.warnf("[", Hex(base), "] Scratch test failed ", Hex(read), " != ", Hex(kScratchByte));
            return OsStatusNotFound;
        }
    }

    // disable interrupts
    CmWriteByte(base + kInterruptEnable, 0x00);

    // enable DLAB
    CmWriteByte(base + kLineControl, (1 << kDlabOffset));

    // set the divisor
    CmWriteByte(base + 0, (info.divisor & 0x00FF) >> 0);
    CmWriteByte(base + 1, (info.divisor & 0xFF00) >> 8);

    // disable DLAB and configure the line
    uint8_t lineControl
        = 0b11 // 8 bits
        | (0 << 2) // one stop bit
        | (0 << 3) // no parity bit
        | (0 << kDlabOffset); // DLAB off
    CmWriteByte(base + kLineControl, lineControl);

    // enable fifo
    uint8_t fifoControl
        = (1 << 0) // enable fifo
        | (1 << 1) // clear receive fifo
        | (1 << 2) // clear transmit fifo
        | (0b11 << 6); // 14 byte threshold
    CmWriteByte(base + kFifoControl, fifoControl);

    // rts/dtr set
    CmWriteByte(base + kModemControl, 0x0F);

    if (!info.skipLoopbackTest) {
        CmWriteByte(base + kModemControl, 0x1E);
        static constexpr uint8_t kLoopbackByte = 0xAE;

        // send a byte and check if it comes back
        CmWriteByte(base + kData, kLoopbackByte);
        if (uint8_t read = CmReadByte(base + kData); read != kLoopbackByte) {
            CmWriteByte(base + kModemControl, 0x0F);

            InitLog.warnf("[", Hex(base), "] Loopback test failed ", Hex(read), " != ", Hex(kLoopbackByte));
            return OsStatusDeviceFault;
        }

        // disable loopback
        CmWriteByte(base + kModemControl, 0x0F);
    }

    *port = SerialPort(info);
    return OsStatusSuccess;
}
