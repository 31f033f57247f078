#pragma once

#include <cosmos/status.h>

#include "std/string_view.hpp"

#include <span>

#include <stddef.h>
#include <stdint.h>

namespace cm {
    namespace uart::detail {
        // Offsets from the base serial port
        static constexpr uint16_t kData = 0;
        static constexpr uint16_t kInterruptEnable = 1;
        static constexpr uint16_t kFifoControl = 2;
        static constexpr uint16_t kLineControl = 3;
        static constexpr uint16_t kModemControl = 4;
        static constexpr uint16_t kLineStatus = 5;
        static constexpr uint16_t kScratch = 7;

        /// @brief Divisor Latch Access Bit
        static constexpr uint8_t kDlabOffset = 7;

        // Line status bits
        static constexpr uint8_t kEmptyTransmit = (1 << 5);
    }

    struct ComPortInfo {
        uint16_t port;
        uint16_t divisor;

        bool skipLoopbackTest = false;
        bool skipScratchTest = false;
    };

    namespace com {
        static constexpr uint16_t kComPort1 = 0x3f8;
        static constexpr uint16_t kComPort2 = 0x2f8;

        static constexpr uint32_t kBaudRate = 115200;
        static constexpr uint16_t kBaud9600 = kBaudRate / 9600;
        static constexpr uint16_t kBaud115200 = kBaudRate / 115200;

        /// @brief COM1 at full speed, the port both boot phases log to.
        static constexpr ComPortInfo kDefaultPort = {
            .port = kComPort1,
            .divisor = kBaud115200,
        };
    }

    class SerialPort {
        uint16_t mBasePort = 0xFFFF;

        /// @brief Returns true if the transmit buffer is empty.
        bool waitForTransmit() noexcept;

        constexpr SerialPort(ComPortInfo info) noexcept
            : mBasePort(info.port)
        { }

    public:
        constexpr SerialPort() noexcept = default;

        constexpr bool isReady() const noexcept { return mBasePort != 0xFFFF; }

        size_t write(std::span<const uint8_t> src, unsigned timeout = 100) noexcept;

        OsStatus put(uint8_t byte, unsigned timeout = 100) noexcept;

        size_t print(stdx::StringView src, unsigned timeout = 100) noexcept;

        /// @brief Probe and configure a serial port.
        ///
        /// @pre @a info.divisor is not 0
        ///
        /// @retval OsStatusNotFound The scratch register did not hold its value.
        /// @retval OsStatusDeviceFault The loopback test failed.
        static OsStatus create(ComPortInfo info, SerialPort *port [[gnu::nonnull]]) noexcept;
    };
}
