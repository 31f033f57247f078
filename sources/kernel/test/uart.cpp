#include <gtest/gtest.h>

#include "uart.hpp"
#include "logger/logger.hpp"
#include "logger/e9_appender.hpp"
#include "logger/serial_appender.hpp"

#include "ports.hpp"

using namespace cm::uart::detail;

/// @brief Just enough of a 16550 to pass the probe and capture output.
class Uart16550 : public kmtest::IPeripheral {
    uint16_t mBase;

    uint8_t mScratch = 0;
    uint8_t mLineControl = 0;
    uint8_t mModemControl = 0;
    uint8_t mLoopback = 0;

public:
    Uart16550(uint16_t base)
        : IPeripheral("UART")
        , mBase(base)
    { }

    std::string output;
    uint16_t divisor = 0;

    bool transmitReady = true;
    bool brokenScratch = false;
    bool brokenLoopback = false;

    void connect(kmtest::PeripheralRegistry& registry) override {
        for (uint16_t offset = 0; offset < 8; offset++) {
            registry.wire(mBase + offset, this);
        }
    }

    void write8(uint16_t port, uint8_t value) override {
        bool dlab = mLineControl & (1 << kDlabOffset);
        switch (port - mBase) {
        case kData:
            if (dlab) {
                divisor = (divisor & 0xFF00) | value;
            } else if (mModemControl & 0x10) {
                mLoopback = brokenLoopback ? uint8_t(~value) : value;
            } else {
                output.push_back(char(value));
            }
            break;
        case kInterruptEnable:
            if (dlab) {
                divisor = (divisor & 0x00FF) | (value << 8);
            }
            break;
        case kLineControl:
            mLineControl = value;
            break;
        case kModemControl:
            mModemControl = value;
            break;
        case kScratch:
            mScratch = brokenScratch ? 0 : value;
            break;
        default:
            break;
        }
    }

    uint8_t read8(uint16_t port) override {
        switch (port - mBase) {
        case kData: return mLoopback;
        case kLineStatus: return transmitReady ? kEmptyTransmit : 0;
        case kScratch: return mScratch;
        default: return 0;
        }
    }
};

class SerialPortTest : public testing::Test {
public:
    kmtest::TestIntrin intrin;
    kmtest::ScopedIntrin scope { &intrin };
    Uart16550 uart { cm::com::kComPort1 };

    void SetUp() override {
        intrin.devices.add(&uart);
    }
};

TEST_F(SerialPortTest, Create) {
    cm::SerialPort port;
    ASSERT_FALSE(port.isReady());

    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusSuccess);
    ASSERT_TRUE(port.isReady());
    ASSERT_EQ(uart.divisor, cm::com::kBaud115200);
}

TEST_F(SerialPortTest, NoDevice) {
    intrin.devices.remove(&uart);

    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusNotFound);
    ASSERT_FALSE(port.isReady());
}

TEST_F(SerialPortTest, BrokenScratch) {
    uart.brokenScratch = true;

    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusNotFound);
}

TEST_F(SerialPortTest, BrokenLoopback) {
    uart.brokenLoopback = true;

    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusDeviceFault);
}

TEST_F(SerialPortTest, PrintTranslatesNewlines) {
    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusSuccess);

    ASSERT_EQ(port.print("a\nb"), 4);
    ASSERT_EQ(uart.output, "a\r\nb");
}

TEST_F(SerialPortTest, TransmitTimeout) {
    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusSuccess);

    uart.transmitReady = false;
    ASSERT_EQ(port.put('x', 10), OsStatusTimeout);
    ASSERT_TRUE(uart.output.empty());
}

TEST_F(SerialPortTest, SerialAppender) {
    cm::SerialPort port;
    ASSERT_EQ(cm::SerialPort::create(cm::com::kDefaultPort, &port), OsStatusSuccess);

    cm::SerialAppender appender;
    ASSERT_EQ(cm::SerialAppender::create(port, &appender), OsStatusSuccess);

    cm::LogQueue queue;
    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);

    cm::Logger logger { "MEM", &queue };
    logger.infof("Heap ready");

    ASSERT_EQ(uart.output, "[MEM] Heap ready\r\n");
}

TEST_F(SerialPortTest, SerialAppenderNeedsPort) {
    cm::SerialAppender appender;
    ASSERT_EQ(cm::SerialAppender::create(cm::SerialPort{}, &appender), OsStatusInvalidInput);
}

class DebugPort : public kmtest::IPeripheral {
public:
    DebugPort() : IPeripheral("E9") { }

    std::string output;

    void connect(kmtest::PeripheralRegistry& registry) override {
        registry.wire(cm::E9Appender::kLogPort, this);
    }

    void write8(uint16_t, uint8_t value) override {
        output.push_back(char(value));
    }

    uint8_t read8(uint16_t) override {
        return cm::E9Appender::kLogPort;
    }
};

TEST(E9AppenderTest, Write) {
    kmtest::TestIntrin intrin;
    kmtest::ScopedIntrin scope { &intrin };

    ASSERT_FALSE(cm::E9Appender::isAvailable());

    DebugPort port;
    intrin.devices.add(&port);
    ASSERT_TRUE(cm::E9Appender::isAvailable());

    cm::E9Appender appender;
    cm::LogQueue queue;
    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);

    cm::Logger logger { "BOOT", &queue };
    logger.warnf("Low memory");
    logger.println("| row |");

    ASSERT_EQ(port.output, "[BOOT] Low memory\n| row |\n");
}
