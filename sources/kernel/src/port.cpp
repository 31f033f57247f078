#include "port.hpp"

#include "arch/intrin.hpp"

void CmWriteByte(uint16_t port, uint8_t value) noexcept {
    arch::Intrin::outbyte(port, value);
}

uint8_t CmReadByte(uint16_t port) noexcept {
    return arch::Intrin::inbyte(port);
}
