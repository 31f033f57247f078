#pragma once

#include <stdint.h>

/// @brief Write a byte to an I/O port.
void CmWriteByte(uint16_t port, uint8_t value) noexcept;

/// @brief Read a byte from an I/O port.
uint8_t CmReadByte(uint16_t port) noexcept;
