#pragma once

#include <gtest/gtest.h>

#include <immintrin.h>

#include <cstring>
#include <memory>

#include "memory/physical_memory.hpp"

template<typename T>
using mmUniquePtr = std::unique_ptr<T, decltype(&_mm_free)>;

/// @brief A host buffer standing in for a window of physical memory.
///
/// The buffer is page aligned so that physical alignment and host alignment agree.
struct TestMemory {
    mmUniquePtr<std::byte[]> memory;
    cm::MemoryRange window;

    TestMemory(cm::PhysicalAddress base, size_t size, uint8_t fill = 0)
        : memory { (std::byte*)_mm_malloc(size, 0x1000), &_mm_free }
        , window { cm::MemoryRange::of(base, size) }
    {
        memset(memory.get(), fill, size);
    }

    cm::PhysicalMemory physical() const {
        return cm::PhysicalMemory(window, (uintptr_t)memory.get() - window.front.address);
    }

    /// @brief The host pointer for @p address.
    template<typename T = std::byte>
    T *host(cm::PhysicalAddress address) const {
        return reinterpret_cast<T*>(memory.get() + (address - window.front));
    }

    cm::PhysicalAddress physicalOf(const void *ptr) const {
        return window.front + ((const std::byte*)ptr - memory.get());
    }
};
