#include "logger/categories.hpp"
#include "memory/heap.hpp"
#include "panic.hpp"
#include "setup.hpp"
#include "util/memory.hpp"

#include <new>

static constinit cm::KernelHeap *gHeap = nullptr;

extern "C" void __cxa_pure_virtual() {
    CM_PANIC("Pure virtual function called.");
}

void cm::InitGlobalAllocator(KernelHeap *heap) {
    CM_CHECK(heap->isInitialized(), "Global allocator requires an initialized heap.");
    gHeap = heap;
}

static void *OperatorNew(size_t size, size_t align, bool nothrow) {
    if (gHeap != nullptr) {
        if (void *ptr = gHeap->allocateAligned(size, align)) {
            return ptr;
        }
    }

    if (nothrow) {
        return nullptr;
    }

    MemLog.fatalf("[CRT] Allocation of ", sm::bytes(size), " failed.");
    CM_PANIC("Failed to allocate memory.");
}

static void OperatorDelete(void *ptr) {
    if (ptr == nullptr) {
        return;
    }

    CM_CHECK(gHeap != nullptr, "Freeing memory before the global allocator is initialized.");
    gHeap->deallocate(ptr);
}

// operator new

void* operator new(std::size_t size) {
    return OperatorNew(size, alignof(std::max_align_t), false);
}

void* operator new(std::size_t size, const std::nothrow_t&) noexcept {
    return OperatorNew(size, alignof(std::max_align_t), true);
}

void* operator new(std::size_t size, std::align_val_t align) {
    return OperatorNew(size, std::to_underlying(align), false);
}

void* operator new(std::size_t size, std::align_val_t align, const std::nothrow_t&) noexcept {
    return OperatorNew(size, std::to_underlying(align), true);
}

// operator new[]

void* operator new[](std::size_t size) {
    return OperatorNew(size, alignof(std::max_align_t), false);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept {
    return OperatorNew(size, alignof(std::max_align_t), true);
}

void* operator new[](std::size_t size, std::align_val_t align) {
    return OperatorNew(size, std::to_underlying(align), false);
}

void* operator new[](std::size_t size, std::align_val_t align, const std::nothrow_t&) noexcept {
    return OperatorNew(size, std::to_underlying(align), true);
}

// operator delete

void operator delete(void* ptr) noexcept {
    OperatorDelete(ptr);
}

void operator delete(void* ptr, std::size_t) noexcept {
    OperatorDelete(ptr);
}

void operator delete(void* ptr, std::align_val_t) noexcept {
    OperatorDelete(ptr);
}

void operator delete(void* ptr, std::size_t, std::align_val_t) noexcept {
    OperatorDelete(ptr);
}

// operator delete[]

void operator delete[](void* ptr) noexcept {
    OperatorDelete(ptr);
}

void operator delete[](void* ptr, std::size_t) noexcept {
    OperatorDelete(ptr);
}

void operator delete[](void* ptr, std::align_val_t) noexcept {
    OperatorDelete(ptr);
}

void operator delete[](void* ptr, std::size_t, std::align_val_t) noexcept {
    OperatorDelete(ptr);
}
