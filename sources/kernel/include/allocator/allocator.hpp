#pragma once

#include <cstddef>
#include <new>
#include <utility>

namespace mem {
    class IAllocator {
    public:
        virtual ~IAllocator() = default;

        void operator delete(IAllocator*, std::destroying_delete_t) {
            std::unreachable();
        }

        virtual void *allocate(size_t size) {
            return allocateAligned(size, alignof(std::max_align_t));
        }

        virtual void *allocateAligned(size_t size, size_t align) = 0;
        virtual void deallocate(void *ptr, size_t size) = 0;
    };
}
