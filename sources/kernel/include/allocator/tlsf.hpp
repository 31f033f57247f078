#pragma once

#include <cstddef>
#include <memory>

#include "allocator/allocator.hpp"

#include <tlsf.h>

namespace mem {
    class TlsfAllocator : public mem::IAllocator {
        using Super = mem::IAllocator;

        using TlsfHandle = std::unique_ptr<void, decltype(&tlsf_destroy)>;

        TlsfHandle mAllocator;

    public:
        using Super::Super;

        /// @brief The pool created alongside the allocator.
        pool_t getPool() const {
            return tlsf_get_pool(mAllocator.get());
        }

        bool isValid() const {
            return mAllocator != nullptr;
        }

        TlsfAllocator()
            : mAllocator(nullptr, tlsf_destroy)
        { }

        /// @pre @p memory is aligned to @a tlsf_align_size
        TlsfAllocator(void *memory, size_t size)
            : mAllocator(tlsf_create_with_pool(memory, size), tlsf_destroy)
        { }

        void *allocate(size_t size) override {
            return tlsf_malloc(mAllocator.get(), size);
        }

        void *allocateAligned(size_t size, size_t align = alignof(std::max_align_t)) override {
            return tlsf_memalign(mAllocator.get(), align, size);
        }

        void deallocate(void *ptr, size_t) noexcept override {
            tlsf_free(mAllocator.get(), ptr);
        }

        /// @brief Visit every block in the pool.
        ///
        /// @param walker Called with the block pointer, its size, and whether it is in use.
        template<typename F>
        void walk(F walker) const {
            tlsf_walk_pool(getPool(), [](void *ptr, size_t size, int used, void *user) {
                (*static_cast<F*>(user))(ptr, size, used != 0);
            }, &walker);
        }
    };
}
