#pragma once

#include <gtest/gtest.h>

#include "boot/firmware.hpp"

#include <cstdlib>
#include <cstring>
#include <deque>
#include <vector>

namespace kmtest {
    /// @brief Scripted firmware boot services.
    ///
    /// Every memory map query returns a fresh map key. Exit results are consumed in order,
    /// once the script runs out every exit succeeds.
    class StubBootServices : public boot::IBootServices {
        uintptr_t mNextKey = 0x1000;

    public:
        std::vector<boot::EfiMemoryDescriptor> descriptors;
        size_t descriptorSize = sizeof(boot::EfiMemoryDescriptor);

        /// @brief Returned by every memory map query when not success.
        boot::EfiStatus mapStatus = boot::efi::kSuccess;

        std::deque<boot::EfiStatus> exitResults;

        std::vector<uintptr_t> issuedKeys;
        std::vector<uintptr_t> exitKeys;
        bool exited = false;

        void add(uint32_t type, uint64_t start, uint64_t pages) {
            descriptors.push_back(boot::EfiMemoryDescriptor {
                .type = type,
                .reserved = 0,
                .physicalStart = start,
                .virtualStart = 0,
                .numberOfPages = pages,
                .attribute = 0,
            });
        }

        size_t mapQueries() const { return issuedKeys.size(); }

        boot::EfiStatus getMemoryMap(size_t *size, void *buffer, uintptr_t *key, size_t *stride, uint32_t *version) override {
            EXPECT_FALSE(exited) << "GetMemoryMap called after ExitBootServices";

            size_t required = descriptors.size() * descriptorSize;
            if (mapStatus != boot::efi::kSuccess) {
                *size = required;
                return mapStatus;
            }

            if (required > *size) {
                *size = required;
                return boot::efi::kBufferTooSmall;
            }

            std::byte *dst = static_cast<std::byte*>(buffer);
            memset(dst, 0, required);
            for (const boot::EfiMemoryDescriptor& descriptor : descriptors) {
                memcpy(dst, &descriptor, sizeof(descriptor));
                dst += descriptorSize;
            }

            *size = required;
            *key = mNextKey++;
            *stride = descriptorSize;
            *version = 1;

            issuedKeys.push_back(*key);
            return boot::efi::kSuccess;
        }

        boot::EfiStatus exitBootServices(uintptr_t key) override {
            EXPECT_FALSE(exited) << "ExitBootServices called after it succeeded";

            exitKeys.push_back(key);

            boot::EfiStatus status = boot::efi::kSuccess;
            if (!exitResults.empty()) {
                status = exitResults.front();
                exitResults.pop_front();
            }

            exited = (status == boot::efi::kSuccess);
            return status;
        }

        boot::EfiStatus allocatePool(size_t size, void **buffer) override {
            *buffer = malloc(size);
            return (*buffer != nullptr) ? boot::efi::kSuccess : boot::efi::kOutOfResources;
        }

        boot::EfiStatus freePool(void *buffer) override {
            free(buffer);
            return boot::efi::kSuccess;
        }
    };
}
