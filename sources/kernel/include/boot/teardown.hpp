#pragma once

#include "boot/firmware.hpp"
#include "boot/memory_map_reader.hpp"

namespace boot {
    /// @brief The most times exiting boot services is attempted.
    static constexpr uint32_t kMaxExitAttempts = 3;

    enum class ExitPhase {
        /// @brief Querying the memory map for a fresh key.
        eQuerying,

        /// @brief Asking firmware to exit boot services with the current key.
        eExiting,

        /// @brief The last exit was rejected, the key must be refreshed.
        eRetrying,

        /// @brief Boot services are gone, the firmware must not be called again.
        eSuccess,

        /// @brief Boot services could not be exited.
        eFatal,
    };

    struct ExitBootServicesState {
        ExitPhase phase;
        uint32_t attempts;
        uintptr_t mapKey;
        EfiStatus lastStatus;

        constexpr bool isTerminal() const {
            return phase == ExitPhase::eSuccess || phase == ExitPhase::eFatal;
        }
    };

    /// @brief Advance the teardown by exactly one firmware call.
    ///
    /// Does nothing once the state is terminal.
    void ExitBootServicesStep(ExitBootServicesState *state [[gnu::nonnull]], IBootServices& firmware, MemoryMapReader& reader);

    /// @brief Exit boot services, refreshing the map key after each rejection.
    ///
    /// @param mapKey The key from the last memory map read.
    ///
    /// @return The terminal state, either @a ExitPhase::eSuccess or @a ExitPhase::eFatal.
    ExitBootServicesState ExitBootServices(IBootServices& firmware, MemoryMapReader& reader, uintptr_t mapKey);
}

template<>
struct cm::Format<boot::ExitPhase> {
    static stdx::StringView toString(boot::ExitPhase phase) {
        using enum boot::ExitPhase;
        switch (phase) {
        case eQuerying: return "Querying";
        case eExiting: return "Exiting";
        case eRetrying: return "Retrying";
        case eSuccess: return "Success";
        case eFatal: return "Fatal";
        default: return "Invalid";
        }
    }
};
