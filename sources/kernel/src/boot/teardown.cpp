#include "boot/teardown.hpp"

#include "logger/categories.hpp"

using boot::ExitPhase;

void boot::ExitBootServicesStep(ExitBootServicesState *state [[gnu::nonnull]], IBootServices& firmware, MemoryMapReader& reader) {
    switch (state->phase) {
    case ExitPhase::eQuerying:
    case ExitPhase::eRetrying: {
        uintptr_t key = 0;
        if (OsStatus status = reader.refreshMapKey(&key)) {
            BootLog.errorf("Failed to refresh memory map key: ", OsStatusId(status));
            state->lastStatus = reader.lastStatus();
            state->phase = ExitPhase::eFatal;
            break;
        }

        state->mapKey = key;
        state->phase = ExitPhase::eExiting;
        break;
    }
    case ExitPhase::eExiting: {
        state->attempts += 1;
        state->lastStatus = firmware.exitBootServices(state->mapKey);
        if (state->lastStatus == efi::kSuccess) {
            state->phase = ExitPhase::eSuccess;
            break;
        }

        //
        // Nothing can be logged past a successful exit, so only rejections are reported.
        //
        BootLog.warnf("ExitBootServices attempt ", state->attempts, " of ", kMaxExitAttempts, " rejected: ", EfiStatusString(state->lastStatus));
        state->phase = (state->attempts < kMaxExitAttempts) ? ExitPhase::eRetrying : ExitPhase::eFatal;
        break;
    }
    case ExitPhase::eSuccess:
    case ExitPhase::eFatal:
        break;
    }
}

boot::ExitBootServicesState boot::ExitBootServices(IBootServices& firmware, MemoryMapReader& reader, uintptr_t mapKey) {
    ExitBootServicesState state {
        .phase = ExitPhase::eExiting,
        .attempts = 0,
        .mapKey = mapKey,
        .lastStatus = efi::kSuccess,
    };

    while (!state.isTerminal()) {
        ExitBootServicesStep(&state, firmware, reader);
    }

    return state;
}
