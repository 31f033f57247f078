#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef uint64_t OsStatus;

enum OsStatusId {
    /// @brief The operation was successful.
    OsStatusSuccess = 0x0000,

    /// @brief The operation could not be completed due to a lack of memory.
    OsStatusOutOfMemory = 0x0001,

    /// @brief The requested resource could not be found.
    OsStatusNotFound = 0x0002,

    /// @brief The input to the operation was invalid.
    OsStatusInvalidInput = 0x0003,

    /// @brief The resource does not support the operation.
    OsStatusNotSupported = 0x0004,

    /// @brief The resource already exists.
    OsStatusAlreadyExists = 0x0005,

    /// @brief The data is invalid.
    ///
    /// Data required for the operation is invalid, distinct from @ref OsStatusInvalidInput.
    OsStatusInvalidData = 0x0006,

    /// @brief The operation timed out.
    OsStatusTimeout = 0x0007,

    OsStatusOutOfBounds = 0x0008,

    /// @brief The memory address is not suitably aligned or otherwise unusable.
    OsStatusInvalidAddress = 0x0009,

    /// @brief The memory span specified is outside the accessible window.
    OsStatusInvalidSpan = 0x000a,

    /// @brief The device has misbehaved.
    OsStatusDeviceFault = 0x000b,

    OsStatusDeviceBusy = 0x000c,

    /// @brief The firmware reported more data than the provided buffer can hold.
    OsStatusBufferTooSmall = 0x0100,

    /// @brief A firmware call failed with a status that is not otherwise handled.
    OsStatusFirmwareError = 0x0101,

    /// @brief The firmware memory map contained no usable descriptors.
    OsStatusEmptyMap = 0x0102,

    /// @brief The frame is not part of any usable region, or was never handed out.
    OsStatusInvalidFrame = 0x0103,

    /// @brief A single initialization object was initialized twice.
    OsStatusAlreadyInitialized = 0x0104,

    /// @brief Sizing or alignment constraints could not be satisfied.
    OsStatusInvalidConfiguration = 0x0105,

    /// @brief Backing frames for an allocation could not be claimed.
    OsStatusFrameAllocationFailed = 0x0106,

    /// @brief Memory did not hold the expected contents after being written.
    OsStatusCorruptionDetected = 0x0107,

    /// @brief The hand-off location holds no memory map.
    OsStatusNoMemoryMap = 0x0108,

    /// @brief The hand-off memory map is malformed.
    OsStatusInvalidMemoryMap = 0x0109,
};

#define OS_SUCCESS(status) ((status) == OsStatusSuccess)
#define OS_ERROR(status) ((status) != OsStatusSuccess)

#ifdef __cplusplus
}
#endif
