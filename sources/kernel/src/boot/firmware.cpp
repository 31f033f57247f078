#include "boot/firmware.hpp"

stdx::StringView boot::EfiStatusString(EfiStatus status) {
    switch (status) {
    case efi::kSuccess: return "Success";
    case efi::kLoadError: return "Load Error";
    case efi::kInvalidParameter: return "Invalid Parameter";
    case efi::kUnsupported: return "Unsupported";
    case efi::kBadBufferSize: return "Bad Buffer Size";
    case efi::kBufferTooSmall: return "Buffer Too Small";
    case efi::kNotReady: return "Not Ready";
    case efi::kDeviceError: return "Device Error";
    case efi::kWriteProtected: return "Write Protected";
    case efi::kOutOfResources: return "Out of Resources";
    case efi::kNotFound: return "Not Found";
    default: return "Unknown Error";
    }
}
