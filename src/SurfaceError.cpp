#include "SurfaceError.hpp"

namespace kreeda {

SurfaceErrorAction surfaceErrorAction(SurfaceError error) {
    switch (error) {
        case SurfaceError::None: return SurfaceErrorAction::Continue;
        case SurfaceError::Lost:
        case SurfaceError::Outdated: return SurfaceErrorAction::Reconfigure;
        case SurfaceError::Timeout: return SurfaceErrorAction::SkipFrame;
        case SurfaceError::OutOfMemory: return SurfaceErrorAction::Exit;
    }
    return SurfaceErrorAction::Exit;
}

const char* surfaceErrorName(SurfaceError error) {
    switch (error) {
        case SurfaceError::None: return "None";
        case SurfaceError::Lost: return "Lost";
        case SurfaceError::Outdated: return "Outdated";
        case SurfaceError::Timeout: return "Timeout";
        case SurfaceError::OutOfMemory: return "OutOfMemory";
    }
    return "Unknown";
}

static SurfaceError commonResultToError(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return SurfaceError::None;
        case VK_TIMEOUT:
        case VK_NOT_READY: return SurfaceError::Timeout;
        case VK_ERROR_OUT_OF_DATE_KHR: return SurfaceError::Outdated;
        case VK_ERROR_SURFACE_LOST_KHR: return SurfaceError::Lost;
        default: return SurfaceError::OutOfMemory;
    }
}

SurfaceError acquireResultToError(VkResult result) {
    if (result == VK_SUBOPTIMAL_KHR) return SurfaceError::None;
    return commonResultToError(result);
}

SurfaceError presentResultToError(VkResult result) {
    if (result == VK_SUBOPTIMAL_KHR) return SurfaceError::Outdated;
    return commonResultToError(result);
}

}
