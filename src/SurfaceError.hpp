#pragma once

#include <vulkan/vulkan.h>

namespace kreeda {

// Per-frame outcome of GpuSurface::render().
enum class SurfaceError {
    None,
    Lost,         // VkSurfaceKHR must be recreated
    Outdated,     // swapchain no longer matches the surface
    Timeout,      // no image became available in time
    OutOfMemory,  // memory exhausted, device lost, or any other unrecoverable failure
};

// What the application handler does about a SurfaceError.
enum class SurfaceErrorAction {
    Continue,
    Reconfigure,
    SkipFrame,
    Exit,
};

SurfaceErrorAction surfaceErrorAction(SurfaceError error);
const char* surfaceErrorName(SurfaceError error);

// VkResult of vkAcquireNextImageKHR. VK_SUBOPTIMAL_KHR still yields an image.
SurfaceError acquireResultToError(VkResult result);
// VkResult of vkQueuePresentKHR / vkQueueSubmit.
SurfaceError presentResultToError(VkResult result);

}
