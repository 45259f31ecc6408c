#pragma once

#include "WindowEvent.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>

namespace kreeda {

// Everything applied to the VkSurfaceKHR when (re)building the swapchain.
// width/height are never 0; they hold the last non-degenerate size requested.
struct SwapchainConfig {
    VkImageUsageFlags usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    VkSurfaceFormatKHR format{VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR};
    uint32_t width = 1;
    uint32_t height = 1;
    VkPresentModeKHR presentMode = VK_PRESENT_MODE_FIFO_KHR;  // vsync
    VkCompositeAlphaFlagBitsKHR alphaMode = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    uint32_t desiredMaximumFrameLatency = 1;

    // Adopts size if both dimensions are non-zero. Returns false (and leaves
    // the config untouched) for a minimised window.
    bool resize(PhysicalSize size);
};

bool isSrgbFormat(VkFormat format);

// First sRGB format offered, else the first format offered.
VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats);

// Lowest supported composite-alpha bit; opaque if the mask is empty.
VkCompositeAlphaFlagBitsKHR chooseCompositeAlpha(VkCompositeAlphaFlagsKHR supported);

// latency + 1 images, clamped to what the surface allows.
uint32_t chooseImageCount(const VkSurfaceCapabilitiesKHR& caps, uint32_t frameLatency);

// Configured size clamped to the surface's extent range.
VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& caps, const SwapchainConfig& config);

SwapchainConfig makeSwapchainConfig(const std::vector<VkSurfaceFormatKHR>& formats,
                                    const VkSurfaceCapabilitiesKHR& caps,
                                    PhysicalSize windowSize);

}
