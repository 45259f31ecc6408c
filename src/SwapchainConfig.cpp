#include "SwapchainConfig.hpp"

#include <algorithm>

namespace kreeda {

bool SwapchainConfig::resize(PhysicalSize size) {
    if (size.width == 0 || size.height == 0) return false;
    width = size.width;
    height = size.height;
    return true;
}

bool isSrgbFormat(VkFormat format) {
    switch (format) {
        case VK_FORMAT_R8_SRGB:
        case VK_FORMAT_R8G8_SRGB:
        case VK_FORMAT_R8G8B8_SRGB:
        case VK_FORMAT_B8G8R8_SRGB:
        case VK_FORMAT_R8G8B8A8_SRGB:
        case VK_FORMAT_B8G8R8A8_SRGB:
        case VK_FORMAT_A8B8G8R8_SRGB_PACK32:
        case VK_FORMAT_BC1_RGB_SRGB_BLOCK:
        case VK_FORMAT_BC1_RGBA_SRGB_BLOCK:
        case VK_FORMAT_BC2_SRGB_BLOCK:
        case VK_FORMAT_BC3_SRGB_BLOCK:
        case VK_FORMAT_BC7_SRGB_BLOCK:
            return true;
        default:
            return false;
    }
}

VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    auto it = std::find_if(formats.begin(), formats.end(),
                           [](const VkSurfaceFormatKHR& f) { return isSrgbFormat(f.format); });
    if (it != formats.end()) return *it;
    if (!formats.empty()) return formats[0];
    return VkSurfaceFormatKHR{VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR};
}

VkCompositeAlphaFlagBitsKHR chooseCompositeAlpha(VkCompositeAlphaFlagsKHR supported) {
    for (uint32_t bit = 1; bit != 0 && bit <= supported; bit <<= 1) {
        if (supported & bit) return static_cast<VkCompositeAlphaFlagBitsKHR>(bit);
    }
    return VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
}

uint32_t chooseImageCount(const VkSurfaceCapabilitiesKHR& caps, uint32_t frameLatency) {
    uint32_t imageCount = std::max(frameLatency + 1, caps.minImageCount);
    if (caps.maxImageCount && imageCount > caps.maxImageCount) imageCount = caps.maxImageCount;
    return imageCount;
}

VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& caps, const SwapchainConfig& config) {
    VkExtent2D extent{config.width, config.height};
    extent.width = std::clamp(extent.width, std::max(1u, caps.minImageExtent.width),
                              std::max(1u, caps.maxImageExtent.width));
    extent.height = std::clamp(extent.height, std::max(1u, caps.minImageExtent.height),
                               std::max(1u, caps.maxImageExtent.height));
    return extent;
}

SwapchainConfig makeSwapchainConfig(const std::vector<VkSurfaceFormatKHR>& formats,
                                    const VkSurfaceCapabilitiesKHR& caps,
                                    PhysicalSize windowSize) {
    SwapchainConfig config;
    config.usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    config.format = chooseSurfaceFormat(formats);
    config.width = std::max(1u, windowSize.width);
    config.height = std::max(1u, windowSize.height);
    config.presentMode = VK_PRESENT_MODE_FIFO_KHR;
    config.alphaMode = chooseCompositeAlpha(caps.supportedCompositeAlpha);
    config.desiredMaximumFrameLatency = 1;
    return config;
}

}
