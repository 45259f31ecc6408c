#include "GpuSurface.hpp"
#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <cstdio>
#include <vector>

namespace kreeda {

bool GpuSurface::createSwapchainConfig() {
    VkSurfaceCapabilitiesKHR caps{}; vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice_, surface_, &caps);
    uint32_t fmtCount = 0; vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &fmtCount, nullptr);
    if (!fmtCount) return false;
    std::vector<VkSurfaceFormatKHR> fmts(fmtCount); vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &fmtCount, fmts.data());

    config_ = makeSwapchainConfig(fmts, caps, innerSize());
    if (logSurfaceInfo_) {
        printf("Surface format: %d (colorspace %d)%s, %ux%u\n", (int)config_.format.format, (int)config_.format.colorSpace,
               isSrgbFormat(config_.format.format) ? " sRGB" : "", config_.width, config_.height);
    }
    return true;
}

bool GpuSurface::createRenderPass() {
    VkAttachmentDescription color{};
    color.format = config_.format.format;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference colorRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription sub{};
    sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    sub.colorAttachmentCount = 1;
    sub.pColorAttachments = &colorRef;

    // The layout transition must wait for the acquire semaphore
    VkSubpassDependency dep{};
    dep.srcSubpass = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass = 0;
    dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.srcAccessMask = 0;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo ci{ VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO };
    ci.attachmentCount = 1;
    ci.pAttachments = &color;
    ci.subpassCount = 1; ci.pSubpasses = &sub;
    ci.dependencyCount = 1; ci.pDependencies = &dep;
    return vkCreateRenderPass(device_, &ci, nullptr, &renderPass_) == VK_SUCCESS;
}

bool GpuSurface::createCommandPoolAndBuffers() {
    VkCommandPoolCreateInfo pci{ VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
    pci.queueFamilyIndex = queueFamily_;
    pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    if (vkCreateCommandPool(device_, &pci, nullptr, &commandPool_) != VK_SUCCESS) return false;
    // One frame in flight, so one command buffer
    VkCommandBufferAllocateInfo ai{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
    ai.commandPool = commandPool_; ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY; ai.commandBufferCount = 1;
    return vkAllocateCommandBuffers(device_, &ai, &commandBuffer_) == VK_SUCCESS;
}

bool GpuSurface::createSyncObjects() {
    VkSemaphoreCreateInfo si{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
    VkFenceCreateInfo fi{ VK_STRUCTURE_TYPE_FENCE_CREATE_INFO }; fi.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    return vkCreateSemaphore(device_, &si, nullptr, &imageAvailableSemaphore_) == VK_SUCCESS &&
           vkCreateFence(device_, &fi, nullptr, &inFlightFence_) == VK_SUCCESS;
}

bool GpuSurface::configureSurface() {
    vkDeviceWaitIdle(device_);

    VkSwapchainKHR oldSwapchain = swapchain_;
    swapchain_ = VK_NULL_HANDLE;
    cleanupSwapchain();
    bool created = createSwapchain(oldSwapchain);
    if (oldSwapchain) vkDestroySwapchainKHR(device_, oldSwapchain, nullptr);
    if (!created) return false;

    if (!createImageViews() || !createFramebuffers() || !createPresentSemaphores()) {
        cleanupSwapchain();
        return false;
    }

    if (logSurfaceInfo_) {
        printf("Swapchain configured: %ux%u, %zu images\n", swapchainExtent_.width, swapchainExtent_.height,
               swapchainImages_.size());
    }
    return true;
}

bool GpuSurface::recreateSurface() {
    vkDeviceWaitIdle(device_);
    cleanupSwapchain();
    if (surface_) vkDestroySurfaceKHR(instance_, surface_, nullptr); surface_ = VK_NULL_HANDLE;

    if (!createSurface()) return false;
    VkBool32 presentSupport = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(physicalDevice_, queueFamily_, surface_, &presentSupport);
    return presentSupport == VK_TRUE;
}

bool GpuSurface::createSwapchain(VkSwapchainKHR oldSwapchain) {
    VkSurfaceCapabilitiesKHR caps{}; vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice_, surface_, &caps);
    // A minimised window reports a zero maximum extent; nothing can be built
    if (caps.maxImageExtent.width == 0 || caps.maxImageExtent.height == 0) return false;

    swapchainExtent_ = chooseExtent(caps, config_);
    VkSwapchainCreateInfoKHR ci{ VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR };
    ci.surface = surface_;
    ci.minImageCount = chooseImageCount(caps, config_.desiredMaximumFrameLatency);
    ci.imageFormat = config_.format.format;
    ci.imageColorSpace = config_.format.colorSpace;
    ci.imageExtent = swapchainExtent_;
    ci.imageArrayLayers = 1;
    ci.imageUsage = config_.usage;
    ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ci.preTransform = caps.currentTransform;
    ci.compositeAlpha = config_.alphaMode;
    ci.presentMode = config_.presentMode;
    ci.clipped = VK_TRUE;
    ci.oldSwapchain = oldSwapchain;
    if (vkCreateSwapchainKHR(device_, &ci, nullptr, &swapchain_) != VK_SUCCESS) return false;
    uint32_t count = 0; vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    swapchainImages_.resize(count); vkGetSwapchainImagesKHR(device_, swapchain_, &count, swapchainImages_.data());
    return true;
}

bool GpuSurface::createImageViews() {
    swapchainImageViews_.resize(swapchainImages_.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < swapchainImages_.size(); ++i) {
        VkImageViewCreateInfo ci{ VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
        ci.image = swapchainImages_[i];
        ci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        ci.format = config_.format.format;
        ci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        ci.subresourceRange.levelCount = 1;
        ci.subresourceRange.layerCount = 1;
        if (vkCreateImageView(device_, &ci, nullptr, &swapchainImageViews_[i]) != VK_SUCCESS) return false;
    }
    return true;
}

bool GpuSurface::createFramebuffers() {
    framebuffers_.resize(swapchainImageViews_.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < swapchainImageViews_.size(); ++i) {
        VkFramebufferCreateInfo ci{ VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO };
        ci.renderPass = renderPass_;
        ci.attachmentCount = 1; ci.pAttachments = &swapchainImageViews_[i];
        ci.width = swapchainExtent_.width; ci.height = swapchainExtent_.height; ci.layers = 1;
        if (vkCreateFramebuffer(device_, &ci, nullptr, &framebuffers_[i]) != VK_SUCCESS) return false;
    }
    return true;
}

bool GpuSurface::createPresentSemaphores() {
    renderFinishedSemaphores_.resize(swapchainImages_.size(), VK_NULL_HANDLE);
    VkSemaphoreCreateInfo si{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
    for (auto& semaphore : renderFinishedSemaphores_) {
        if (vkCreateSemaphore(device_, &si, nullptr, &semaphore) != VK_SUCCESS) return false;
    }
    return true;
}

void GpuSurface::cleanupSwapchain() {
    for (auto s : renderFinishedSemaphores_) if (s) vkDestroySemaphore(device_, s, nullptr);
    renderFinishedSemaphores_.clear();
    for (auto fb : framebuffers_) if (fb) vkDestroyFramebuffer(device_, fb, nullptr);
    framebuffers_.clear();
    for (auto iv : swapchainImageViews_) if (iv) vkDestroyImageView(device_, iv, nullptr);
    swapchainImageViews_.clear();
    swapchainImages_.clear();
    if (swapchain_) vkDestroySwapchainKHR(device_, swapchain_, nullptr); swapchain_ = VK_NULL_HANDLE;
}

}
