#include "GpuSurface.hpp"
#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

#include <cstdio>
#include <utility>

namespace kreeda {

GpuSurface::~GpuSurface() { shutdown(); }

bool GpuSurface::initialize(std::shared_ptr<GLFWwindow> window, const EngineConfig& config) {
    window_ = std::move(window);
    clearColor_ = glm::vec4(config.clearColorR, config.clearColorG, config.clearColorB, config.clearColorA);
    acquireTimeoutNs_ = static_cast<uint64_t>(config.acquireTimeoutMs) * 1'000'000ull;
    logSurfaceInfo_ = config.logSurfaceInfo;

    auto fail = [this](const char* step) {
        fprintf(stderr, "GpuSurface: %s\n", step);
        shutdown();
        return false;
    };

    // Construction order matters: each step uses the objects built before it
    if (!createInstance(config.enableValidation)) return fail("failed to create Vulkan instance");
    if (!createSurface()) return fail("failed to create window surface");
    if (!pickPhysicalDevice()) return fail("no suitable GPU adapter found");
    if (!createDevice()) return fail("failed to create logical device");
    if (!createSwapchainConfig()) return fail("surface reports no formats");
    if (!createRenderPass()) return fail("failed to create render pass");
    if (!createCommandPoolAndBuffers()) return fail("failed to create command buffers");
    if (!createSyncObjects()) return fail("failed to create sync objects");
    if (!configureSurface()) return fail("failed to configure swapchain");
    return true;
}

void GpuSurface::shutdown() {
    if (device_ != VK_NULL_HANDLE) {
        // Drain the queue before anything it may still reference goes away
        vkDeviceWaitIdle(device_);
        scenePass_.reset();

        if (inFlightFence_) vkDestroyFence(device_, inFlightFence_, nullptr); inFlightFence_ = VK_NULL_HANDLE;
        if (imageAvailableSemaphore_) vkDestroySemaphore(device_, imageAvailableSemaphore_, nullptr); imageAvailableSemaphore_ = VK_NULL_HANDLE;
        if (commandPool_) vkDestroyCommandPool(device_, commandPool_, nullptr); commandPool_ = VK_NULL_HANDLE;
        commandBuffer_ = VK_NULL_HANDLE;

        cleanupSwapchain();
        if (renderPass_) vkDestroyRenderPass(device_, renderPass_, nullptr); renderPass_ = VK_NULL_HANDLE;

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
        queue_ = VK_NULL_HANDLE;
    }
    scenePass_.reset();
    physicalDevice_ = VK_NULL_HANDLE;

    if (surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
    // The window must outlive the surface built on it
    window_.reset();
}

PhysicalSize GpuSurface::innerSize() const {
    int w = 0, h = 0;
    if (window_) glfwGetFramebufferSize(window_.get(), &w, &h);
    return PhysicalSize{static_cast<uint32_t>(w > 0 ? w : 0), static_cast<uint32_t>(h > 0 ? h : 0)};
}

void GpuSurface::resize(PhysicalSize newSize) {
    if (!config_.resize(newSize)) return;  // minimised
    reconfigure();
}

void GpuSurface::reconfigure() {
    if (device_ == VK_NULL_HANDLE) return;

    if (surfaceLost_) {
        if (!recreateSurface()) {
            fprintf(stderr, "GpuSurface: failed to recreate lost surface\n");
            return;
        }
        surfaceLost_ = false;
    }
    if (!configureSurface()) {
        fprintf(stderr, "GpuSurface: swapchain configuration failed (%ux%u)\n", config_.width, config_.height);
    }
}

SurfaceError GpuSurface::render() {
    if (device_ == VK_NULL_HANDLE) return SurfaceError::Lost;

    // Nothing to present while minimised
    PhysicalSize fb = innerSize();
    if (fb.width == 0 || fb.height == 0) return SurfaceError::None;

    if (swapchain_ == VK_NULL_HANDLE) return surfaceLost_ ? SurfaceError::Lost : SurfaceError::Outdated;

    if (vkWaitForFences(device_, 1, &inFlightFence_, VK_TRUE, UINT64_MAX) != VK_SUCCESS) {
        return SurfaceError::OutOfMemory;
    }

    uint32_t imageIndex = 0;
    VkResult acquireRes = vkAcquireNextImageKHR(device_, swapchain_, acquireTimeoutNs_, imageAvailableSemaphore_, VK_NULL_HANDLE, &imageIndex);
    SurfaceError acquireErr = acquireResultToError(acquireRes);
    if (acquireErr != SurfaceError::None) {
        if (acquireErr == SurfaceError::Lost) surfaceLost_ = true;
        return acquireErr;
    }

    FrameContext frame;
    frame.extent = swapchainExtent_;
    frame.clearColor = clearColor_;
    frame.frameIndex = frameIndex_;
    if (scenePass_) scenePass_->update(frame);

    // Only reset once work is guaranteed to be submitted, otherwise the next wait never returns
    vkResetFences(device_, 1, &inFlightFence_);
    vkResetCommandBuffer(commandBuffer_, 0);
    VkResult recordRes = recordCommandBuffer(commandBuffer_, imageIndex, frame);
    if (recordRes != VK_SUCCESS) return presentResultToError(recordRes);

    VkSemaphore renderFinished = renderFinishedSemaphores_[imageIndex];
    VkPipelineStageFlags waitStages[] = { VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT };
    VkSubmitInfo submitInfo{ VK_STRUCTURE_TYPE_SUBMIT_INFO };
    submitInfo.waitSemaphoreCount = 1;
    submitInfo.pWaitSemaphores = &imageAvailableSemaphore_;
    submitInfo.pWaitDstStageMask = waitStages;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &commandBuffer_;
    submitInfo.signalSemaphoreCount = 1;
    submitInfo.pSignalSemaphores = &renderFinished;
    VkResult submitRes = vkQueueSubmit(queue_, 1, &submitInfo, inFlightFence_);
    if (submitRes != VK_SUCCESS) return presentResultToError(submitRes);

    VkPresentInfoKHR presentInfo{ VK_STRUCTURE_TYPE_PRESENT_INFO_KHR };
    presentInfo.waitSemaphoreCount = 1;
    presentInfo.pWaitSemaphores = &renderFinished;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapchain_;
    presentInfo.pImageIndices = &imageIndex;

    VkResult presentRes = vkQueuePresentKHR(queue_, &presentInfo);
    ++frameIndex_;

    SurfaceError presentErr = presentResultToError(presentRes);
    if (presentErr == SurfaceError::Lost) surfaceLost_ = true;
    return presentErr;
}

VkResult GpuSurface::recordCommandBuffer(VkCommandBuffer cmd, uint32_t imageIndex, const FrameContext& frame) {
    VkCommandBufferBeginInfo bi{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult res = vkBeginCommandBuffer(cmd, &bi);
    if (res != VK_SUCCESS) return res;

    VkClearValue clear{};
    clear.color = { {frame.clearColor.r, frame.clearColor.g, frame.clearColor.b, frame.clearColor.a} };
    VkRenderPassBeginInfo rp{ VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO };
    rp.renderPass = renderPass_;
    rp.framebuffer = framebuffers_[imageIndex];
    rp.renderArea.extent = swapchainExtent_;
    rp.clearValueCount = 1; rp.pClearValues = &clear;
    vkCmdBeginRenderPass(cmd, &rp, VK_SUBPASS_CONTENTS_INLINE);

    if (scenePass_) scenePass_->record(cmd, frame);

    vkCmdEndRenderPass(cmd);
    return vkEndCommandBuffer(cmd);
}

}
