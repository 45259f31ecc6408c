#pragma once

#include "EngineConfig.hpp"
#include "PresentSurface.hpp"
#include "ScenePass.hpp"
#include "SurfaceError.hpp"
#include "SwapchainConfig.hpp"
#include "WindowEvent.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <memory>
#include <vector>
#include <glm/glm.hpp>

struct GLFWwindow;

namespace kreeda {

// Owns the Vulkan instance, adapter, device/queue and the swapchain presented
// to one window. Every frame is acquire -> clear pass -> submit -> present.
//
// The window is shared with the application handler; this object keeps it
// alive until the surface built on it has been destroyed.
class GpuSurface : public PresentSurface {
public:
    GpuSurface() = default;
    ~GpuSurface() override;

    GpuSurface(const GpuSurface&) = delete;
    GpuSurface& operator=(const GpuSurface&) = delete;

    // Builds everything in order. On failure the failing step is logged, the
    // partially built state is released and false is returned.
    bool initialize(std::shared_ptr<GLFWwindow> window, const EngineConfig& config);
    void shutdown();

    void resize(PhysicalSize newSize) override;
    // Re-applies the current config, recreating the VkSurfaceKHR if it was lost.
    void reconfigure();
    SurfaceError render() override;

    void setScenePass(std::shared_ptr<ScenePass> pass) override { scenePass_ = std::move(pass); }

    GLFWwindow* window() const override { return window_.get(); }
    PhysicalSize innerSize() const override;

private:
    bool createInstance(bool enableValidation);
    bool createSurface();
    bool pickPhysicalDevice();
    bool createDevice();
    bool createSwapchainConfig();
    bool createRenderPass();
    bool createCommandPoolAndBuffers();
    bool createSyncObjects();

    bool configureSurface();
    bool recreateSurface();
    bool createSwapchain(VkSwapchainKHR oldSwapchain);
    bool createImageViews();
    bool createFramebuffers();
    bool createPresentSemaphores();
    void cleanupSwapchain();

    VkResult recordCommandBuffer(VkCommandBuffer cmd, uint32_t imageIndex, const FrameContext& frame);

private:
    std::shared_ptr<GLFWwindow> window_;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue queue_ = VK_NULL_HANDLE;  // graphics + present
    uint32_t queueFamily_ = 0;

    SwapchainConfig config_;
    glm::vec4 clearColor_{1.0f, 1.0f, 1.0f, 1.0f};
    uint64_t acquireTimeoutNs_ = 1'000'000'000ull;
    bool logSurfaceInfo_ = true;
    bool surfaceLost_ = false;

    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    VkExtent2D swapchainExtent_{0, 0};
    std::vector<VkImage> swapchainImages_;
    std::vector<VkImageView> swapchainImageViews_;
    std::vector<VkFramebuffer> framebuffers_;
    std::vector<VkSemaphore> renderFinishedSemaphores_;  // one per swapchain image

    VkRenderPass renderPass_ = VK_NULL_HANDLE;
    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer_ = VK_NULL_HANDLE;
    VkSemaphore imageAvailableSemaphore_ = VK_NULL_HANDLE;
    VkFence inFlightFence_ = VK_NULL_HANDLE;

    std::shared_ptr<ScenePass> scenePass_;
    uint64_t frameIndex_ = 0;
};

}
