#include "GpuSurface.hpp"
#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <cstdio>
#include <cstring>
#include <optional>
#include <vector>

namespace kreeda {

static const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

static bool hasInstanceLayer(const char* name) {
    uint32_t count = 0; vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());
    for (const auto& layer : layers) {
        if (std::strcmp(layer.layerName, name) == 0) return true;
    }
    return false;
}

bool GpuSurface::createInstance(bool enableValidation) {
    VkApplicationInfo app{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
    app.pApplicationName = "Kreeda";
    app.pEngineName = "Kreeda Engine";
    app.apiVersion = VK_API_VERSION_1_2;

    uint32_t extCount = 0;
    const char** ext = glfwGetRequiredInstanceExtensions(&extCount);
    if (!ext) {
        fprintf(stderr, "GLFW reports no Vulkan surface support on this system\n");
        return false;
    }
    std::vector<const char*> extensions(ext, ext + extCount);
#if defined(__APPLE__)
    // Required for MoltenVK portability on macOS
    extensions.push_back("VK_KHR_portability_enumeration");
#endif

    std::vector<const char*> layers;
    if (enableValidation) {
        if (hasInstanceLayer(kValidationLayer)) {
            layers.push_back(kValidationLayer);
        } else {
            printf("Warning: %s requested but not installed\n", kValidationLayer);
        }
    }

    VkInstanceCreateInfo ci{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
    ci.pApplicationInfo = &app;
    ci.enabledExtensionCount = (uint32_t)extensions.size();
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount = (uint32_t)layers.size();
    ci.ppEnabledLayerNames = layers.data();
#if defined(__APPLE__)
    ci.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif
    return vkCreateInstance(&ci, nullptr, &instance_) == VK_SUCCESS;
}

bool GpuSurface::createSurface() {
    return glfwCreateWindowSurface(instance_, window_.get(), nullptr, &surface_) == VK_SUCCESS;
}

static bool supportsSwapchain(VkPhysicalDevice device) {
    uint32_t count = 0; vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> exts(count);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &count, exts.data());
    for (const auto& e : exts) {
        if (std::strcmp(e.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0) return true;
    }
    return false;
}

static std::optional<uint32_t> findPresentQueueFamily(VkPhysicalDevice device, VkSurfaceKHR surface) {
    uint32_t qfCount = 0; vkGetPhysicalDeviceQueueFamilyProperties(device, &qfCount, nullptr);
    std::vector<VkQueueFamilyProperties> qf(qfCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &qfCount, qf.data());
    for (uint32_t i = 0; i < qfCount; ++i) {
        VkBool32 presentSupport = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &presentSupport);
        if ((qf[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) && presentSupport) return i;
    }
    return std::nullopt;
}

// Higher is preferred when asking for a high-performance adapter
static int deviceTypeRank(VkPhysicalDeviceType type) {
    switch (type) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return 4;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return 3;
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return 2;
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return 1;
        default: return 0;
    }
}

bool GpuSurface::pickPhysicalDevice() {
    uint32_t count = 0; vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (!count) return false;
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance_, &count, devices.data());

    int bestRank = -1;
    for (VkPhysicalDevice device : devices) {
        if (!supportsSwapchain(device)) continue;
        auto family = findPresentQueueFamily(device, surface_);
        if (!family) continue;

        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(device, &props);
        int rank = deviceTypeRank(props.deviceType);
        if (rank > bestRank) {
            bestRank = rank;
            physicalDevice_ = device;
            queueFamily_ = *family;
        }
    }
    if (physicalDevice_ == VK_NULL_HANDLE) return false;

    if (logSurfaceInfo_) {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(physicalDevice_, &props);
        printf("Adapter: %s (queue family %u)\n", props.deviceName, queueFamily_);
    }
    return true;
}

bool GpuSurface::createDevice() {
    float priority = 1.0f;
    VkDeviceQueueCreateInfo q{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
    q.queueFamilyIndex = queueFamily_;
    q.queueCount = 1;
    q.pQueuePriorities = &priority;
    std::vector<const char*> exts = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };
#if defined(__APPLE__)
    exts.push_back("VK_KHR_portability_subset");
#endif
    // No optional features requested
    VkPhysicalDeviceFeatures features{};
    VkDeviceCreateInfo ci{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
    ci.queueCreateInfoCount = 1; ci.pQueueCreateInfos = &q;
    ci.enabledExtensionCount = (uint32_t)exts.size(); ci.ppEnabledExtensionNames = exts.data();
    ci.pEnabledFeatures = &features;
    if (vkCreateDevice(physicalDevice_, &ci, nullptr, &device_) != VK_SUCCESS) return false;
    vkGetDeviceQueue(device_, queueFamily_, 0, &queue_);
    return true;
}

}
