#pragma once

#include <string>

namespace kreeda {

// ============================================================================
// ENGINE CONFIGURATION
// ============================================================================
// Startup parameters for the window and the presentation surface. Every field
// has a usable default; a config file only needs the keys it overrides.

struct EngineConfig {
    // ========================================================================
    // WINDOW
    // ========================================================================
    int width = 800;                        // Logical size of the client area
    int height = 600;
    std::string title = "Kreeda Engine";

    // ========================================================================
    // SURFACE
    // ========================================================================
    // Linear RGBA colour the swapchain image is cleared to every frame
    float clearColorR = 1.0f;
    float clearColorG = 1.0f;
    float clearColorB = 1.0f;
    float clearColorA = 1.0f;

    // How long render() waits for a swapchain image before dropping the frame
    int acquireTimeoutMs = 1000;

    // ========================================================================
    // DEBUG
    // ========================================================================
    bool enableValidation = false;          // Request VK_LAYER_KHRONOS_validation
    bool logSurfaceInfo = true;             // Print adapter/format/reconfigure info

    // ========================================================================
    // METHODS
    // ========================================================================
    // Load configuration from a JSON file. Keys that are missing or malformed
    // keep their current values. Returns false if the file can't be read.
    bool loadFromFile(const char* path);
};

// Global config instance (defined in EngineConfig.cpp)
extern EngineConfig g_engineConfig;

} // namespace kreeda
