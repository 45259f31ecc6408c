#pragma once

#include "EngineConfig.hpp"
#include "EventLoop.hpp"
#include "SurfaceError.hpp"

#include <cstdint>
#include <memory>
#include <string>

struct GLFWwindow;

namespace kreeda {

class KeyInput;
class MouseInput;
class PresentSurface;
class ScenePass;

// Application handler: creates the window and GPU surface on resume, routes
// window events to the input latches and the surface, and owns the
// redraw/resize policy. The idle hook marks the frame boundary.
class App : public ApplicationHandler {
public:
    App(uint32_t width, uint32_t height, std::string title, const EngineConfig& config,
        KeyInput& keys, MouseInput& mouse);
    ~App() override;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void resumed(EventLoop& loop) override;
    void windowEvent(EventLoop& loop, GLFWwindow* windowId, const WindowEvent& event) override;
    void aboutToWait(EventLoop& loop) override;

    // Installed on the surface once it exists.
    void setScenePass(std::shared_ptr<ScenePass> pass);

    // Adopts an already built surface. resumed() uses this for the GpuSurface
    // it creates; the window is taken from the surface.
    void attachSurface(std::unique_ptr<PresentSurface> surface);

private:
    void handleRenderResult(EventLoop& loop, SurfaceError error);

    uint32_t desiredWidth_;
    uint32_t desiredHeight_;
    std::string title_;
    EngineConfig config_;
    KeyInput& keys_;
    MouseInput& mouse_;

    std::shared_ptr<GLFWwindow> window_;
    std::unique_ptr<PresentSurface> state_;  // absent until resumed
    std::shared_ptr<ScenePass> scenePass_;
};

}
