#include "App.hpp"
#include "GpuSurface.hpp"
#include "KeyInput.hpp"
#include "MouseInput.hpp"
#include "ScenePass.hpp"

#include <cstdio>
#include <utility>

namespace kreeda {

App::App(uint32_t width, uint32_t height, std::string title, const EngineConfig& config,
         KeyInput& keys, MouseInput& mouse)
    : desiredWidth_(width), desiredHeight_(height), title_(std::move(title)), config_(config),
      keys_(keys), mouse_(mouse) {}

App::~App() {
    // Surface first; it drains the queue and then drops its window reference
    state_.reset();
    window_.reset();
}

void App::setScenePass(std::shared_ptr<ScenePass> pass) {
    scenePass_ = std::move(pass);
    if (state_) state_->setScenePass(scenePass_);
}

void App::attachSurface(std::unique_ptr<PresentSurface> surface) {
    state_ = std::move(surface);
    if (state_) state_->setScenePass(scenePass_);
}

void App::resumed(EventLoop& loop) {
    if (state_) return;

    WindowAttributes attrs;
    attrs.title = title_;
    attrs.width = static_cast<int>(desiredWidth_);
    attrs.height = static_cast<int>(desiredHeight_);
    window_ = loop.createWindow(attrs);
    if (!window_) {
        fprintf(stderr, "Failed to create window\n");
        loop.exit(1);
        return;
    }

    auto state = std::make_unique<GpuSurface>();
    if (!state->initialize(window_, config_)) {
        fprintf(stderr, "Failed to initialize GPU surface\n");
        loop.exit(1);
        return;
    }
    attachSurface(std::move(state));
}

void App::windowEvent(EventLoop& loop, GLFWwindow* windowId, const WindowEvent& event) {
    if (!state_) return;
    if (windowId != state_->window()) return;

    // Latches pick out the events they care about
    mouse_.handleEvent(event);
    keys_.handleEvent(event);

    if (std::holds_alternative<CloseRequested>(event)) {
        loop.exit();
    } else if (const auto* resized = std::get_if<Resized>(&event)) {
        state_->resize(resized->size);
        loop.requestRedraw(windowId);
    } else if (const auto* scale = std::get_if<ScaleFactorChanged>(&event)) {
        if (config_.logSurfaceInfo) printf("Scale factor changed to %.2f\n", scale->scaleFactor);
        state_->resize(state_->innerSize());
        loop.requestRedraw(windowId);
    } else if (std::holds_alternative<RedrawRequested>(event)) {
        handleRenderResult(loop, state_->render());
    }
}

void App::handleRenderResult(EventLoop& loop, SurfaceError error) {
    switch (surfaceErrorAction(error)) {
        case SurfaceErrorAction::Continue:
            break;
        case SurfaceErrorAction::Reconfigure:
            fprintf(stderr, "Surface error (%s), reconfiguring surface.\n", surfaceErrorName(error));
            state_->resize(state_->innerSize());
            break;
        case SurfaceErrorAction::SkipFrame:
            fprintf(stderr, "Surface timeout, skipping this frame.\n");
            break;
        case SurfaceErrorAction::Exit:
            fprintf(stderr, "Surface error (%s), exiting.\n", surfaceErrorName(error));
            loop.exit(1);
            break;
    }
}

void App::aboutToWait(EventLoop& loop) {
    if (state_) {
        // Nothing is presented while minimised, so block until the next event
        PhysicalSize size = state_->innerSize();
        loop.setControlFlow(size.width == 0 || size.height == 0 ? ControlFlow::Wait : ControlFlow::Poll);
        loop.requestRedraw(state_->window());
    }

    // End of frame for input handling
    mouse_.endFrame();
    keys_.endFrame();
}

}
