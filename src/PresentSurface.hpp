#pragma once

#include "SurfaceError.hpp"
#include "WindowEvent.hpp"

#include <memory>

struct GLFWwindow;

namespace kreeda {

class ScenePass;

// What the application handler needs from the surface it presents to.
class PresentSurface {
public:
    virtual ~PresentSurface() = default;

    // Window the surface presents to; events for any other window are ignored.
    virtual GLFWwindow* window() const = 0;
    // Current framebuffer size of the window in physical pixels.
    virtual PhysicalSize innerSize() const = 0;
    // Reconfigures to newSize unless either dimension is 0.
    virtual void resize(PhysicalSize newSize) = 0;
    virtual SurfaceError render() = 0;
    virtual void setScenePass(std::shared_ptr<ScenePass> pass) = 0;
};

}
