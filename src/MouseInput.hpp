#pragma once

#include "WindowEvent.hpp"

#include <array>
#include <cstddef>
#include <mutex>
#include <glm/glm.hpp>

namespace kreeda {

// Pointer latch. Positions are in physical pixels.
//
// dx/dy are reported as (last - current), i.e. opposite to the direction of
// motion. Scroll deltas and dx/dy are edge state and read zero after
// endFrame() until the next wheel/motion event.
class MouseInput {
public:
    static constexpr size_t kButtonCount = 3;  // left, right, middle

    MouseInput() = default;

    MouseInput(const MouseInput&) = delete;
    MouseInput& operator=(const MouseInput&) = delete;

    static MouseInput& get();

    void handleEvent(const WindowEvent& event);
    void endFrame();

    double x() const;
    double y() const;
    double dx() const;
    double dy() const;
    double scrollX() const;
    double scrollY() const;
    bool isDragging() const;
    bool mouseButtonDown(size_t button) const;

private:
    mutable std::mutex mutex_;
    glm::dvec2 position_{0.0};
    glm::dvec2 lastPosition_{0.0};
    glm::dvec2 scroll_{0.0};
    std::array<bool, kButtonCount> buttonsPressed_{};
    bool dragging_ = false;
};

}
