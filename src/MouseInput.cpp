#include "MouseInput.hpp"

#include <algorithm>
#include <optional>

namespace kreeda {

static std::optional<size_t> buttonIndex(MouseButton button) {
    switch (button) {
        case MouseButton::Left: return 0;
        case MouseButton::Right: return 1;
        case MouseButton::Middle: return 2;
        default: return std::nullopt;
    }
}

MouseInput& MouseInput::get() {
    static MouseInput instance;
    return instance;
}

void MouseInput::handleEvent(const WindowEvent& event) {
    if (const auto* moved = std::get_if<CursorMoved>(&event)) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastPosition_ = position_;
        position_ = glm::dvec2(moved->x, moved->y);
        dragging_ = std::any_of(buttonsPressed_.begin(), buttonsPressed_.end(), [](bool b) { return b; });
    } else if (const auto* input = std::get_if<MouseButtonInput>(&event)) {
        auto index = buttonIndex(input->button);
        if (!index) return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (input->state == ElementState::Pressed) {
            buttonsPressed_[*index] = true;
        } else {
            buttonsPressed_[*index] = false;
            dragging_ = false;
        }
    } else if (const auto* wheel = std::get_if<MouseWheel>(&event)) {
        // Line and pixel deltas are stored as-is; units differ between the two
        std::lock_guard<std::mutex> lock(mutex_);
        scroll_ = glm::dvec2(wheel->delta.x, wheel->delta.y);
    }
}

void MouseInput::endFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    scroll_ = glm::dvec2(0.0);
    lastPosition_ = position_;
}

double MouseInput::x() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_.x;
}

double MouseInput::y() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_.y;
}

double MouseInput::dx() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPosition_.x - position_.x;
}

double MouseInput::dy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPosition_.y - position_.y;
}

double MouseInput::scrollX() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scroll_.x;
}

double MouseInput::scrollY() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scroll_.y;
}

bool MouseInput::isDragging() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dragging_;
}

bool MouseInput::mouseButtonDown(size_t button) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (button >= buttonsPressed_.size()) return false;
    return buttonsPressed_[button];
}

}
