#pragma once

#include <cstdint>
#include <variant>

namespace kreeda {

// Key identifier. Holds a GLFW key token (GLFW_KEY_*), which names the key by
// its position on a US keyboard and is independent of the active layout:
// GLFW_KEY_Z is the same physical key on QWERTY and AZERTY. Use
// glfwGetKeyName() to show the layout-specific character.
using Key = int;

enum class ElementState {
    Pressed,
    Released,
};

enum class MouseButton {
    Left,
    Right,
    Middle,
    Other,
};

struct PhysicalSize {
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const PhysicalSize&) const = default;
};

struct ScrollDelta {
    enum class Kind { Line, Pixel };
    Kind kind = Kind::Line;
    double x = 0.0;
    double y = 0.0;
};

// ----------------------------------------------------------------------------
// Window events delivered by the event loop to the application handler.
// ----------------------------------------------------------------------------

struct CloseRequested {};

struct Resized {
    PhysicalSize size;
};

struct ScaleFactorChanged {
    double scaleFactor = 1.0;
};

struct RedrawRequested {};

struct KeyboardInput {
    ElementState state = ElementState::Pressed;
    Key logicalKey = 0;
    bool repeat = false;  // OS auto-repeat
};

struct MouseButtonInput {
    ElementState state = ElementState::Pressed;
    MouseButton button = MouseButton::Left;
};

struct CursorMoved {
    double x = 0.0;  // physical pixels
    double y = 0.0;
};

struct MouseWheel {
    ScrollDelta delta;
};

using WindowEvent = std::variant<
    CloseRequested,
    Resized,
    ScaleFactorChanged,
    RedrawRequested,
    KeyboardInput,
    MouseButtonInput,
    CursorMoved,
    MouseWheel>;

}
