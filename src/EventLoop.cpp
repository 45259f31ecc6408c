#include "EventLoop.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <cstdio>

namespace kreeda {

static void glfwErrorCallback(int code, const char* description) {
    fprintf(stderr, "GLFW error %d: %s\n", code, description);
}

static EventLoop* loopFor(GLFWwindow* window) {
    return static_cast<EventLoop*>(glfwGetWindowUserPointer(window));
}

static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode; (void)mods;
    if (auto input = translateKey(key, action)) {
        loopFor(window)->dispatch(window, *input);
    }
}

static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods) {
    (void)mods;
    loopFor(window)->dispatch(window, MouseButtonInput{translateAction(action), translateMouseButton(button)});
}

static void cursorPosCallback(GLFWwindow* window, double xpos, double ypos) {
    int ww = 0, wh = 0, fw = 0, fh = 0;
    glfwGetWindowSize(window, &ww, &wh);
    glfwGetFramebufferSize(window, &fw, &fh);
    loopFor(window)->dispatch(window, translateCursor(xpos, ypos, ww, wh, fw, fh));
}

static void scrollCallback(GLFWwindow* window, double xoffset, double yoffset) {
    loopFor(window)->dispatch(window, translateScroll(xoffset, yoffset));
}

static void framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    PhysicalSize size{static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)};
    loopFor(window)->dispatch(window, Resized{size});
}

static void contentScaleCallback(GLFWwindow* window, float xscale, float yscale) {
    (void)yscale;
    loopFor(window)->dispatch(window, ScaleFactorChanged{static_cast<double>(xscale)});
}

static void closeCallback(GLFWwindow* window) {
    // The handler decides whether to exit
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    loopFor(window)->dispatch(window, CloseRequested{});
}

std::optional<KeyboardInput> translateKey(int key, int action) {
    if (key == GLFW_KEY_UNKNOWN) return std::nullopt;
    KeyboardInput input;
    input.logicalKey = key;
    input.state = translateAction(action);
    input.repeat = action == GLFW_REPEAT;
    return input;
}

ElementState translateAction(int action) {
    return action == GLFW_RELEASE ? ElementState::Released : ElementState::Pressed;
}

MouseButton translateMouseButton(int button) {
    switch (button) {
        case GLFW_MOUSE_BUTTON_LEFT: return MouseButton::Left;
        case GLFW_MOUSE_BUTTON_RIGHT: return MouseButton::Right;
        case GLFW_MOUSE_BUTTON_MIDDLE: return MouseButton::Middle;
        default: return MouseButton::Other;
    }
}

MouseWheel translateScroll(double xoffset, double yoffset) {
    // GLFW offsets are in lines (one notch of a wheel)
    return MouseWheel{ScrollDelta{ScrollDelta::Kind::Line, xoffset, yoffset}};
}

CursorMoved translateCursor(double x, double y, int windowWidth, int windowHeight, int framebufferWidth, int framebufferHeight) {
    double sx = (windowWidth > 0 && framebufferWidth > 0) ? double(framebufferWidth) / windowWidth : 1.0;
    double sy = (windowHeight > 0 && framebufferHeight > 0) ? double(framebufferHeight) / windowHeight : 1.0;
    return CursorMoved{x * sx, y * sy};
}

EventLoop::~EventLoop() {
    if (initialized_) {
        glfwTerminate();
    }
}

bool EventLoop::initialize() {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        return false;
    }
    initialized_ = true;
    return true;
}

std::shared_ptr<GLFWwindow> EventLoop::createWindow(const WindowAttributes& attributes) {
    if (!initialized_) return nullptr;

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(attributes.width, attributes.height, attributes.title.c_str(), nullptr, nullptr);
    if (!window) {
        return nullptr;
    }

    glfwSetWindowUserPointer(window, this);
    glfwSetKeyCallback(window, keyCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);
    glfwSetCursorPosCallback(window, cursorPosCallback);
    glfwSetScrollCallback(window, scrollCallback);
    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
    glfwSetWindowContentScaleCallback(window, contentScaleCallback);
    glfwSetWindowCloseCallback(window, closeCallback);

    return std::shared_ptr<GLFWwindow>(window, [](GLFWwindow* w) { glfwDestroyWindow(w); });
}

int EventLoop::runApp(ApplicationHandler& app) {
    app_ = &app;
    exitRequested_ = false;
    exitStatus_ = 0;

    app.resumed(*this);
    while (!exiting()) {
        if (controlFlow_ == ControlFlow::Wait) {
            glfwWaitEvents();
        } else {
            glfwPollEvents();
        }
        if (exiting()) break;

        if (redrawWindow_) {
            GLFWwindow* window = redrawWindow_;
            redrawWindow_ = nullptr;
            dispatch(window, RedrawRequested{});
            if (exiting()) break;
        }

        app.aboutToWait(*this);
    }

    app_ = nullptr;
    redrawWindow_ = nullptr;
    return exitStatus_;
}

void EventLoop::exit(int status) {
    if (!exitRequested_) exitStatus_ = status;
    exitRequested_ = true;
}

void EventLoop::requestRedraw(GLFWwindow* window) {
    redrawWindow_ = window;
}

void EventLoop::dispatch(GLFWwindow* window, const WindowEvent& event) {
    if (app_) {
        app_->windowEvent(*this, window, event);
    }
}

}
