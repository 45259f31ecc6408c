#pragma once

#include "WindowEvent.hpp"

#include <memory>
#include <optional>
#include <string>

struct GLFWwindow;

namespace kreeda {

class EventLoop;

// Receives everything the event loop delivers. All calls happen on the thread
// that called EventLoop::runApp().
class ApplicationHandler {
public:
    virtual ~ApplicationHandler() = default;

    // Called once before the first loop turn; windows may be created from here.
    virtual void resumed(EventLoop& loop) = 0;
    virtual void windowEvent(EventLoop& loop, GLFWwindow* windowId, const WindowEvent& event) = 0;
    // Idle hook, called once per loop turn after all pending events.
    virtual void aboutToWait(EventLoop& loop) = 0;
};

struct WindowAttributes {
    std::string title;
    int width = 800;   // logical size
    int height = 600;
};

// How the loop waits for the next turn.
enum class ControlFlow {
    Poll,  // return immediately when no events are pending
    Wait,  // block until at least one event arrives
};

class EventLoop {
public:
    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    bool initialize();

    // The returned handle destroys the window when the last owner lets go.
    // Every handle must be released before the loop is destroyed.
    std::shared_ptr<GLFWwindow> createWindow(const WindowAttributes& attributes);

    // Drives the handler until exit() is called. Returns the exit status.
    int runApp(ApplicationHandler& app);

    // The first status passed wins.
    void exit(int status = 0);
    bool exiting() const { return exitRequested_; }

    void setControlFlow(ControlFlow flow) { controlFlow_ = flow; }
    ControlFlow controlFlow() const { return controlFlow_; }
    // Schedules RedrawRequested for the next loop turn.
    void requestRedraw(GLFWwindow* window);

    void dispatch(GLFWwindow* window, const WindowEvent& event);

private:
    ApplicationHandler* app_ = nullptr;
    GLFWwindow* redrawWindow_ = nullptr;
    ControlFlow controlFlow_ = ControlFlow::Poll;
    bool initialized_ = false;
    bool exitRequested_ = false;
    int exitStatus_ = 0;
};

// GLFW -> WindowEvent translation
std::optional<KeyboardInput> translateKey(int key, int action);
ElementState translateAction(int action);
MouseButton translateMouseButton(int button);
MouseWheel translateScroll(double xoffset, double yoffset);
// Window coordinates to physical pixels given the window and framebuffer sizes.
CursorMoved translateCursor(double x, double y, int windowWidth, int windowHeight, int framebufferWidth, int framebufferHeight);

}
