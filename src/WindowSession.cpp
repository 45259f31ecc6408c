#include "WindowSession.hpp"
#include "App.hpp"
#include "EngineConfig.hpp"
#include "EventLoop.hpp"
#include "KeyInput.hpp"
#include "MouseInput.hpp"
#include "ScenePass.hpp"

#include <cstdio>

namespace kreeda {

WindowSession::Guard WindowSession::get() {
    static std::mutex mutex;
    static WindowSession instance;
    return Guard(std::unique_lock<std::mutex>(mutex), instance);
}

void WindowSession::setSize(uint32_t width, uint32_t height) {
    if (started_) {
        printf("Warning: window size can't change once the session is running\n");
        return;
    }
    width_ = width;
    height_ = height;
}

void WindowSession::setTitle(std::string title) {
    if (started_) {
        printf("Warning: window title can't change once the session is running\n");
        return;
    }
    title_ = std::move(title);
}

void WindowSession::setScenePass(std::shared_ptr<ScenePass> pass) {
    scenePass_ = std::move(pass);
}

int WindowSession::run() {
    if (started_) {
        fprintf(stderr, "WindowSession::run() may only be called once\n");
        return 1;
    }
    started_ = true;

    // Declared first so it is destroyed last: windows must go before glfwTerminate
    EventLoop eventLoop;
    if (!eventLoop.initialize()) {
        fprintf(stderr, "Failed to create event loop\n");
        running_ = false;
        return 1;
    }

    int status = 0;
    {
        App app(width_, height_, title_, g_engineConfig, KeyInput::get(), MouseInput::get());
        app.setScenePass(scenePass_);
        status = eventLoop.runApp(app);
    }

    running_ = false;
    return status;
}

}
