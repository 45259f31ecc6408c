#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace kreeda {

class ScenePass;

// Process-wide window session: the desired geometry and title, and the entry
// point that runs the event loop to completion.
class WindowSession {
public:
    // Exclusive access to the session for as long as the guard lives.
    class Guard {
    public:
        Guard(std::unique_lock<std::mutex> lock, WindowSession& session)
            : lock_(std::move(lock)), session_(&session) {}

        WindowSession* operator->() const { return session_; }
        WindowSession& operator*() const { return *session_; }

    private:
        std::unique_lock<std::mutex> lock_;
        WindowSession* session_;
    };

    WindowSession(const WindowSession&) = delete;
    WindowSession& operator=(const WindowSession&) = delete;

    static Guard get();

    // Only honoured before run().
    void setSize(uint32_t width, uint32_t height);
    void setTitle(std::string title);
    void setScenePass(std::shared_ptr<ScenePass> pass);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    const std::string& title() const { return title_; }
    bool running() const { return running_; }

    // Creates the event loop and application handler and drives the loop
    // until it exits. Returns the process exit status.
    int run();

private:
    WindowSession() = default;

    uint32_t width_ = 800;
    uint32_t height_ = 600;
    std::string title_ = "Kreeda Engine";
    bool running_ = true;
    bool started_ = false;
    std::shared_ptr<ScenePass> scenePass_;
};

}
