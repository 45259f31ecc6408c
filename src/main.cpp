#include "EngineConfig.hpp"
#include "KeyInput.hpp"
#include "MouseInput.hpp"
#include "ScenePass.hpp"
#include "WindowSession.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>

namespace {

// Logs key and button transitions as they are latched each frame
class InputEchoPass : public kreeda::ScenePass {
public:
    void update(kreeda::FrameContext& frame) override {
        (void)frame;
        auto keys = kreeda::KeyInput::get().snapshot();
        for (kreeda::Key key : keys.justPressed) {
            printf("Key pressed: %s (%d)\n", keyName(key), key);
        }
        for (kreeda::Key key : keys.justReleased) {
            printf("Key released: %s (%d)\n", keyName(key), key);
        }

        auto& mouse = kreeda::MouseInput::get();
        bool dragging = mouse.isDragging();
        if (dragging != wasDragging_) {
            printf("%s drag at (%.0f, %.0f)\n", dragging ? "Begin" : "End", mouse.x(), mouse.y());
            wasDragging_ = dragging;
        }
    }

private:
    static const char* keyName(kreeda::Key key) {
        const char* name = glfwGetKeyName(key, 0);
        return name ? name : "-";
    }

    bool wasDragging_ = false;
};

}

int main() {
    const char* configPath = KREEDA_CONFIG_FILE;
    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        kreeda::g_engineConfig.loadFromFile(configPath);
    }

    auto session = kreeda::WindowSession::get();
    session->setSize(static_cast<uint32_t>(kreeda::g_engineConfig.width),
                     static_cast<uint32_t>(kreeda::g_engineConfig.height));
    session->setTitle(kreeda::g_engineConfig.title);
    session->setScenePass(std::make_shared<InputEchoPass>());
    return session->run();
}
