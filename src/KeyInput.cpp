#include "KeyInput.hpp"

namespace kreeda {

KeyInput& KeyInput::get() {
    static KeyInput instance;
    return instance;
}

void KeyInput::handleEvent(const WindowEvent& event) {
    const auto* key = std::get_if<KeyboardInput>(&event);
    if (!key) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (key->state == ElementState::Pressed) {
        // Auto-repeat re-enters pressed but must not re-trigger the edge
        if (!keysPressed_.contains(key->logicalKey)) {
            keysJustPressed_.insert(key->logicalKey);
        }
        keysPressed_.insert(key->logicalKey);
    } else {
        keysPressed_.erase(key->logicalKey);
        keysJustReleased_.insert(key->logicalKey);
    }
}

void KeyInput::endFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    keysJustPressed_.clear();
    keysJustReleased_.clear();
}

bool KeyInput::keyDown(Key key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keysPressed_.contains(key);
}

bool KeyInput::keyJustPressed(Key key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keysJustPressed_.contains(key);
}

bool KeyInput::keyJustReleased(Key key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keysJustReleased_.contains(key);
}

KeyInput::Snapshot KeyInput::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{keysPressed_, keysJustPressed_, keysJustReleased_};
}

}
