#pragma once

#include "WindowEvent.hpp"

#include <mutex>
#include <unordered_set>

namespace kreeda {

// Keyboard latch.
//
// pressed       - keys currently held (level-triggered)
// justPressed   - keys that went down this frame and were not held before
// justReleased  - keys that went up this frame
//
// Edge sets are collapsed by endFrame(), which the application handler calls
// from the idle hook. Gameplay code should sample the edge queries from inside
// a ScenePass, otherwise it will observe empty sets.
class KeyInput {
public:
    struct Snapshot {
        std::unordered_set<Key> pressed;
        std::unordered_set<Key> justPressed;
        std::unordered_set<Key> justReleased;
    };

    KeyInput() = default;

    KeyInput(const KeyInput&) = delete;
    KeyInput& operator=(const KeyInput&) = delete;

    // Process-wide instance fed by the application handler.
    static KeyInput& get();

    void handleEvent(const WindowEvent& event);
    void endFrame();

    bool keyDown(Key key) const;
    bool keyJustPressed(Key key) const;
    bool keyJustReleased(Key key) const;

    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<Key> keysPressed_;
    std::unordered_set<Key> keysJustPressed_;
    std::unordered_set<Key> keysJustReleased_;
};

}
