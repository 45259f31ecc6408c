// tests/test_key_input.cpp
//
// Keyboard latch: level vs edge state, auto-repeat suppression and the frame
// boundary.

#include <doctest/doctest.h>

#include "KeyInput.hpp"

#include <unordered_set>

using namespace kreeda;

namespace {

constexpr Key kKeyA = 65;  // GLFW_KEY_A
constexpr Key kKeyB = 66;  // GLFW_KEY_B

WindowEvent press(Key key, bool repeat = false)
{
    return KeyboardInput{ElementState::Pressed, key, repeat};
}

WindowEvent release(Key key)
{
    return KeyboardInput{ElementState::Released, key, false};
}

} // namespace

TEST_CASE("Auto-repeat does not re-trigger just-pressed")
{
    KeyInput keys;
    keys.handleEvent(press(kKeyA));
    keys.handleEvent(press(kKeyA, true));
    keys.handleEvent(press(kKeyA, true));

    auto s = keys.snapshot();
    CHECK(s.justPressed == std::unordered_set<Key>{kKeyA});
    CHECK(s.pressed == std::unordered_set<Key>{kKeyA});
    CHECK(s.justReleased.empty());

    keys.endFrame();
    s = keys.snapshot();
    CHECK(s.justPressed.empty());
    CHECK(s.pressed == std::unordered_set<Key>{kKeyA});

    // Still held next frame: repeats must not look like a new press
    keys.handleEvent(press(kKeyA, true));
    CHECK(keys.keyDown(kKeyA));
    CHECK_FALSE(keys.keyJustPressed(kKeyA));
}

TEST_CASE("Press then release within one frame")
{
    KeyInput keys;
    keys.handleEvent(press(kKeyB));
    keys.handleEvent(release(kKeyB));

    CHECK(keys.keyJustPressed(kKeyB));
    CHECK(keys.keyJustReleased(kKeyB));
    CHECK_FALSE(keys.keyDown(kKeyB));

    keys.endFrame();
    auto s = keys.snapshot();
    CHECK(s.pressed.empty());
    CHECK(s.justPressed.empty());
    CHECK(s.justReleased.empty());
}

TEST_CASE("Release lands in just-released and leaves pressed")
{
    KeyInput keys;
    keys.handleEvent(press(kKeyA));
    keys.endFrame();

    keys.handleEvent(release(kKeyA));
    CHECK(keys.keyJustReleased(kKeyA));
    CHECK_FALSE(keys.keyJustPressed(kKeyA));
    CHECK_FALSE(keys.keyDown(kKeyA));
}

TEST_CASE("Edge state holds the frame-boundary invariants across frames")
{
    KeyInput keys;
    keys.handleEvent(press(kKeyA));
    keys.handleEvent(press(kKeyB));
    keys.endFrame();
    keys.handleEvent(release(kKeyA));
    keys.handleEvent(press(kKeyA));

    // Sampled mid-frame: anything just pressed is also held
    auto s = keys.snapshot();
    for (Key k : s.justPressed)
        CHECK(s.pressed.contains(k));

    keys.endFrame();
    s = keys.snapshot();
    CHECK(s.justPressed.empty());
    CHECK(s.justReleased.empty());
    CHECK(s.pressed == std::unordered_set<Key>{kKeyA, kKeyB});
}

TEST_CASE("endFrame is idempotent without intervening events")
{
    KeyInput keys;
    keys.handleEvent(press(kKeyA));
    keys.endFrame();
    auto once = keys.snapshot();
    keys.endFrame();
    auto twice = keys.snapshot();

    CHECK(once.pressed == twice.pressed);
    CHECK(once.justPressed == twice.justPressed);
    CHECK(once.justReleased == twice.justReleased);
}

TEST_CASE("Non-keyboard events are ignored")
{
    KeyInput keys;
    keys.handleEvent(CursorMoved{10.0, 20.0});
    keys.handleEvent(MouseButtonInput{ElementState::Pressed, MouseButton::Left});
    keys.handleEvent(Resized{PhysicalSize{640, 480}});

    auto s = keys.snapshot();
    CHECK(s.pressed.empty());
    CHECK(s.justPressed.empty());
    CHECK(s.justReleased.empty());
}
