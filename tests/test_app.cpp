// tests/test_app.cpp
//
// App routing with a stand-in surface: latch feed, window filtering, close,
// resize and scale changes, the surface error policy and the frame boundary.

#include <doctest/doctest.h>

#include "App.hpp"
#include "KeyInput.hpp"
#include "MouseInput.hpp"
#include "PresentSurface.hpp"
#include "ScenePass.hpp"

#include <deque>
#include <memory>
#include <vector>

using namespace kreeda;

namespace {

constexpr Key kKeyW = 87;  // GLFW_KEY_W

struct FakeWindowStorage {
    int unused = 0;
};

GLFWwindow* fakeWindow(FakeWindowStorage& storage)
{
    return reinterpret_cast<GLFWwindow*>(&storage);
}

// Records what the handler asks of the surface. Lives inside the App, so
// tests keep a raw pointer for inspection.
class RecordingSurface : public PresentSurface {
public:
    explicit RecordingSurface(GLFWwindow* window) : window_(window) {}

    GLFWwindow* window() const override { return window_; }
    PhysicalSize innerSize() const override { return inner; }
    void resize(PhysicalSize newSize) override { resizes.push_back(newSize); }

    SurfaceError render() override
    {
        ++renders;
        if (results.empty()) return SurfaceError::None;
        SurfaceError result = results.front();
        results.pop_front();
        return result;
    }

    void setScenePass(std::shared_ptr<ScenePass> pass) override { scenePass = std::move(pass); }

    PhysicalSize inner{800, 600};
    std::vector<PhysicalSize> resizes;
    std::deque<SurfaceError> results;
    std::shared_ptr<ScenePass> scenePass;
    int renders = 0;

private:
    GLFWwindow* window_;
};

class NullPass : public ScenePass {
public:
    void update(FrameContext&) override {}
};

EngineConfig quietConfig()
{
    EngineConfig config;
    config.logSurfaceInfo = false;
    return config;
}

struct AppFixture {
    AppFixture()
        : app(800, 600, "test", quietConfig(), keys, mouse)
    {
        auto owned = std::make_unique<RecordingSurface>(fakeWindow(window));
        surface = owned.get();
        app.attachSurface(std::move(owned));
    }

    FakeWindowStorage window;
    FakeWindowStorage otherWindow;
    KeyInput keys;
    MouseInput mouse;
    App app;
    RecordingSurface* surface = nullptr;
    EventLoop loop;
};

} // namespace

TEST_CASE_FIXTURE(AppFixture, "Input events feed both latches")
{
    app.windowEvent(loop, fakeWindow(window), KeyboardInput{ElementState::Pressed, kKeyW, false});
    app.windowEvent(loop, fakeWindow(window), MouseButtonInput{ElementState::Pressed, MouseButton::Left});
    app.windowEvent(loop, fakeWindow(window), CursorMoved{10.0, 20.0});

    CHECK(keys.keyJustPressed(kKeyW));
    CHECK(mouse.mouseButtonDown(0));
    CHECK(mouse.isDragging());
    CHECK(mouse.x() == doctest::Approx(10.0));
}

TEST_CASE_FIXTURE(AppFixture, "Events for another window are ignored")
{
    app.windowEvent(loop, fakeWindow(otherWindow), KeyboardInput{ElementState::Pressed, kKeyW, false});
    app.windowEvent(loop, fakeWindow(otherWindow), CloseRequested{});
    app.windowEvent(loop, fakeWindow(otherWindow), RedrawRequested{});

    CHECK_FALSE(keys.keyDown(kKeyW));
    CHECK_FALSE(loop.exiting());
    CHECK(surface->renders == 0);
}

TEST_CASE("Without a surface events are dropped but the frame still ends")
{
    KeyInput keys;
    MouseInput mouse;
    App app(800, 600, "test", quietConfig(), keys, mouse);
    EventLoop loop;

    FakeWindowStorage window;
    app.windowEvent(loop, fakeWindow(window), KeyboardInput{ElementState::Pressed, kKeyW, false});
    CHECK_FALSE(keys.keyDown(kKeyW));

    keys.handleEvent(KeyboardInput{ElementState::Pressed, kKeyW, false});
    mouse.handleEvent(MouseWheel{ScrollDelta{ScrollDelta::Kind::Line, 0.0, 3.0}});
    app.aboutToWait(loop);

    CHECK(keys.keyDown(kKeyW));
    CHECK_FALSE(keys.keyJustPressed(kKeyW));
    CHECK(mouse.scrollY() == doctest::Approx(0.0));
}

TEST_CASE_FIXTURE(AppFixture, "Edge state is visible to the render of its frame only")
{
    app.windowEvent(loop, fakeWindow(window), KeyboardInput{ElementState::Pressed, kKeyW, false});
    app.windowEvent(loop, fakeWindow(window), RedrawRequested{});
    CHECK(surface->renders == 1);
    CHECK(keys.keyJustPressed(kKeyW));

    app.aboutToWait(loop);
    CHECK(keys.keyDown(kKeyW));
    CHECK_FALSE(keys.keyJustPressed(kKeyW));
}

TEST_CASE_FIXTURE(AppFixture, "Close request exits the loop")
{
    app.windowEvent(loop, fakeWindow(window), CloseRequested{});
    CHECK(loop.exiting());
}

TEST_CASE_FIXTURE(AppFixture, "Resize and scale changes reconfigure the surface")
{
    app.windowEvent(loop, fakeWindow(window), Resized{PhysicalSize{1024, 768}});
    REQUIRE(surface->resizes.size() == 1);
    CHECK(surface->resizes[0] == PhysicalSize{1024, 768});

    surface->inner = PhysicalSize{2048, 1536};
    app.windowEvent(loop, fakeWindow(window), ScaleFactorChanged{2.0});
    REQUIRE(surface->resizes.size() == 2);
    CHECK(surface->resizes[1] == PhysicalSize{2048, 1536});
}

TEST_CASE_FIXTURE(AppFixture, "Lost and outdated frames reconfigure at the current size")
{
    surface->results = {SurfaceError::Lost, SurfaceError::Outdated};
    surface->inner = PhysicalSize{640, 480};

    app.windowEvent(loop, fakeWindow(window), RedrawRequested{});
    app.windowEvent(loop, fakeWindow(window), RedrawRequested{});

    REQUIRE(surface->resizes.size() == 2);
    CHECK(surface->resizes[0] == PhysicalSize{640, 480});
    CHECK(surface->resizes[1] == PhysicalSize{640, 480});
    CHECK_FALSE(loop.exiting());
}

TEST_CASE_FIXTURE(AppFixture, "A timed-out frame is skipped")
{
    surface->results = {SurfaceError::Timeout};
    app.windowEvent(loop, fakeWindow(window), RedrawRequested{});

    CHECK(surface->resizes.empty());
    CHECK_FALSE(loop.exiting());
}

TEST_CASE_FIXTURE(AppFixture, "Out of memory exits the loop")
{
    surface->results = {SurfaceError::OutOfMemory};
    app.windowEvent(loop, fakeWindow(window), RedrawRequested{});
    CHECK(loop.exiting());
}

TEST_CASE_FIXTURE(AppFixture, "A minimised window waits for events instead of polling")
{
    surface->inner = PhysicalSize{0, 0};
    app.aboutToWait(loop);
    CHECK(loop.controlFlow() == ControlFlow::Wait);

    surface->inner = PhysicalSize{800, 600};
    app.aboutToWait(loop);
    CHECK(loop.controlFlow() == ControlFlow::Poll);
}

TEST_CASE("The scene pass reaches a surface attached later")
{
    KeyInput keys;
    MouseInput mouse;
    App app(800, 600, "test", quietConfig(), keys, mouse);

    auto pass = std::make_shared<NullPass>();
    app.setScenePass(pass);

    FakeWindowStorage window;
    auto owned = std::make_unique<RecordingSurface>(fakeWindow(window));
    RecordingSurface* surface = owned.get();
    app.attachSurface(std::move(owned));

    CHECK(surface->scenePass == pass);
}
