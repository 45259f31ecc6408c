// tests/test_engine_config.cpp
//
// EngineConfig::loadFromFile: overrides, defaults for missing keys, and
// rejection of bad values.

#include <doctest/doctest.h>

#include "EngineConfig.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

fs::path writeTempConfig(const std::string& name, const std::string& contents)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    fs::path path = base / ("kreeda_" + name + "_" + std::to_string(stamp) + ".json");

    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("Defaults match the stock window")
{
    kreeda::EngineConfig cfg;
    CHECK(cfg.width == 800);
    CHECK(cfg.height == 600);
    CHECK(cfg.title == "Kreeda Engine");
    CHECK(cfg.clearColorR == doctest::Approx(1.0f));
    CHECK(cfg.clearColorA == doctest::Approx(1.0f));
}

TEST_CASE("Values in the file override defaults")
{
    const fs::path path = writeTempConfig("override", R"({
    "width": 1280,
    "height": 720,
    "title": "Test \"Window\"",
    "clear_color": [0.1, 0.2, 0.3, 1.0],
    "acquire_timeout_ms": 250,
    "enable_validation": true,
    "log_surface_info": false
})");

    kreeda::EngineConfig cfg;
    REQUIRE(cfg.loadFromFile(path.string().c_str()));
    CHECK(cfg.width == 1280);
    CHECK(cfg.height == 720);
    CHECK(cfg.title == "Test \"Window\"");
    CHECK(cfg.clearColorR == doctest::Approx(0.1f));
    CHECK(cfg.clearColorG == doctest::Approx(0.2f));
    CHECK(cfg.clearColorB == doctest::Approx(0.3f));
    CHECK(cfg.acquireTimeoutMs == 250);
    CHECK(cfg.enableValidation);
    CHECK_FALSE(cfg.logSurfaceInfo);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("Missing and invalid keys keep their current values")
{
    const fs::path path = writeTempConfig("partial", R"({
    "width": 0,
    "height": -5,
    "clear_color": [0.5, 0.5]
})");

    kreeda::EngineConfig cfg;
    REQUIRE(cfg.loadFromFile(path.string().c_str()));
    CHECK(cfg.width == 800);
    CHECK(cfg.height == 600);
    CHECK(cfg.title == "Kreeda Engine");
    CHECK(cfg.clearColorR == doctest::Approx(1.0f));
    CHECK(cfg.acquireTimeoutMs == 1000);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("Unreadable or empty files are reported")
{
    kreeda::EngineConfig cfg;
    CHECK_FALSE(cfg.loadFromFile("/nonexistent/kreeda/config.json"));

    const fs::path empty = writeTempConfig("empty", "");
    CHECK_FALSE(cfg.loadFromFile(empty.string().c_str()));
    CHECK(cfg.width == 800);

    std::error_code ec;
    fs::remove(empty, ec);
}

TEST_CASE("Integers must be whole and in range")
{
    const fs::path path = writeTempConfig("integers", R"({
    "width": 1-2,
    "height": 99999999999,
    "acquire_timeout_ms": 12.5
})");

    kreeda::EngineConfig cfg;
    REQUIRE(cfg.loadFromFile(path.string().c_str()));
    CHECK(cfg.width == 800);
    CHECK(cfg.height == 600);
    CHECK(cfg.acquireTimeoutMs == 1000);

    std::error_code ec;
    fs::remove(path, ec);
}
