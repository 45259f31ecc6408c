// tests/test_surface_error.cpp
//
// Surface error policy and VkResult mapping.

#include <doctest/doctest.h>

#include "SurfaceError.hpp"

#include <string>

using namespace kreeda;

TEST_CASE("Lost and outdated surfaces are reconfigured")
{
    CHECK(surfaceErrorAction(SurfaceError::Lost) == SurfaceErrorAction::Reconfigure);
    CHECK(surfaceErrorAction(SurfaceError::Outdated) == SurfaceErrorAction::Reconfigure);
}

TEST_CASE("Timeouts drop the frame, out-of-memory exits")
{
    CHECK(surfaceErrorAction(SurfaceError::None) == SurfaceErrorAction::Continue);
    CHECK(surfaceErrorAction(SurfaceError::Timeout) == SurfaceErrorAction::SkipFrame);
    CHECK(surfaceErrorAction(SurfaceError::OutOfMemory) == SurfaceErrorAction::Exit);
}

TEST_CASE("Acquire results")
{
    CHECK(acquireResultToError(VK_SUCCESS) == SurfaceError::None);
    CHECK(acquireResultToError(VK_SUBOPTIMAL_KHR) == SurfaceError::None);
    CHECK(acquireResultToError(VK_TIMEOUT) == SurfaceError::Timeout);
    CHECK(acquireResultToError(VK_NOT_READY) == SurfaceError::Timeout);
    CHECK(acquireResultToError(VK_ERROR_OUT_OF_DATE_KHR) == SurfaceError::Outdated);
    CHECK(acquireResultToError(VK_ERROR_SURFACE_LOST_KHR) == SurfaceError::Lost);
    CHECK(acquireResultToError(VK_ERROR_OUT_OF_DEVICE_MEMORY) == SurfaceError::OutOfMemory);
    CHECK(acquireResultToError(VK_ERROR_DEVICE_LOST) == SurfaceError::OutOfMemory);
}

TEST_CASE("Present results")
{
    CHECK(presentResultToError(VK_SUCCESS) == SurfaceError::None);
    CHECK(presentResultToError(VK_SUBOPTIMAL_KHR) == SurfaceError::Outdated);
    CHECK(presentResultToError(VK_ERROR_OUT_OF_DATE_KHR) == SurfaceError::Outdated);
    CHECK(presentResultToError(VK_ERROR_OUT_OF_HOST_MEMORY) == SurfaceError::OutOfMemory);
}

TEST_CASE("Every error has a printable name")
{
    CHECK(std::string(surfaceErrorName(SurfaceError::Lost)) == "Lost");
    CHECK(std::string(surfaceErrorName(SurfaceError::Timeout)) == "Timeout");
}
