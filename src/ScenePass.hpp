#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <glm/glm.hpp>

namespace kreeda {

struct FrameContext {
    VkExtent2D extent{0, 0};
    glm::vec4 clearColor{1.0f};  // linear RGBA, may be changed by update()
    uint64_t frameIndex = 0;
};

// Hook for scene rendering. GpuSurface calls update() once per frame before
// recording, then record() inside the clear pass. This is the place to sample
// the edge-triggered input queries (keyJustPressed etc.); they are cleared at
// the idle hook right after the frame is presented.
class ScenePass {
public:
    virtual ~ScenePass() = default;

    virtual void update(FrameContext& frame) = 0;
    virtual void record(VkCommandBuffer cmd, const FrameContext& frame) {
        (void)cmd; (void)frame;
    }
};

}
