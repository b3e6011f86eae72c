#pragma once

/**
 * @file render_target.h
 * @brief GPU device access and per-frame render target passed to scenes
 */

#include <webgpu/webgpu.h>

namespace lucent {

/**
 * @brief Device, queue and colour format scenes build their pipelines for
 *
 * A default-constructed GpuContext has no device; the manager still runs
 * (tests drive it this way) but GPU-backed scenes refuse to initialise.
 */
struct GpuContext {
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat format = WGPUTextureFormat_RGBA8Unorm;

    bool valid() const { return device != nullptr && queue != nullptr; }
};

/**
 * @brief Colour attachment for one frame
 *
 * Scenes record their passes into @c encoder with LoadOp_Load; the manager
 * clears the view once at the start of the frame.
 */
struct RenderTarget {
    WGPUCommandEncoder encoder = nullptr;
    WGPUTextureView view = nullptr;
    WGPUTextureFormat format = WGPUTextureFormat_RGBA8Unorm;
    int width = 0;
    int height = 0;

    bool valid() const { return encoder != nullptr && view != nullptr; }
};

} // namespace lucent
