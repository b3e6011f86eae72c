#pragma once

/**
 * @file presenter.h
 * @brief Offscreen canvas at render resolution, scaled onto the window surface
 *
 * Scenes draw into the canvas at the manager's render size (logical size x
 * pixel ratio). Each frame the canvas is blitted to the swapchain texture
 * with a linear sampler.
 */

#include <lucent/render_target.h>
#include <lucent/gpu/gpu_handle.h>
#include <webgpu/webgpu.h>

namespace lucent {

class Presenter {
public:
    static constexpr WGPUTextureFormat CANVAS_FORMAT = WGPUTextureFormat_RGBA8Unorm;

    /// @throws std::runtime_error if the blit pipeline cannot be created
    Presenter(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat);

    Presenter(const Presenter&) = delete;
    Presenter& operator=(const Presenter&) = delete;

    /// @brief Device info the scenes render with (canvas format, not surface format)
    GpuContext context() const;

    /// @brief Recreate the canvas if the render size changed
    void resizeCanvas(int width, int height);

    /// @brief Target for scenes recording into @p encoder
    RenderTarget canvasTarget(WGPUCommandEncoder encoder) const;

    /// @brief Scale the canvas onto @p surfaceView, replacing its contents
    void present(WGPUCommandEncoder encoder, WGPUTextureView surfaceView, int width, int height);

    int canvasWidth() const { return m_width; }
    int canvasHeight() const { return m_height; }

private:
    void createBlitPipeline();

    WGPUDevice m_device;
    WGPUQueue m_queue;
    WGPUTextureFormat m_surfaceFormat;

    gpu::TextureHandle m_canvas;
    gpu::TextureViewHandle m_canvasView;
    int m_width = 0;
    int m_height = 0;

    gpu::RenderPipelineHandle m_blitPipeline;
    gpu::BindGroupLayoutHandle m_blitBindGroupLayout;
    gpu::BindGroupHandle m_blitBindGroup;
    gpu::SamplerHandle m_sampler;
};

} // namespace lucent
