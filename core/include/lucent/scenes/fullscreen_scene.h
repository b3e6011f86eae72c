// Lucent Scenes - Full-screen Scene Template
// CRTP base class for scenes drawn as a single full-screen triangle

#pragma once

#include <lucent/scene.h>
#include <lucent/scene_manager.h>
#include <lucent/gpu/gpu_common.h>
#include <lucent/gpu/gpu_handle.h>
#include <lucent/gpu/pipeline_builder.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace lucent::scenes {

/**
 * @brief CRTP base class for full-screen shader scenes
 *
 * Provides init/render/dispose for scenes that:
 * - Have a single uniform buffer
 * - Draw one full-screen triangle with alpha blending
 * - Fade by writing the blend weight into the uniform's alpha
 *
 * Derived classes must provide:
 * - fragmentShader() - returns the WGSL fragment shader source
 * - refresh(manager) - copies macros and palette into m_uniforms
 *
 * Uniforms must have `float resolution[2]` and `float weight` members.
 *
 * @tparam Derived The derived class type (CRTP)
 * @tparam Uniforms The uniform buffer struct type
 */
template<typename Derived, typename Uniforms>
class FullscreenScene : public Scene {
public:
    using Scene::Scene;

    void init(SceneManager& manager) override;
    void render(const RenderTarget& target, const Camera& camera, float weight,
                SceneManager& manager) override;

    uint32_t capabilities() const override {
        return SceneCapability::Resize | SceneCapability::Palette;
    }

    void resize(int width, int height) override {
        m_uniforms.resolution[0] = static_cast<float>(width);
        m_uniforms.resolution[1] = static_cast<float>(height);
    }

    /// @brief Current CPU-side uniform values
    const Uniforms& uniforms() const { return m_uniforms; }

    /**
     * @brief Return the WGSL fragment shader source
     *
     * The shader should expect:
     * - @group(0) @binding(0) var<uniform> uniforms: YourUniformsType
     * - VertexOutput struct with position and uv fields (from gpu_common)
     */
    virtual const char* fragmentShader() const = 0;

protected:
    void onDispose() override;
    void createPipeline(SceneManager& manager);

    Uniforms m_uniforms = {};
    double m_time = 0.0;

    gpu::RenderPipelineHandle m_pipeline;
    gpu::BindGroupLayoutHandle m_bindGroupLayout;
    gpu::BufferHandle m_uniformBuffer;
    gpu::BindGroupHandle m_bindGroup;
    WGPUQueue m_queue = nullptr;
};

// Out-of-class template definitions (non-inline)

template<typename Derived, typename Uniforms>
void FullscreenScene<Derived, Uniforms>::init(SceneManager& manager) {
    m_uniforms.resolution[0] = static_cast<float>(manager.renderWidth());
    m_uniforms.resolution[1] = static_cast<float>(manager.renderHeight());
    m_uniforms.weight = 1.0f;
    static_cast<Derived*>(this)->refresh(manager);
    createPipeline(manager);
}

template<typename Derived, typename Uniforms>
void FullscreenScene<Derived, Uniforms>::createPipeline(SceneManager& manager) {
    const GpuContext& gpuCtx = manager.gpu();
    if (!gpuCtx.valid()) {
        throw std::runtime_error(std::string(name()) + " needs a GPU device");
    }
    m_queue = gpuCtx.queue;

    // Combine shared vertex shader with fragment shader from derived class
    std::string shaderSource = std::string(gpu::FULLSCREEN_VERTEX_SHADER) +
                               gpu::wgsl::CONSTANTS +
                               static_cast<Derived*>(this)->fragmentShader();

    gpu::PipelineBuilder builder(gpuCtx.device);
    builder.shader(shaderSource)
           .colorTarget(gpuCtx.format, gpu::BlendMode::Alpha)
           .uniform(0, sizeof(Uniforms));

    m_pipeline.reset(builder.build());
    m_bindGroupLayout.reset(builder.bindGroupLayout());
    if (!m_pipeline) {
        throw std::runtime_error(std::string(name()) + " pipeline creation failed");
    }

    m_uniformBuffer.reset(gpu::createUniformBuffer(gpuCtx.device, sizeof(Uniforms), name()));
    m_bindGroup.reset(gpu::createUniformBindGroup(gpuCtx.device, m_bindGroupLayout,
                                                  m_uniformBuffer, sizeof(Uniforms), name()));
}

template<typename Derived, typename Uniforms>
void FullscreenScene<Derived, Uniforms>::render(const RenderTarget& target, const Camera& /*camera*/,
                                                float weight, SceneManager& /*manager*/) {
    if (!target.valid() || !m_pipeline) return;

    m_uniforms.weight = std::clamp(weight, 0.0f, 1.0f);
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &m_uniforms, sizeof(Uniforms));

    WGPURenderPassEncoder pass = gpu::beginLoadPass(target);
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    gpu::endPass(pass);
}

template<typename Derived, typename Uniforms>
void FullscreenScene<Derived, Uniforms>::onDispose() {
    m_bindGroup.reset();
    m_uniformBuffer.reset();
    m_bindGroupLayout.reset();
    m_pipeline.reset();
    m_queue = nullptr;
}

} // namespace lucent::scenes
