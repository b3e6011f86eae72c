#pragma once

/**
 * @file gpu_handle.h
 * @brief Move-only RAII wrappers for WebGPU handles
 *
 * Scenes own their GPU objects through these handles, so dispose() and
 * destruction both release everything deterministically.
 *
 * @par Example
 * @code
 * class MyScene : public Scene {
 *     gpu::RenderPipelineHandle m_pipeline;
 *     gpu::BufferHandle m_uniforms;
 *
 *     void onDispose() override {
 *         m_pipeline.reset();
 *         m_uniforms.reset();
 *     }
 * };
 * @endcode
 */

#include <webgpu/webgpu.h>

namespace lucent::gpu {

template<typename T>
struct ReleaseTrait;

template<>
struct ReleaseTrait<WGPUTexture> {
    static void release(WGPUTexture h) { if (h) wgpuTextureRelease(h); }
};

template<>
struct ReleaseTrait<WGPUTextureView> {
    static void release(WGPUTextureView h) { if (h) wgpuTextureViewRelease(h); }
};

template<>
struct ReleaseTrait<WGPUBuffer> {
    static void release(WGPUBuffer h) {
        if (h) {
            wgpuBufferDestroy(h);
            wgpuBufferRelease(h);
        }
    }
};

template<>
struct ReleaseTrait<WGPURenderPipeline> {
    static void release(WGPURenderPipeline h) { if (h) wgpuRenderPipelineRelease(h); }
};

template<>
struct ReleaseTrait<WGPUBindGroup> {
    static void release(WGPUBindGroup h) { if (h) wgpuBindGroupRelease(h); }
};

template<>
struct ReleaseTrait<WGPUBindGroupLayout> {
    static void release(WGPUBindGroupLayout h) { if (h) wgpuBindGroupLayoutRelease(h); }
};

template<>
struct ReleaseTrait<WGPUSampler> {
    static void release(WGPUSampler h) { if (h) wgpuSamplerRelease(h); }
};

template<>
struct ReleaseTrait<WGPUShaderModule> {
    static void release(WGPUShaderModule h) { if (h) wgpuShaderModuleRelease(h); }
};

template<>
struct ReleaseTrait<WGPUPipelineLayout> {
    static void release(WGPUPipelineLayout h) { if (h) wgpuPipelineLayoutRelease(h); }
};

/**
 * @brief Unique owner of one WebGPU object
 *
 * Converts implicitly to the raw handle so it can be passed straight to
 * wgpu* calls. reset() releases the held object.
 */
template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle& operator=(GpuHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            other.m_handle = nullptr;
        }
        return *this;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;

    T get() const { return m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    /// @brief Release the current object and optionally adopt another
    void reset(T handle = nullptr) {
        ReleaseTrait<T>::release(m_handle);
        m_handle = handle;
    }

    /// @brief Give up ownership without releasing
    T release() {
        T h = m_handle;
        m_handle = nullptr;
        return h;
    }

private:
    T m_handle = nullptr;
};

using TextureHandle = GpuHandle<WGPUTexture>;
using TextureViewHandle = GpuHandle<WGPUTextureView>;
using BufferHandle = GpuHandle<WGPUBuffer>;
using RenderPipelineHandle = GpuHandle<WGPURenderPipeline>;
using BindGroupHandle = GpuHandle<WGPUBindGroup>;
using BindGroupLayoutHandle = GpuHandle<WGPUBindGroupLayout>;
using SamplerHandle = GpuHandle<WGPUSampler>;
using ShaderModuleHandle = GpuHandle<WGPUShaderModule>;
using PipelineLayoutHandle = GpuHandle<WGPUPipelineLayout>;

} // namespace lucent::gpu
