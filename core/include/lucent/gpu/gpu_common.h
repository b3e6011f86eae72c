#pragma once

/**
 * @file gpu_common.h
 * @brief Shared GPU helpers for scenes
 *
 * - Full-screen triangle vertex shader (Fluid, Tunnel, Typography, blit)
 * - WGSL constant block
 * - Uniform buffer / bind group creation
 * - Render pass helpers that respect the manager's clear-once contract
 */

#include <lucent/color.h>
#include <lucent/gpu/gpu_handle.h>
#include <lucent/render_target.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <cstring>

namespace lucent::gpu {

/// @brief Convert a C string to a WebGPU string view
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

/// @brief Write an opaque colour into a vec4f uniform slot
inline void storeColor(float (&dst)[4], const Color& c) {
    dst[0] = c.r;
    dst[1] = c.g;
    dst[2] = c.b;
    dst[3] = 1.0f;
}

/**
 * @brief Full-screen triangle vertex shader
 *
 * No vertex buffer; emits UVs with (0,0) at the bottom-left so shaders
 * can reason in GL-style fragment coordinates.
 */
inline constexpr const char* FULLSCREEN_VERTEX_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    var positions = array<vec2f, 3>(
        vec2f(-1.0, -1.0),
        vec2f(3.0, -1.0),
        vec2f(-1.0, 3.0)
    );
    var output: VertexOutput;
    output.position = vec4f(positions[vertexIndex], 0.0, 1.0);
    output.uv = (positions[vertexIndex] + 1.0) * 0.5;
    return output;
}
)";

namespace wgsl {

inline constexpr const char* CONSTANTS = R"(
const PI: f32 = 3.14159265359;
const TAU: f32 = 6.28318530718;
)";

} // namespace wgsl

/// @brief Create a uniform buffer (Uniform | CopyDst)
WGPUBuffer createUniformBuffer(WGPUDevice device, uint64_t size, const char* label);

/// @brief Create a vertex buffer and upload @p data into it
WGPUBuffer createVertexBuffer(WGPUDevice device, WGPUQueue queue,
                              const void* data, uint64_t size, const char* label);

/// @brief Create an index buffer and upload @p data into it
WGPUBuffer createIndexBuffer(WGPUDevice device, WGPUQueue queue,
                             const void* data, uint64_t size, const char* label);

/// @brief Bind group with a single uniform buffer at binding 0
WGPUBindGroup createUniformBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                                     WGPUBuffer buffer, uint64_t size, const char* label);

/// @brief Create a depth texture matching the target size
WGPUTexture createDepthTexture(WGPUDevice device, int width, int height,
                               WGPUTextureFormat format, const char* label);

/// @brief Default 2D view of a texture
WGPUTextureView createView(WGPUTexture texture, WGPUTextureFormat format);

/**
 * @brief Begin a pass that draws on top of what is already in the target
 * @param depthView Optional depth attachment, cleared to 1.0
 */
WGPURenderPassEncoder beginLoadPass(const RenderTarget& target, WGPUTextureView depthView = nullptr);

/// @brief End and release a pass begun with beginLoadPass()
void endPass(WGPURenderPassEncoder pass);

/// @brief Clear the whole target to an opaque colour
void clearTarget(const RenderTarget& target, double r, double g, double b);

} // namespace lucent::gpu
