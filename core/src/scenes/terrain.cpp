// Lucent Scenes - Terrain

#include <lucent/scenes/terrain.h>
#include <lucent/scene_manager.h>
#include <lucent/gpu/gpu_common.h>
#include <lucent/gpu/pipeline_builder.h>
#include <glm/gtc/type_ptr.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace lucent::scenes {

namespace {

const char* TERRAIN_SHADER = R"(
struct Uniforms {
    viewProj: mat4x4f,
    colorA: vec4f,
    colorB: vec4f,
    time: f32,
    weight: f32,
    _pad0: f32,
    _pad1: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) height: f32,
};

@vertex
fn vs_main(@location(0) xz: vec2f) -> VertexOutput {
    let h = sin(xz.x * 2.0 + uniforms.time) * 0.2 + cos(xz.y * 2.0 - uniforms.time * 0.8) * 0.2;
    var output: VertexOutput;
    output.position = uniforms.viewProj * vec4f(xz.x, h, xz.y, 1.0);
    output.height = h * 0.5 + 0.5;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let col = mix(uniforms.colorA.rgb, uniforms.colorB.rgb, input.height);
    return vec4f(col, uniforms.weight);
}
)";

} // namespace

Terrain::Terrain() : Scene(SceneKind::Terrain) {
    m_camera.setPerspective(60.0f, 16.0f / 9.0f, 0.1f, 100.0f);
    m_camera.lookAt(cameraPosition(0.0f), glm::vec3(0.0f));
}

std::vector<float> Terrain::gridVertices(int segments, float size) {
    if (segments < 1) {
        throw std::invalid_argument("terrain grid needs at least one segment");
    }
    std::vector<float> vertices;
    vertices.reserve(static_cast<size_t>(segments + 1) * (segments + 1) * 2);

    float half = size * 0.5f;
    float step = size / static_cast<float>(segments);
    for (int row = 0; row <= segments; row++) {
        float z = -half + row * step;
        for (int col = 0; col <= segments; col++) {
            vertices.push_back(-half + col * step);
            vertices.push_back(z);
        }
    }
    return vertices;
}

std::vector<uint32_t> Terrain::gridIndices(int segments) {
    if (segments < 1) {
        throw std::invalid_argument("terrain grid needs at least one segment");
    }
    std::vector<uint32_t> indices;
    indices.reserve(static_cast<size_t>(segments) * segments * 6);

    uint32_t stride = static_cast<uint32_t>(segments + 1);
    for (uint32_t row = 0; row < static_cast<uint32_t>(segments); row++) {
        for (uint32_t col = 0; col < static_cast<uint32_t>(segments); col++) {
            uint32_t a = row * stride + col;
            uint32_t b = a + 1;
            uint32_t c = a + stride;
            uint32_t d = c + 1;
            indices.insert(indices.end(), {a, c, b, b, c, d});
        }
    }
    return indices;
}

float Terrain::heightAt(float x, float z, float t) {
    return std::sin(x * 2.0f + t) * 0.2f + std::cos(z * 2.0f - t * 0.8f) * 0.2f;
}

glm::vec3 Terrain::cameraPosition(float t) {
    return glm::vec3(std::sin(t * 0.2f), 2.0f, 3.0f + std::sin(t * 0.15f) * 0.5f);
}

void Terrain::init(SceneManager& manager) {
    const GpuContext& gpuCtx = manager.gpu();
    if (!gpuCtx.valid()) {
        throw std::runtime_error("Terrain needs a GPU device");
    }
    m_device = gpuCtx.device;
    m_queue = gpuCtx.queue;
    m_uniforms.weight = 1.0f;

    m_camera.setAspectRatio(static_cast<float>(manager.renderWidth()) /
                            static_cast<float>(manager.renderHeight()));
    refresh(manager);
    createPipeline(manager);
    createGeometry(manager);
    createDepthBuffer(manager.renderWidth(), manager.renderHeight());
}

void Terrain::createPipeline(SceneManager& manager) {
    const GpuContext& gpuCtx = manager.gpu();

    gpu::PipelineBuilder builder(gpuCtx.device);
    builder.shader(TERRAIN_SHADER)
           .colorTarget(gpuCtx.format, gpu::BlendMode::Alpha)
           .depth(DEPTH_FORMAT)
           .vertexBuffer(2 * sizeof(float))
           .attribute(0, WGPUVertexFormat_Float32x2, 0)
           .uniform(0, sizeof(TerrainUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment);

    m_pipeline.reset(builder.build());
    m_bindGroupLayout.reset(builder.bindGroupLayout());
    if (!m_pipeline) {
        throw std::runtime_error("Terrain pipeline creation failed");
    }

    m_uniformBuffer.reset(gpu::createUniformBuffer(m_device, sizeof(TerrainUniforms), "Terrain Uniforms"));
    m_bindGroup.reset(gpu::createUniformBindGroup(m_device, m_bindGroupLayout, m_uniformBuffer,
                                                  sizeof(TerrainUniforms), "Terrain Bind Group"));
}

void Terrain::createGeometry(SceneManager& /*manager*/) {
    std::vector<float> vertices = gridVertices(SEGMENTS, SIZE);
    std::vector<uint32_t> indices = gridIndices(SEGMENTS);

    m_vertexBuffer.reset(gpu::createVertexBuffer(m_device, m_queue, vertices.data(),
                                                 vertices.size() * sizeof(float), "Terrain Vertices"));
    m_indexBuffer.reset(gpu::createIndexBuffer(m_device, m_queue, indices.data(),
                                               indices.size() * sizeof(uint32_t), "Terrain Indices"));
    if (!m_vertexBuffer || !m_indexBuffer) {
        throw std::runtime_error("Terrain geometry allocation failed");
    }
    m_indexCount = static_cast<uint32_t>(indices.size());
}

void Terrain::createDepthBuffer(int width, int height) {
    if (!m_device || width <= 0 || height <= 0) return;
    if (width == m_depthWidth && height == m_depthHeight && m_depthView) return;

    m_depthView.reset();
    m_depthTexture.reset(gpu::createDepthTexture(m_device, width, height, DEPTH_FORMAT, "Terrain Depth"));
    if (!m_depthTexture) {
        throw std::runtime_error("Terrain depth buffer allocation failed");
    }
    m_depthView.reset(gpu::createView(m_depthTexture, DEPTH_FORMAT));
    m_depthWidth = width;
    m_depthHeight = height;
}

void Terrain::update(double dt, SceneManager& manager) {
    m_time += dt;
    refresh(manager);
}

void Terrain::refresh(SceneManager& manager) {
    float t = static_cast<float>(m_time);
    m_uniforms.time = t;
    m_camera.lookAt(cameraPosition(t), glm::vec3(0.0f));
    setPalette(manager.palette());
}

void Terrain::render(const RenderTarget& target, const Camera& /*camera*/, float weight,
                     SceneManager& /*manager*/) {
    if (!target.valid() || !m_pipeline || !m_indexBuffer) return;

    // Depth must match the colour attachment
    createDepthBuffer(static_cast<int>(target.width), static_cast<int>(target.height));

    std::memcpy(m_uniforms.viewProj, glm::value_ptr(m_camera.viewProjectionMatrix()), sizeof(m_uniforms.viewProj));
    m_uniforms.weight = std::clamp(weight, 0.0f, 1.0f);
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &m_uniforms, sizeof(TerrainUniforms));

    WGPURenderPassEncoder pass = gpu::beginLoadPass(target, m_depthView);
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_vertexBuffer, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderSetIndexBuffer(pass, m_indexBuffer, WGPUIndexFormat_Uint32, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderDrawIndexed(pass, m_indexCount, 1, 0, 0, 0);
    gpu::endPass(pass);
}

void Terrain::resize(int width, int height) {
    m_camera.setAspectRatio(static_cast<float>(width) / static_cast<float>(height));
    createDepthBuffer(width, height);
}

void Terrain::setPalette(const Palette& palette) {
    gpu::storeColor(m_uniforms.colorA, palette.at(0));
    gpu::storeColor(m_uniforms.colorB, palette.colors.size() > 3 ? palette.colors[3] : palette.secondary);
}

void Terrain::onDispose() {
    m_depthView.reset();
    m_depthTexture.reset();
    m_bindGroup.reset();
    m_indexBuffer.reset();
    m_vertexBuffer.reset();
    m_uniformBuffer.reset();
    m_bindGroupLayout.reset();
    m_pipeline.reset();
    m_depthWidth = 0;
    m_depthHeight = 0;
    m_indexCount = 0;
    m_device = nullptr;
    m_queue = nullptr;
}

} // namespace lucent::scenes
