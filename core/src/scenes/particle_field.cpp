// Lucent Scenes - Particle Field

#include <lucent/scenes/particle_field.h>
#include <lucent/scene_manager.h>
#include <lucent/gpu/gpu_common.h>
#include <lucent/gpu/pipeline_builder.h>
#include <glm/gtc/type_ptr.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <random>
#include <utility>
#include <stdexcept>

namespace lucent::scenes {

namespace {

const char* PARTICLE_SHADER = R"(
struct Uniforms {
    viewProj: mat4x4f,
    colorA: vec4f,
    colorB: vec4f,
    resolution: vec2f,
    time: f32,
    pointSize: f32,
    intensity: f32,
    weight: f32,
    pulse: f32,
    _pad: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) corner: vec2f,
    @location(1) seed: f32,
};

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32,
           @location(0) position: vec3f,
           @location(1) seed: f32) -> VertexOutput {
    var corners = array<vec2f, 6>(
        vec2f(-1.0, -1.0), vec2f(1.0, -1.0), vec2f(1.0, 1.0),
        vec2f(-1.0, -1.0), vec2f(1.0, 1.0), vec2f(-1.0, 1.0)
    );
    let corner = corners[vertexIndex];

    var p = position;
    let t = uniforms.time * 0.2 + seed * 0.01;
    p.x += sin(t + p.y) * 0.2;
    p.y += sin(t * 1.123 + p.z) * 0.2;
    p.z += cos(t * 0.874 + p.x) * 0.2;

    var clip = uniforms.viewProj * vec4f(p, 1.0);
    // Expand to a quad of pointSize pixels
    let size = uniforms.pointSize * (1.0 + uniforms.pulse);
    clip = vec4f(clip.xy + corner * size / uniforms.resolution * clip.w, clip.zw);

    var output: VertexOutput;
    output.position = clip;
    output.corner = corner * 0.5;
    output.seed = seed;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let d = length(input.corner);
    let alpha = smoothstep(0.5, 0.0, d) * uniforms.intensity * uniforms.weight;
    var col = mix(uniforms.colorA.rgb, uniforms.colorB.rgb, fract(input.seed));
    col *= 1.0 + uniforms.pulse;
    return vec4f(col, alpha);
}
)";

} // namespace

ParticleField::ParticleField() : Scene(SceneKind::Particles) {
    m_camera.setPerspective(70.0f, 16.0f / 9.0f, 0.1f, 200.0f);
    m_camera.lookAt(glm::vec3(0.0f, 0.0f, 4.0f), glm::vec3(0.0f, 0.0f, 0.0f));
    m_uniforms.pointSize = POINT_SIZE;
}

size_t ParticleField::particleCount(float millions) {
    if (!std::isfinite(millions) || millions <= 0.0f) {
        return MIN_PARTICLES;
    }
    double requested = std::floor(static_cast<double>(millions) * 1000000.0);
    return std::clamp(static_cast<size_t>(requested), MIN_PARTICLES, MAX_PARTICLES);
}

std::vector<ParticleInstance> ParticleField::generate(size_t count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> pos(-2.0f, 2.0f);
    std::uniform_real_distribution<float> seeds(0.0f, 1000.0f);

    std::vector<ParticleInstance> particles(count);
    for (auto& p : particles) {
        p.position[0] = pos(rng);
        p.position[1] = pos(rng);
        p.position[2] = pos(rng);
        p.seed = seeds(rng);
    }
    return particles;
}

void ParticleField::init(SceneManager& manager) {
    m_uniforms.resolution[0] = static_cast<float>(manager.renderWidth());
    m_uniforms.resolution[1] = static_cast<float>(manager.renderHeight());
    m_uniforms.weight = 1.0f;
    refresh(manager);
    // particleMillions is read once per load
    m_count = particleCount(manager.effectiveMacro("particleMillions", 0.5f));
    createPipeline(manager);
    uploadParticles(manager);
}

void ParticleField::createPipeline(SceneManager& manager) {
    const GpuContext& gpuCtx = manager.gpu();
    if (!gpuCtx.valid()) {
        throw std::runtime_error("Particles needs a GPU device");
    }
    m_queue = gpuCtx.queue;

    gpu::PipelineBuilder builder(gpuCtx.device);
    builder.shader(PARTICLE_SHADER)
           .colorTarget(gpuCtx.format, gpu::BlendMode::Additive)
           .vertexBuffer(sizeof(ParticleInstance), WGPUVertexStepMode_Instance)
           .attribute(0, WGPUVertexFormat_Float32x3, offsetof(ParticleInstance, position))
           .attribute(1, WGPUVertexFormat_Float32, offsetof(ParticleInstance, seed))
           .uniform(0, sizeof(ParticleUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment);

    m_pipeline.reset(builder.build());
    m_bindGroupLayout.reset(builder.bindGroupLayout());
    if (!m_pipeline) {
        throw std::runtime_error("Particles pipeline creation failed");
    }

    m_uniformBuffer.reset(gpu::createUniformBuffer(gpuCtx.device, sizeof(ParticleUniforms), "Particles Uniforms"));
    m_bindGroup.reset(gpu::createUniformBindGroup(gpuCtx.device, m_bindGroupLayout, m_uniformBuffer,
                                                  sizeof(ParticleUniforms), "Particles Bind Group"));
}

void ParticleField::uploadParticles(SceneManager& manager) {
    std::vector<ParticleInstance> particles = generate(m_count);

    gpu::BufferHandle buffer(gpu::createVertexBuffer(manager.gpu().device, manager.gpu().queue,
                                                     particles.data(),
                                                     particles.size() * sizeof(ParticleInstance),
                                                     "Particles Instances"));
    if (!buffer) {
        throw std::runtime_error("Particles instance buffer allocation failed");
    }
    m_instanceBuffer = std::move(buffer);
    std::cout << "[Particles] " << m_count << " points" << std::endl;
}

void ParticleField::update(double dt, SceneManager& manager) {
    m_time += dt;
    if (m_pulse > 0.0f) {
        m_pulse = std::max(0.0f, m_pulse - static_cast<float>(dt / m_pulseSeconds));
    }
    refresh(manager);
}

void ParticleField::refresh(SceneManager& manager) {
    m_uniforms.time = static_cast<float>(m_time);
    m_uniforms.intensity = manager.effectiveMacro("intensity", 0.7f);
    m_uniforms.pulse = m_pulse * 0.5f;
    setPalette(manager.palette());
}

void ParticleField::render(const RenderTarget& target, const Camera& /*camera*/, float weight,
                           SceneManager& /*manager*/) {
    if (!target.valid() || !m_pipeline || !m_instanceBuffer) return;

    std::memcpy(m_uniforms.viewProj, glm::value_ptr(m_camera.viewProjectionMatrix()), sizeof(m_uniforms.viewProj));
    m_uniforms.weight = std::clamp(weight, 0.0f, 1.0f);
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &m_uniforms, sizeof(ParticleUniforms));

    WGPURenderPassEncoder pass = gpu::beginLoadPass(target);
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_instanceBuffer, 0,
                                         m_count * sizeof(ParticleInstance));
    wgpuRenderPassEncoderDraw(pass, 6, static_cast<uint32_t>(m_count), 0, 0);
    gpu::endPass(pass);
}

void ParticleField::resize(int width, int height) {
    m_uniforms.resolution[0] = static_cast<float>(width);
    m_uniforms.resolution[1] = static_cast<float>(height);
    m_camera.setAspectRatio(static_cast<float>(width) / static_cast<float>(height));
}

void ParticleField::setPalette(const Palette& palette) {
    gpu::storeColor(m_uniforms.colorA, palette.at(0));
    gpu::storeColor(m_uniforms.colorB, palette.colors.size() > 1 ? palette.colors[1] : palette.secondary);
}

void ParticleField::onPhrase(int /*bar*/, double tempo) {
    m_pulse = 1.0f;
    m_pulseSeconds = tempo > 0.0 ? 60.0 / tempo : 0.5;
}

void ParticleField::onDispose() {
    m_bindGroup.reset();
    m_instanceBuffer.reset();
    m_uniformBuffer.reset();
    m_bindGroupLayout.reset();
    m_pipeline.reset();
    m_queue = nullptr;
    m_count = 0;
}

} // namespace lucent::scenes
