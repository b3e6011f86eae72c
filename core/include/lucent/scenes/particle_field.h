#pragma once

/**
 * @file particle_field.h
 * @brief Drifting cloud of instanced point sprites
 *
 * Points are spread uniformly through a 4x4x4 cube and wobble along
 * per-point sinusoidal paths. Each sprite is a screen-aligned quad expanded
 * in the vertex shader and drawn with additive blending.
 */

#include <lucent/camera.h>
#include <lucent/scene.h>
#include <lucent/gpu/gpu_handle.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace lucent::scenes {

// Per-instance vertex data (16 bytes)
struct ParticleInstance {
    float position[3];
    float seed;
};

// Uniform buffer structure (must match shader, 16-byte aligned)
struct ParticleUniforms {
    float viewProj[16];
    float colorA[4];
    float colorB[4];
    float resolution[2];
    float time;
    float pointSize;
    float intensity;
    float weight;
    float pulse;
    float _pad;
};

class ParticleField : public Scene {
public:
    static constexpr size_t MIN_PARTICLES = 10000;
    static constexpr size_t MAX_PARTICLES = 5000000;
    static constexpr float POINT_SIZE = 1.5f;
    static constexpr uint32_t DEFAULT_SEED = 42;

    ParticleField();

    void init(SceneManager& manager) override;
    void update(double dt, SceneManager& manager) override;
    void render(const RenderTarget& target, const Camera& camera, float weight,
                SceneManager& manager) override;

    uint32_t capabilities() const override {
        return SceneCapability::Resize | SceneCapability::Palette | SceneCapability::Phrase;
    }
    void resize(int width, int height) override;
    void setPalette(const Palette& palette) override;
    void onPhrase(int bar, double tempo) override;

    /// @brief max(10000, millions * 1e6), capped at MAX_PARTICLES
    static size_t particleCount(float millions);

    /// @brief Deterministic positions in [-2, 2]^3 and seeds in [0, 1000)
    static std::vector<ParticleInstance> generate(size_t count, uint32_t seed = DEFAULT_SEED);

    /// @brief Instance count latched from particleMillions at init
    size_t count() const { return m_count; }
    float pulse() const { return m_pulse; }
    const Camera& camera() const { return m_camera; }
    const ParticleUniforms& uniforms() const { return m_uniforms; }

protected:
    void onDispose() override;

private:
    void createPipeline(SceneManager& manager);
    void uploadParticles(SceneManager& manager);
    void refresh(SceneManager& manager);

    Camera m_camera;
    ParticleUniforms m_uniforms = {};
    double m_time = 0.0;
    size_t m_count = 0;
    float m_pulse = 0.0f;
    double m_pulseSeconds = 0.5;

    gpu::RenderPipelineHandle m_pipeline;
    gpu::BindGroupLayoutHandle m_bindGroupLayout;
    gpu::BufferHandle m_uniformBuffer;
    gpu::BufferHandle m_instanceBuffer;
    gpu::BindGroupHandle m_bindGroup;
    WGPUQueue m_queue = nullptr;
};

} // namespace lucent::scenes
