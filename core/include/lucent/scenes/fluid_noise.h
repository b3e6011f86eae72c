#pragma once

/**
 * @file fluid_noise.h
 * @brief Full-screen domain-warp accumulation
 *
 * Each pixel walks a point through a sinusoidal warp field for fluidIters
 * steps (hard cap 128) and accumulates its distance from the origin; the
 * total blends between palette colours 0 and 2.
 */

#include <lucent/scenes/fullscreen_scene.h>

namespace lucent::scenes {

// Uniform buffer structure (must match shader, 16-byte aligned)
struct FluidUniforms {
    float colorA[4];
    float colorB[4];
    float resolution[2];
    float time;
    float iterations;
    float weight;
    float _pad[3];
};

class FluidNoise : public FullscreenScene<FluidNoise, FluidUniforms> {
public:
    static constexpr int MAX_ITERATIONS = 128;

    FluidNoise() : FullscreenScene(SceneKind::Fluid) {}

    void update(double dt, SceneManager& manager) override;
    void setPalette(const Palette& palette) override;

    const char* fragmentShader() const override;

    /// @brief Copy macros and palette into the uniforms
    void refresh(SceneManager& manager);
};

} // namespace lucent::scenes
