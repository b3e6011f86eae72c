#pragma once

/**
 * @file tunnel_raymarch.h
 * @brief Per-pixel raymarch through a breathing tube
 *
 * The camera travels along +Z. Glow accumulates where rays pass close to
 * the tube wall and is boosted by the bloom macro. Phrase boundaries fire a
 * one-beat brightness pulse.
 */

#include <lucent/scenes/fullscreen_scene.h>

namespace lucent::scenes {

// Uniform buffer structure (must match shader, 16-byte aligned)
struct TunnelUniforms {
    float colorA[4];
    float colorB[4];
    float resolution[2];
    float time;
    float steps;
    float bloom;
    float pulse;
    float weight;
    float _pad;
};

class TunnelRaymarch : public FullscreenScene<TunnelRaymarch, TunnelUniforms> {
public:
    static constexpr int MAX_STEPS = 1024;

    TunnelRaymarch() : FullscreenScene(SceneKind::Tunnel) {}

    void update(double dt, SceneManager& manager) override;
    void setPalette(const Palette& palette) override;
    void onPhrase(int bar, double tempo) override;

    uint32_t capabilities() const override {
        return SceneCapability::Resize | SceneCapability::Palette | SceneCapability::Phrase;
    }

    const char* fragmentShader() const override;

    /// @brief Copy macros and palette into the uniforms
    void refresh(SceneManager& manager);

    /// @brief Remaining phrase pulse in [0, 1]
    float pulse() const { return m_pulse; }

private:
    float m_pulse = 0.0f;
    double m_pulseSeconds = 0.5;
};

} // namespace lucent::scenes
