#pragma once

/**
 * @file typography_band.h
 * @brief Animated horizontal band whose height and thickness breathe
 */

#include <lucent/scenes/fullscreen_scene.h>

namespace lucent::scenes {

// Uniform buffer structure (must match shader, 16-byte aligned)
struct TypographyUniforms {
    float color[4];
    float background[4];
    float resolution[2];
    float time;
    float bandWeight;   // 0.5 +/- 0.2 * intensity
    float stretch;      // band thickness multiplier
    float weight;
    float _pad[2];
};

class TypographyBand : public FullscreenScene<TypographyBand, TypographyUniforms> {
public:
    TypographyBand() : FullscreenScene(SceneKind::Typography) {}

    void update(double dt, SceneManager& manager) override;
    void setPalette(const Palette& palette) override;

    const char* fragmentShader() const override;

    /// @brief Copy macros, palette and contrast mode into the uniforms
    void refresh(SceneManager& manager);

private:
    bool m_highContrast = false;
};

} // namespace lucent::scenes
