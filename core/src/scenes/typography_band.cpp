// Lucent Scenes - Typography Band

#include <lucent/scenes/typography_band.h>
#include <lucent/palette.h>
#include <cmath>

namespace lucent::scenes {

void TypographyBand::update(double dt, SceneManager& manager) {
    m_time += dt;
    refresh(manager);
}

void TypographyBand::refresh(SceneManager& manager) {
    float t = static_cast<float>(m_time);
    m_uniforms.time = t;
    m_uniforms.bandWeight = 0.5f + std::sin(t * 2.0f) * 0.2f * manager.effectiveMacro("intensity", 0.7f);
    m_uniforms.stretch = 1.0f + std::sin(t * 1.3f) * 0.3f;

    m_highContrast = manager.accessibility().highContrast;
    gpu::storeColor(m_uniforms.background, Color(0.0f, 0.0f, 0.0f));
    setPalette(manager.palette());
}

void TypographyBand::setPalette(const Palette& palette) {
    gpu::storeColor(m_uniforms.color, m_highContrast ? Color(1.0f, 1.0f, 1.0f) : palette.dominant);
}

const char* TypographyBand::fragmentShader() const {
    return R"(
struct Uniforms {
    color: vec4f,
    background: vec4f,
    resolution: vec2f,
    time: f32,
    bandWeight: f32,
    stretch: f32,
    weight: f32,
    _pad0: f32,
    _pad1: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let frag = vec2f(input.position.x, uniforms.resolution.y - input.position.y);
    let uv = frag / uniforms.resolution;
    let y = 0.5 + 0.2 * sin(uniforms.time * 0.5);
    let w = 0.02 * uniforms.stretch;
    let band = smoothstep(y - w, y, uv.y) - smoothstep(y, y + w, uv.y);
    let col = mix(uniforms.background.rgb, uniforms.color.rgb, band * (0.5 + uniforms.bandWeight));
    return vec4f(col, uniforms.weight);
}
)";
}

} // namespace lucent::scenes
