// Lucent Scenes - Tunnel Raymarch

#include <lucent/scenes/tunnel_raymarch.h>
#include <lucent/palette.h>

namespace lucent::scenes {

void TunnelRaymarch::update(double dt, SceneManager& manager) {
    m_time += dt;
    if (m_pulse > 0.0f) {
        m_pulse = std::max(0.0f, m_pulse - static_cast<float>(dt / m_pulseSeconds));
    }
    refresh(manager);
}

void TunnelRaymarch::refresh(SceneManager& manager) {
    m_uniforms.time = static_cast<float>(m_time);
    m_uniforms.steps = std::clamp(manager.effectiveMacro("raymarchSteps", 512.0f),
                                  1.0f, static_cast<float>(MAX_STEPS));
    m_uniforms.bloom = manager.effectiveMacro("bloom", 0.8f);
    m_uniforms.pulse = m_pulse * manager.effectiveMacro("intensity", 0.7f);
    setPalette(manager.palette());
}

void TunnelRaymarch::setPalette(const Palette& palette) {
    gpu::storeColor(m_uniforms.colorA, palette.dominant);
    gpu::storeColor(m_uniforms.colorB, palette.secondary);
}

void TunnelRaymarch::onPhrase(int /*bar*/, double tempo) {
    m_pulse = 1.0f;
    m_pulseSeconds = tempo > 0.0 ? 60.0 / tempo : 0.5;
}

const char* TunnelRaymarch::fragmentShader() const {
    return R"(
struct Uniforms {
    colorA: vec4f,
    colorB: vec4f,
    resolution: vec2f,
    time: f32,
    steps: f32,
    bloom: f32,
    pulse: f32,
    weight: f32,
    _pad: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

fn map(p: vec3f) -> f32 {
    let wobble = sin(p.z * 2.0 + uniforms.time * 0.5) * 0.2;
    return length(p.xy) - (0.5 + wobble);
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let frag = vec2f(input.position.x, uniforms.resolution.y - input.position.y);
    let uv = (frag / uniforms.resolution) * 2.0 - 1.0;
    let ro = vec3f(0.0, 0.0, uniforms.time * 0.7);
    let rd = normalize(vec3f(uv, 1.5));

    var t = 0.0;
    var glow = 0.0;
    for (var i = 0; i < 1024; i++) {
        if (f32(i) > uniforms.steps) {
            break;
        }
        let d = map(ro + rd * t);
        glow += exp(-abs(d) * 10.0) * 0.01;
        t += 0.05 + d * 0.5;
    }

    var col = mix(uniforms.colorA.rgb, uniforms.colorB.rgb, sin(uniforms.time * 0.5) * 0.5 + 0.5);
    col += glow * (0.5 + uniforms.bloom);
    col *= 1.0 + uniforms.pulse * 0.5;
    return vec4f(col, uniforms.weight);
}
)";
}

} // namespace lucent::scenes
