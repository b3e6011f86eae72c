// Lucent Scenes - Fluid Noise

#include <lucent/scenes/fluid_noise.h>
#include <lucent/palette.h>

namespace lucent::scenes {

void FluidNoise::update(double dt, SceneManager& manager) {
    m_time += dt;
    refresh(manager);
}

void FluidNoise::refresh(SceneManager& manager) {
    m_uniforms.time = static_cast<float>(m_time);
    m_uniforms.iterations = std::clamp(manager.effectiveMacro("fluidIters", 35.0f),
                                       1.0f, static_cast<float>(MAX_ITERATIONS));
    setPalette(manager.palette());
}

void FluidNoise::setPalette(const Palette& palette) {
    gpu::storeColor(m_uniforms.colorA, palette.at(0));
    gpu::storeColor(m_uniforms.colorB, palette.at(2));
}

const char* FluidNoise::fragmentShader() const {
    return R"(
struct Uniforms {
    colorA: vec4f,
    colorB: vec4f,
    resolution: vec2f,
    time: f32,
    iterations: f32,
    weight: f32,
    _pad0: f32,
    _pad1: f32,
    _pad2: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    // Bottom-left origin, as gl_FragCoord
    let frag = vec2f(input.position.x, uniforms.resolution.y - input.position.y);
    let uv = frag / uniforms.resolution;
    var v = uv * 2.0 - 1.0;
    var a = 0.0;
    let t = uniforms.time * 0.1;

    for (var i = 0; i < 128; i++) {
        if (f32(i) > uniforms.iterations) {
            break;
        }
        v += 0.01 * vec2f(sin(v.y * 3.0 + t), cos(v.x * 3.0 - t));
        a += length(v) * 0.001;
    }

    let col = mix(uniforms.colorA.rgb, uniforms.colorB.rgb, smoothstep(0.0, 1.0, a));
    return vec4f(col, uniforms.weight);
}
)";
}

} // namespace lucent::scenes
