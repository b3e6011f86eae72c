// Lucent - Scene Registry

#include <lucent/scene_registry.h>
#include <lucent/scenes/fluid_noise.h>
#include <lucent/scenes/particle_field.h>
#include <lucent/scenes/terrain.h>
#include <lucent/scenes/tunnel_raymarch.h>
#include <lucent/scenes/typography_band.h>
#include <stdexcept>

namespace lucent {

SceneRegistry SceneRegistry::builtins() {
    SceneRegistry registry;
    registry.set(SceneKind::Particles,
                 []() { return std::make_unique<scenes::ParticleField>(); },
                 "Instanced point sprites drifting on a sinusoidal field");
    registry.set(SceneKind::Fluid,
                 []() { return std::make_unique<scenes::FluidNoise>(); },
                 "Full-screen domain-warp accumulation");
    registry.set(SceneKind::Tunnel,
                 []() { return std::make_unique<scenes::TunnelRaymarch>(); },
                 "Raymarched tunnel with proximity glow");
    registry.set(SceneKind::Terrain,
                 []() { return std::make_unique<scenes::Terrain>(); },
                 "Displaced 256x256 grid under an orbiting camera");
    registry.set(SceneKind::Typography,
                 []() { return std::make_unique<scenes::TypographyBand>(); },
                 "Breathing horizontal band");
    return registry;
}

void SceneRegistry::set(SceneKind kind, SceneFactory factory, const std::string& description) {
    m_scenes[kind] = SceneMeta{kind, description, std::move(factory)};
}

bool SceneRegistry::has(SceneKind kind) const {
    auto it = m_scenes.find(kind);
    return it != m_scenes.end() && it->second.factory;
}

const SceneMeta* SceneRegistry::find(SceneKind kind) const {
    auto it = m_scenes.find(kind);
    return it != m_scenes.end() ? &it->second : nullptr;
}

std::unique_ptr<Scene> SceneRegistry::create(SceneKind kind) const {
    const SceneMeta* meta = find(kind);
    if (!meta || !meta->factory) {
        throw std::runtime_error(std::string("no factory registered for scene ") + sceneKindName(kind));
    }
    std::unique_ptr<Scene> scene = meta->factory();
    if (!scene) {
        throw std::runtime_error(std::string("factory for scene ") + sceneKindName(kind) + " returned null");
    }
    return scene;
}

} // namespace lucent
