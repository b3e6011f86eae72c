#pragma once

/**
 * @file scene.h
 * @brief Base class for the five visual scenes
 *
 * A scene owns its GPU pipeline, geometry and uniform buffers. The manager
 * creates it on load, calls update() and render() every frame while it is
 * resident and disposes it exactly once when it is evicted.
 */

#include <lucent/render_target.h>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace lucent {

class SceneManager;
class Camera;
struct Palette;

/**
 * @brief The closed set of scenes
 *
 * Declaration order is the cycle order used by SceneManager::getNextSceneName().
 */
enum class SceneKind {
    Particles,
    Fluid,
    Tunnel,
    Terrain,
    Typography
};

/// @brief All scene kinds in cycle order
inline constexpr std::array<SceneKind, 5> ALL_SCENE_KINDS = {
    SceneKind::Particles,
    SceneKind::Fluid,
    SceneKind::Tunnel,
    SceneKind::Terrain,
    SceneKind::Typography
};

/**
 * @brief Convert SceneKind to its display name
 */
inline const char* sceneKindName(SceneKind kind) {
    switch (kind) {
        case SceneKind::Particles:  return "Particles";
        case SceneKind::Fluid:      return "Fluid";
        case SceneKind::Tunnel:     return "Tunnel";
        case SceneKind::Terrain:    return "Terrain";
        case SceneKind::Typography: return "Typography";
        default:                    return "Unknown";
    }
}

/**
 * @brief Parse a scene name (case-insensitive)
 * @return The kind, or std::nullopt for an unknown name
 */
std::optional<SceneKind> parseSceneKind(const std::string& name);

/// @brief Next kind in cycle order, wrapping Typography back to Particles
SceneKind nextSceneKind(SceneKind kind);

/**
 * @brief Optional hooks a scene implements
 *
 * The manager only calls resize(), setPalette() and onPhrase() on scenes
 * whose capabilities() include the matching bit.
 */
namespace SceneCapability {
    constexpr uint32_t None    = 0;
    constexpr uint32_t Resize  = 1 << 0;
    constexpr uint32_t Palette = 1 << 1;
    constexpr uint32_t Phrase  = 1 << 2;
}

/**
 * @brief Abstract base class for scenes
 *
 * Lifecycle:
 * 1. init() - allocate GPU resources, seed uniforms from macros and palette
 * 2. update() - advance animation time, refresh uniforms; never draws
 * 3. render() - draw into the target with @c weight as opacity
 * 4. dispose() - release every GPU resource
 *
 * The target has already been cleared by the manager; scenes draw with
 * LoadOp_Load so that two scenes can share a frame during a crossfade.
 */
class Scene {
public:
    explicit Scene(SceneKind kind) : m_kind(kind) {}
    virtual ~Scene() = default;

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    SceneKind kind() const { return m_kind; }
    const char* name() const { return sceneKindName(m_kind); }

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Allocate resources
     * @throws std::runtime_error if the scene cannot be created
     */
    virtual void init(SceneManager& manager) = 0;

    /// @brief Advance animation by @p dt seconds (already scaled by speed)
    virtual void update(double dt, SceneManager& manager) = 0;

    /// @brief Draw with opacity @p weight in [0, 1]
    virtual void render(const RenderTarget& target, const Camera& camera, float weight,
                        SceneManager& manager) = 0;

    /**
     * @brief Release all resources
     *
     * Safe to call more than once; only the first call reaches onDispose().
     */
    void dispose() {
        if (m_disposed) return;
        m_disposed = true;
        onDispose();
    }

    bool disposed() const { return m_disposed; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Optional hooks
    /// @{

    /// @brief Bitmask of SceneCapability values
    virtual uint32_t capabilities() const { return SceneCapability::None; }

    bool hasCapability(uint32_t capability) const {
        return (capabilities() & capability) == capability;
    }

    /// @brief Drawing-buffer size in physical pixels
    virtual void resize(int /*width*/, int /*height*/) {}
    virtual void setPalette(const Palette& /*palette*/) {}
    virtual void onPhrase(int /*bar*/, double /*tempo*/) {}

    /// @}

protected:
    virtual void onDispose() = 0;

private:
    SceneKind m_kind;
    bool m_disposed = false;
};

} // namespace lucent
