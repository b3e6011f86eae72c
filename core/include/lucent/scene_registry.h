#pragma once

/**
 * @file scene_registry.h
 * @brief Maps each SceneKind to a factory
 *
 * The manager builds scenes through a registry so tests can swap in
 * GPU-free fakes for any kind.
 */

#include <lucent/scene.h>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace lucent {

using SceneFactory = std::function<std::unique_ptr<Scene>()>;

/**
 * @brief Metadata about a scene kind
 */
struct SceneMeta {
    SceneKind kind;
    std::string description;    ///< Brief description
    SceneFactory factory;
};

class SceneRegistry {
public:
    /// @brief Registry with the five built-in scenes
    static SceneRegistry builtins();

    /// @brief Register or replace the factory for @p kind
    void set(SceneKind kind, SceneFactory factory, const std::string& description = "");

    bool has(SceneKind kind) const;

    /// @brief Find metadata by kind
    const SceneMeta* find(SceneKind kind) const;

    /**
     * @brief Construct an uninitialised scene
     * @throws std::runtime_error if no factory is registered or it returns null
     */
    std::unique_ptr<Scene> create(SceneKind kind) const;

    const std::map<SceneKind, SceneMeta>& scenes() const { return m_scenes; }

private:
    std::map<SceneKind, SceneMeta> m_scenes;
};

} // namespace lucent
