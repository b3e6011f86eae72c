#pragma once

/**
 * @file scene_manager.h
 * @brief Two scene slots, the crossfade state machine and shared engine state
 *
 * The manager owns at most two scenes. While a crossfade runs, the primary
 * scene renders at weight (1 - ratio) and the incoming secondary at ratio;
 * when the ratio reaches 1 the primary is disposed and the secondary takes
 * its place. Palette, macros and settings live here and are read by scenes
 * every frame.
 *
 * @par Example
 * @code
 * SceneManager manager(gpu);
 * manager.loadScene(SceneKind::Particles);
 * manager.crossfadeTo(SceneKind::Fluid, 2.0);
 *
 * // per frame
 * manager.update(dt);
 * manager.render(target);
 * @endcode
 */

#include <lucent/camera.h>
#include <lucent/macro_registry.h>
#include <lucent/palette.h>
#include <lucent/render_target.h>
#include <lucent/scene.h>
#include <lucent/scene_registry.h>
#include <lucent/settings.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace lucent {

enum class TransitionState {
    Idle,           ///< No scene loaded
    SingleActive,   ///< Primary only
    Transitioning   ///< Primary fading out, secondary fading in
};

inline const char* transitionStateName(TransitionState state) {
    switch (state) {
        case TransitionState::Idle:          return "Idle";
        case TransitionState::SingleActive:  return "SingleActive";
        case TransitionState::Transitioning: return "Transitioning";
        default:                             return "Unknown";
    }
}

class SceneManager {
public:
    /// Seconds on a monotonic clock
    using TimeSource = std::function<double()>;

    static constexpr float MAX_PIXEL_RATIO = 3.0f;
    static constexpr double DEFAULT_CROSSFADE_SECONDS = 2.0;

    /**
     * @param gpu Device the scenes allocate from (may be empty in tests)
     * @param registry Scene factories
     * @param now Wall-clock source for crossfades; defaults to steady_clock
     */
    explicit SceneManager(GpuContext gpu = {},
                          SceneRegistry registry = SceneRegistry::builtins(),
                          TimeSource now = {});
    ~SceneManager();

    SceneManager(const SceneManager&) = delete;
    SceneManager& operator=(const SceneManager&) = delete;

    const GpuContext& gpu() const { return m_gpu; }

    // -------------------------------------------------------------------------
    /// @name Scene lifecycle
    /// @{

    /**
     * @brief Create and initialise a scene
     *
     * Goes into the primary slot if it is empty, otherwise into the
     * secondary slot without starting a transition.
     *
     * @throws std::logic_error if both slots are occupied
     * @throws std::exception from the scene's init(); the slot stays empty
     */
    void loadScene(SceneKind kind);

    /**
     * @brief Crossfade to @p kind over @p seconds of wall-clock time
     *
     * With no primary the scene is loaded directly. While another crossfade
     * is running the request is queued (one pending slot, last request wins)
     * and started when the running one completes.
     *
     * A non-finite @p seconds is replaced by DEFAULT_CROSSFADE_SECONDS.
     *
     * @return true if the transition started now, false if it was queued
     * @throws std::exception from the scene's init(); the slot stays empty
     */
    bool crossfadeTo(SceneKind kind, double seconds = DEFAULT_CROSSFADE_SECONDS);

    /// @brief Kind of the queued crossfade, if any
    std::optional<SceneKind> pendingCrossfade() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Collaborator input
    /// @{

    /// @brief Forward a phrase boundary to the primary scene only
    void onPhrase(int bar, double tempo);

    /// @brief Store and forward to every resident scene
    void setPalette(const Palette& palette);
    const Palette& palette() const { return m_palette; }

    void setQuality(const QualityPatch& patch);
    void setPost(const PostPatch& patch);
    void setAccessibility(const AccessibilityPatch& patch);

    const QualitySettings& quality() const { return m_quality; }
    const PostSettings& post() const { return m_post; }
    const AccessibilitySettings& accessibility() const { return m_accessibility; }

    /**
     * @brief Write a macro (clamped if declared)
     * @return false if the value was rejected (non-finite)
     */
    bool setMacro(const std::string& key, float value);

    /// @brief Raw stored value, or @p fallback if never written
    float getMacro(const std::string& key, float fallback = 0.0f) const;

    /**
     * @brief Stored value after accessibility limits
     *
     * intensity is capped at intensityLimit, glitch is 0 when epilepsySafe
     * is set and speed is capped at 0.5 under reducedMotion.
     */
    float effectiveMacro(const std::string& key, float fallback = 0.0f) const;

    const MacroRegistry& macros() const { return m_macros; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Cycling
    /// @{

    /// @brief Kind after the primary in cycle order (Particles when idle)
    SceneKind nextScene() const;
    std::string getNextSceneName() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Viewport
    /// @{

    /// @brief Logical window size; scenes receive the drawing-buffer size
    void resize(int width, int height);

    /// @brief Host content scale
    void setDevicePixelRatio(float dpr);

    /// @brief min(devicePixelRatio * quality.scale, 3)
    float pixelRatio() const { return m_pixelRatio; }

    int width() const { return m_width; }
    int height() const { return m_height; }
    int renderWidth() const;
    int renderHeight() const;

    const Camera& camera() const { return m_camera; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Frame
    /// @{

    /// @brief Advance the crossfade, then update resident scenes with dt * speed
    void update(double dt);

    /// @brief Clear the target and draw resident scenes with their blend weights
    void render(const RenderTarget& target);

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    TransitionState state() const;

    /// @brief Crossfade progress in [0, 1]; 0 unless transitioning
    float blendRatio() const { return m_ratio; }

    size_t residentCount() const;

    Scene* primary() const { return m_primary.get(); }
    Scene* secondary() const { return m_secondary.get(); }

    /// @}

private:
    struct PendingCrossfade {
        SceneKind kind;
        double seconds;
    };

    std::unique_ptr<Scene> createScene(SceneKind kind);
    void disposeScene(std::unique_ptr<Scene>& scene);
    void startTransition(double seconds);
    void advanceTransition();
    void applyPixelRatio();
    void forwardResize(Scene& scene);

    // Runs fn, logging and swallowing std::exception for per-frame fault isolation
    template<typename Fn>
    bool guarded(Scene& scene, const char* operation, Fn&& fn);

    GpuContext m_gpu;
    SceneRegistry m_registry;
    TimeSource m_now;

    std::unique_ptr<Scene> m_primary;
    std::unique_ptr<Scene> m_secondary;

    bool m_transitioning = false;
    float m_ratio = 0.0f;
    double m_transitionStart = 0.0;
    double m_transitionSeconds = DEFAULT_CROSSFADE_SECONDS;
    std::optional<PendingCrossfade> m_pending;

    Palette m_palette;
    MacroRegistry m_macros;
    QualitySettings m_quality;
    PostSettings m_post;
    AccessibilitySettings m_accessibility;

    Camera m_camera;
    int m_width = 0;
    int m_height = 0;
    float m_devicePixelRatio = 1.0f;
    float m_pixelRatio = 1.0f;

    std::map<const Scene*, uint64_t> m_faultCounts;
};

} // namespace lucent
