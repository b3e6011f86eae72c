// Lucent - Scene Manager

#include <lucent/scene_manager.h>
#include <lucent/gpu/gpu_common.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace lucent {

namespace {

// Log the first fault per scene, then every Nth
constexpr uint64_t FAULT_LOG_INTERVAL = 120;

double steadyNow() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

SceneManager::SceneManager(GpuContext gpu, SceneRegistry registry, TimeSource now)
    : m_gpu(gpu)
    , m_registry(std::move(registry))
    , m_now(now ? std::move(now) : TimeSource(steadyNow))
    , m_palette(Palette::defaults()) {
    m_camera.setPerspective(60.0f, 16.0f / 9.0f, 0.01f, 1000.0f);
    m_macros.set("bloom", m_post.bloom);
    applyPixelRatio();
}

SceneManager::~SceneManager() {
    disposeScene(m_secondary);
    disposeScene(m_primary);
}

template<typename Fn>
bool SceneManager::guarded(Scene& scene, const char* operation, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const std::exception& e) {
        uint64_t count = ++m_faultCounts[&scene];
        if (count == 1 || count % FAULT_LOG_INTERVAL == 0) {
            std::cerr << "[SceneManager] " << scene.name() << " " << operation
                      << " failed (" << count << "x): " << e.what() << std::endl;
        }
        return false;
    }
}

// =============================================================================
// Scene lifecycle
// =============================================================================

std::unique_ptr<Scene> SceneManager::createScene(SceneKind kind) {
    std::unique_ptr<Scene> scene = m_registry.create(kind);
    try {
        scene->init(*this);
        if (scene->hasCapability(SceneCapability::Resize) && m_width > 0 && m_height > 0) {
            scene->resize(renderWidth(), renderHeight());
        }
    } catch (const std::exception& e) {
        std::cerr << "[SceneManager] " << scene->name() << " init failed: " << e.what() << std::endl;
        scene->dispose();
        throw;
    }
    std::cout << "[SceneManager] Loaded " << scene->name() << std::endl;
    return scene;
}

void SceneManager::disposeScene(std::unique_ptr<Scene>& scene) {
    if (!scene) return;
    m_faultCounts.erase(scene.get());
    try {
        scene->dispose();
    } catch (const std::exception& e) {
        std::cerr << "[SceneManager] " << scene->name() << " dispose failed: " << e.what() << std::endl;
    }
    scene.reset();
}

void SceneManager::loadScene(SceneKind kind) {
    if (!m_primary) {
        m_primary = createScene(kind);
        return;
    }
    if (!m_secondary) {
        m_secondary = createScene(kind);
        return;
    }
    throw std::logic_error(std::string("cannot load ") + sceneKindName(kind) +
                           ": both scene slots are occupied");
}

bool SceneManager::crossfadeTo(SceneKind kind, double seconds) {
    if (!std::isfinite(seconds)) {
        std::cerr << "[SceneManager] Invalid crossfade duration " << seconds << ", using "
                  << DEFAULT_CROSSFADE_SECONDS << "s" << std::endl;
        seconds = DEFAULT_CROSSFADE_SECONDS;
    }

    if (!m_primary) {
        disposeScene(m_secondary);
        m_primary = createScene(kind);
        return true;
    }

    if (m_transitioning) {
        if (m_pending) {
            std::cout << "[SceneManager] Replacing queued crossfade to "
                      << sceneKindName(m_pending->kind) << std::endl;
        }
        m_pending = PendingCrossfade{kind, seconds};
        std::cout << "[SceneManager] Queued crossfade to " << sceneKindName(kind) << std::endl;
        return false;
    }

    // Reuse a scene staged with loadScene() if it is the one requested
    if (m_secondary && m_secondary->kind() != kind) {
        disposeScene(m_secondary);
    }
    if (!m_secondary) {
        m_secondary = createScene(kind);
    }

    startTransition(seconds);
    return true;
}

std::optional<SceneKind> SceneManager::pendingCrossfade() const {
    if (m_pending) {
        return m_pending->kind;
    }
    return std::nullopt;
}

void SceneManager::startTransition(double seconds) {
    m_transitioning = true;
    m_ratio = 0.0f;
    m_transitionStart = m_now();
    m_transitionSeconds = std::max(seconds, 0.001);
    std::cout << "[SceneManager] Crossfade " << m_primary->name() << " -> "
              << m_secondary->name() << " (" << m_transitionSeconds << "s)" << std::endl;
}

void SceneManager::advanceTransition() {
    if (!m_transitioning) return;

    double elapsed = m_now() - m_transitionStart;
    float ratio = static_cast<float>(std::clamp(elapsed / m_transitionSeconds, 0.0, 1.0));
    m_ratio = std::max(m_ratio, ratio);

    if (m_ratio < 1.0f) return;

    disposeScene(m_primary);
    m_primary = std::move(m_secondary);
    m_transitioning = false;
    m_ratio = 0.0f;

    if (m_pending) {
        PendingCrossfade next = *m_pending;
        m_pending.reset();
        try {
            crossfadeTo(next.kind, next.seconds);
        } catch (const std::exception& e) {
            std::cerr << "[SceneManager] Queued crossfade to " << sceneKindName(next.kind)
                      << " failed: " << e.what() << std::endl;
        }
    }
}

// =============================================================================
// Collaborator input
// =============================================================================

void SceneManager::onPhrase(int bar, double tempo) {
    if (m_primary && m_primary->hasCapability(SceneCapability::Phrase)) {
        guarded(*m_primary, "onPhrase", [&]() { m_primary->onPhrase(bar, tempo); });
    }
}

void SceneManager::setPalette(const Palette& palette) {
    m_palette = palette;
    for (Scene* scene : {m_primary.get(), m_secondary.get()}) {
        if (scene && scene->hasCapability(SceneCapability::Palette)) {
            guarded(*scene, "setPalette", [&]() { scene->setPalette(m_palette); });
        }
    }
}

void SceneManager::setQuality(const QualityPatch& patch) {
    QualityPatch checked = patch;
    if (checked.scale && !(std::isfinite(*checked.scale) && *checked.scale > 0.0f)) {
        std::cerr << "[SceneManager] Ignoring invalid quality scale " << *checked.scale << std::endl;
        checked.scale.reset();
    }
    if (checked.antialias && *checked.antialias < 0) {
        checked.antialias = 0;
    }
    merge(m_quality, checked);
    applyPixelRatio();
}

void SceneManager::setPost(const PostPatch& patch) {
    merge(m_post, patch);
    if (patch.bloom) {
        m_macros.set("bloom", *patch.bloom);
    }
}

void SceneManager::setAccessibility(const AccessibilityPatch& patch) {
    AccessibilityPatch checked = patch;
    if (checked.intensityLimit) {
        if (!std::isfinite(*checked.intensityLimit)) {
            checked.intensityLimit.reset();
        } else {
            checked.intensityLimit = std::clamp(*checked.intensityLimit, 0.0f, 1.0f);
        }
    }
    merge(m_accessibility, checked);
}

bool SceneManager::setMacro(const std::string& key, float value) {
    if (!m_macros.set(key, value)) {
        std::cerr << "[SceneManager] Rejected non-finite value for macro " << key << std::endl;
        return false;
    }
    return true;
}

float SceneManager::getMacro(const std::string& key, float fallback) const {
    return m_macros.get(key, fallback);
}

float SceneManager::effectiveMacro(const std::string& key, float fallback) const {
    float value = m_macros.get(key, fallback);
    if (key == "intensity") {
        value = std::min(value, m_accessibility.intensityLimit);
    } else if (key == "glitch" && m_accessibility.epilepsySafe) {
        value = 0.0f;
    } else if (key == "speed" && m_accessibility.reducedMotion) {
        value = std::min(value, 0.5f);
    }
    return value;
}

// =============================================================================
// Cycling
// =============================================================================

SceneKind SceneManager::nextScene() const {
    if (!m_primary) {
        return ALL_SCENE_KINDS.front();
    }
    return nextSceneKind(m_primary->kind());
}

std::string SceneManager::getNextSceneName() const {
    return sceneKindName(nextScene());
}

// =============================================================================
// Viewport
// =============================================================================

int SceneManager::renderWidth() const {
    return std::max(1, static_cast<int>(std::lround(m_width * m_pixelRatio)));
}

int SceneManager::renderHeight() const {
    return std::max(1, static_cast<int>(std::lround(m_height * m_pixelRatio)));
}

void SceneManager::resize(int width, int height) {
    if (width <= 0 || height <= 0) {
        // Minimised windows report 0x0; keep the last size
        return;
    }
    m_width = width;
    m_height = height;
    m_camera.setAspectRatio(static_cast<float>(width) / static_cast<float>(height));

    for (Scene* scene : {m_primary.get(), m_secondary.get()}) {
        if (scene) forwardResize(*scene);
    }
}

void SceneManager::setDevicePixelRatio(float dpr) {
    if (!std::isfinite(dpr) || dpr <= 0.0f) {
        std::cerr << "[SceneManager] Ignoring invalid device pixel ratio " << dpr << std::endl;
        return;
    }
    m_devicePixelRatio = dpr;
    applyPixelRatio();
}

void SceneManager::applyPixelRatio() {
    float ratio = std::min(m_devicePixelRatio * m_quality.scale, MAX_PIXEL_RATIO);
    if (ratio == m_pixelRatio) return;
    m_pixelRatio = ratio;
    if (m_width > 0 && m_height > 0) {
        for (Scene* scene : {m_primary.get(), m_secondary.get()}) {
            if (scene) forwardResize(*scene);
        }
    }
}

void SceneManager::forwardResize(Scene& scene) {
    if (!scene.hasCapability(SceneCapability::Resize)) return;
    int w = renderWidth();
    int h = renderHeight();
    guarded(scene, "resize", [&]() { scene.resize(w, h); });
}

// =============================================================================
// Frame
// =============================================================================

void SceneManager::update(double dt) {
    advanceTransition();

    double scaled = dt * effectiveMacro("speed", 1.0f);
    for (Scene* scene : {m_primary.get(), m_secondary.get()}) {
        if (scene) {
            guarded(*scene, "update", [&]() { scene->update(scaled, *this); });
        }
    }
}

void SceneManager::render(const RenderTarget& target) {
    if (target.valid()) {
        gpu::clearTarget(target, 0.0, 0.0, 0.0);
    }
    if (!m_primary) return;

    if (m_transitioning && m_secondary && m_ratio > 0.0f) {
        guarded(*m_primary, "render", [&]() { m_primary->render(target, m_camera, 1.0f - m_ratio, *this); });
        guarded(*m_secondary, "render", [&]() { m_secondary->render(target, m_camera, m_ratio, *this); });
    } else {
        guarded(*m_primary, "render", [&]() { m_primary->render(target, m_camera, 1.0f, *this); });
    }
}

// =============================================================================
// State
// =============================================================================

TransitionState SceneManager::state() const {
    if (!m_primary) return TransitionState::Idle;
    if (m_transitioning) return TransitionState::Transitioning;
    return TransitionState::SingleActive;
}

size_t SceneManager::residentCount() const {
    return (m_primary ? 1 : 0) + (m_secondary ? 1 : 0);
}

} // namespace lucent
