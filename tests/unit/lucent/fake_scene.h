#pragma once

/**
 * @file fake_scene.h
 * @brief GPU-free scenes and a manual clock for driving SceneManager in tests
 */

#include <lucent/palette.h>
#include <lucent/scene.h>
#include <lucent/scene_manager.h>
#include <lucent/scene_registry.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lucent::testing {

/// Everything a fake scene saw, kept alive after the scene is destroyed
struct SceneLog {
    SceneKind kind = SceneKind::Particles;
    int inits = 0;
    int updates = 0;
    int renders = 0;
    int disposes = 0;
    double lastDt = 0.0;
    float lastWeight = -1.0f;
    std::vector<float> weights;
    std::vector<std::pair<int, int>> resizes;
    std::vector<Palette> palettes;
    std::vector<std::pair<int, double>> phrases;
    float intensityAtInit = -1.0f;
    Color dominantAtInit;
};

/// Failure switches for one kind
struct FaultPlan {
    bool throwOnInit = false;
    bool throwOnUpdate = false;
    bool throwOnRender = false;
};

class FakeScene : public Scene {
public:
    FakeScene(SceneKind kind, std::shared_ptr<SceneLog> log, FaultPlan faults, uint32_t caps)
        : Scene(kind), m_log(std::move(log)), m_faults(faults), m_caps(caps) {
        m_log->kind = kind;
    }

    void init(SceneManager& manager) override {
        m_log->inits++;
        m_log->intensityAtInit = manager.effectiveMacro("intensity", 0.7f);
        m_log->dominantAtInit = manager.palette().dominant;
        if (m_faults.throwOnInit) {
            throw std::runtime_error("init exploded");
        }
    }

    void update(double dt, SceneManager& /*manager*/) override {
        m_log->updates++;
        m_log->lastDt = dt;
        if (m_faults.throwOnUpdate) {
            throw std::runtime_error("update exploded");
        }
    }

    void render(const RenderTarget& /*target*/, const Camera& /*camera*/, float weight,
                SceneManager& /*manager*/) override {
        m_log->renders++;
        m_log->lastWeight = weight;
        m_log->weights.push_back(weight);
        if (m_faults.throwOnRender) {
            throw std::runtime_error("render exploded");
        }
    }

    uint32_t capabilities() const override { return m_caps; }

    void resize(int width, int height) override { m_log->resizes.emplace_back(width, height); }
    void setPalette(const Palette& palette) override { m_log->palettes.push_back(palette); }
    void onPhrase(int bar, double tempo) override { m_log->phrases.emplace_back(bar, tempo); }

protected:
    void onDispose() override { m_log->disposes++; }

private:
    std::shared_ptr<SceneLog> m_log;
    FaultPlan m_faults;
    uint32_t m_caps;
};

/**
 * @brief Registry whose factories build FakeScenes and record one log per instance
 */
class FakeSceneFactory {
public:
    static constexpr uint32_t ALL_CAPS =
        SceneCapability::Resize | SceneCapability::Palette | SceneCapability::Phrase;

    SceneRegistry registry() {
        SceneRegistry reg;
        for (SceneKind kind : ALL_SCENE_KINDS) {
            reg.set(kind, [this, kind]() -> std::unique_ptr<Scene> {
                auto log = std::make_shared<SceneLog>();
                m_logs.push_back(log);
                FaultPlan faults = m_faults.count(kind) ? m_faults.at(kind) : FaultPlan{};
                uint32_t caps = m_caps.count(kind) ? m_caps.at(kind) : ALL_CAPS;
                return std::make_unique<FakeScene>(kind, log, faults, caps);
            }, std::string("fake ") + sceneKindName(kind));
        }
        return reg;
    }

    void setFaults(SceneKind kind, FaultPlan faults) { m_faults[kind] = faults; }
    void setCapabilities(SceneKind kind, uint32_t caps) { m_caps[kind] = caps; }

    /// Logs in creation order
    const std::vector<std::shared_ptr<SceneLog>>& logs() const { return m_logs; }

    /// Most recently created scene of @p kind
    std::shared_ptr<SceneLog> last(SceneKind kind) const {
        for (auto it = m_logs.rbegin(); it != m_logs.rend(); ++it) {
            if ((*it)->kind == kind) return *it;
        }
        return nullptr;
    }

    size_t created(SceneKind kind) const {
        size_t n = 0;
        for (const auto& log : m_logs) {
            if (log->kind == kind) n++;
        }
        return n;
    }

private:
    std::vector<std::shared_ptr<SceneLog>> m_logs;
    std::map<SceneKind, FaultPlan> m_faults;
    std::map<SceneKind, uint32_t> m_caps;
};

/// Wall clock that only moves when told to
struct ManualClock {
    double now = 100.0;

    SceneManager::TimeSource source() {
        return [this]() { return now; };
    }

    void advance(double seconds) { now += seconds; }
};

} // namespace lucent::testing
