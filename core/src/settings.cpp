// Lucent - Settings

#include <lucent/settings.h>
#include <lucent/scene_manager.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace lucent {

using json = nlohmann::json;

namespace {

template<typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

} // namespace

void merge(QualitySettings& settings, const QualityPatch& patch) {
    if (patch.scale) settings.scale = *patch.scale;
    if (patch.antialias) settings.antialias = *patch.antialias;
}

void merge(PostSettings& settings, const PostPatch& patch) {
    if (patch.bloom) settings.bloom = *patch.bloom;
    if (patch.ssao) settings.ssao = *patch.ssao;
    if (patch.motionBlur) settings.motionBlur = *patch.motionBlur;
}

void merge(AccessibilitySettings& settings, const AccessibilityPatch& patch) {
    if (patch.epilepsySafe) settings.epilepsySafe = *patch.epilepsySafe;
    if (patch.intensityLimit) settings.intensityLimit = *patch.intensityLimit;
    if (patch.reducedMotion) settings.reducedMotion = *patch.reducedMotion;
    if (patch.highContrast) settings.highContrast = *patch.highContrast;
}

QualityPatch qualityPatchFromJson(const json& j) {
    QualityPatch patch;
    readOptional(j, "scale", patch.scale);
    readOptional(j, "antialias", patch.antialias);
    return patch;
}

PostPatch postPatchFromJson(const json& j) {
    PostPatch patch;
    readOptional(j, "bloom", patch.bloom);
    readOptional(j, "ssao", patch.ssao);
    readOptional(j, "motionBlur", patch.motionBlur);
    return patch;
}

AccessibilityPatch accessibilityPatchFromJson(const json& j) {
    AccessibilityPatch patch;
    readOptional(j, "epilepsySafe", patch.epilepsySafe);
    readOptional(j, "intensityLimit", patch.intensityLimit);
    readOptional(j, "reducedMotion", patch.reducedMotion);
    readOptional(j, "highContrast", patch.highContrast);
    return patch;
}

json toJson(const QualitySettings& settings) {
    return {{"scale", settings.scale}, {"antialias", settings.antialias}};
}

json toJson(const PostSettings& settings) {
    return {{"bloom", settings.bloom}, {"ssao", settings.ssao}, {"motionBlur", settings.motionBlur}};
}

json toJson(const AccessibilitySettings& settings) {
    return {
        {"epilepsySafe", settings.epilepsySafe},
        {"intensityLimit", settings.intensityLimit},
        {"reducedMotion", settings.reducedMotion},
        {"highContrast", settings.highContrast}
    };
}

// =============================================================================
// SettingsStore
// =============================================================================

SettingsStore::SettingsStore(const std::string& path)
    : m_path(path) {}

bool SettingsStore::load(SceneManager& manager) const {
    if (!std::filesystem::exists(m_path)) {
        std::cout << "[Settings] No settings file at " << m_path << ", using defaults" << std::endl;
        return false;
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open settings file " + m_path);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("parse error in " + m_path + ": " + e.what());
    }

    try {
        apply(doc, manager);
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid settings in " + m_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("invalid settings in " + m_path + ": " + e.what());
    }

    std::cout << "[Settings] Loaded: " << m_path << std::endl;
    return true;
}

void SettingsStore::save(const SceneManager& manager) const {
    std::ofstream file(m_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot write settings file " + m_path);
    }
    file << std::setw(2) << snapshot(manager) << std::endl;
    if (!file) {
        throw std::runtime_error("write error on " + m_path);
    }
}

void SettingsStore::apply(const json& doc, SceneManager& manager) {
    if (!doc.is_object()) {
        throw std::invalid_argument("settings document must be a JSON object");
    }
    if (doc.contains("quality")) {
        manager.setQuality(qualityPatchFromJson(doc.at("quality")));
    }
    if (doc.contains("post")) {
        manager.setPost(postPatchFromJson(doc.at("post")));
    }
    if (doc.contains("accessibility")) {
        manager.setAccessibility(accessibilityPatchFromJson(doc.at("accessibility")));
    }
    if (doc.contains("macros")) {
        for (const auto& [key, value] : doc.at("macros").items()) {
            if (!value.is_number()) {
                std::cerr << "[Settings] Skipping non-numeric macro " << key << std::endl;
                continue;
            }
            manager.setMacro(key, value.get<float>());
        }
    }
}

json SettingsStore::snapshot(const SceneManager& manager) {
    json macros = json::object();
    for (const auto& [key, value] : manager.macros().values()) {
        macros[key] = value;
    }
    return {
        {"quality", toJson(manager.quality())},
        {"post", toJson(manager.post())},
        {"accessibility", toJson(manager.accessibility())},
        {"macros", macros}
    };
}

} // namespace lucent
