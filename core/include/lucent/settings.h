#pragma once

/**
 * @file settings.h
 * @brief Quality, post-processing and accessibility settings
 *
 * Each settings struct has a matching patch whose fields are all optional;
 * merging a patch overwrites only the fields it carries. Patches are parsed
 * from the control bridge and the settings file.
 */

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lucent {

class SceneManager;

struct QualitySettings {
    float scale = 1.0f;     ///< Multiplies the device pixel ratio
    int antialias = 0;      ///< MSAA sample count hint (0 = off)
};

struct QualityPatch {
    std::optional<float> scale;
    std::optional<int> antialias;
};

struct PostSettings {
    float bloom = 0.8f;
    bool ssao = false;
    bool motionBlur = false;
};

struct PostPatch {
    std::optional<float> bloom;
    std::optional<bool> ssao;
    std::optional<bool> motionBlur;
};

struct AccessibilitySettings {
    bool epilepsySafe = true;
    float intensityLimit = 0.8f;
    bool reducedMotion = false;
    bool highContrast = false;
};

struct AccessibilityPatch {
    std::optional<bool> epilepsySafe;
    std::optional<float> intensityLimit;
    std::optional<bool> reducedMotion;
    std::optional<bool> highContrast;
};

// Shallow merge
void merge(QualitySettings& settings, const QualityPatch& patch);
void merge(PostSettings& settings, const PostPatch& patch);
void merge(AccessibilitySettings& settings, const AccessibilityPatch& patch);

// JSON parsing; absent keys stay unset, wrong types throw nlohmann::json::exception
QualityPatch qualityPatchFromJson(const nlohmann::json& j);
PostPatch postPatchFromJson(const nlohmann::json& j);
AccessibilityPatch accessibilityPatchFromJson(const nlohmann::json& j);

nlohmann::json toJson(const QualitySettings& settings);
nlohmann::json toJson(const PostSettings& settings);
nlohmann::json toJson(const AccessibilitySettings& settings);

/**
 * @brief Persists manager settings and macros in a JSON file
 *
 * Layout:
 * @code
 * {
 *   "quality": {"scale": 1, "antialias": 0},
 *   "post": {"bloom": 0.8, "ssao": false, "motionBlur": false},
 *   "accessibility": {"epilepsySafe": true, "intensityLimit": 0.8, ...},
 *   "macros": {"intensity": 0.7, ...}
 * }
 * @endcode
 */
class SettingsStore {
public:
    explicit SettingsStore(const std::string& path);

    /**
     * @brief Merge the file into @p manager
     * @return false if the file does not exist (nothing applied)
     * @throws std::runtime_error if the file cannot be read or is not valid JSON
     */
    bool load(SceneManager& manager) const;

    /**
     * @brief Write the manager's current settings and macros
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const SceneManager& manager) const;

    /**
     * @brief Apply an already-parsed settings document
     * @throws std::invalid_argument if @p doc is not an object
     * @throws nlohmann::json::exception on mistyped fields
     */
    static void apply(const nlohmann::json& doc, SceneManager& manager);

    /// @brief Serialize the manager's settings and macros
    static nlohmann::json snapshot(const SceneManager& manager);

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // namespace lucent
