/**
 * @file test_settings.cpp
 * @brief Settings patches and the JSON settings file
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lucent/scene_manager.h>
#include <lucent/settings.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace lucent;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path tempPath(const std::string& name) {
    fs::path path = fs::temp_directory_path() / name;
    fs::remove(path);
    return path;
}

void writeFile(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

} // namespace

TEST_CASE("Settings patches merge only present fields", "[settings]") {
    AccessibilitySettings a11y;
    merge(a11y, accessibilityPatchFromJson(json{{"reducedMotion", true}}));
    REQUIRE(a11y.reducedMotion);
    REQUIRE(a11y.epilepsySafe);
    REQUIRE_THAT(a11y.intensityLimit, WithinAbs(0.8, 1e-6));

    QualitySettings quality;
    merge(quality, qualityPatchFromJson(json{{"antialias", 4}}));
    REQUIRE(quality.antialias == 4);
    REQUIRE_THAT(quality.scale, WithinAbs(1.0, 1e-6));

    PostSettings post;
    merge(post, postPatchFromJson(json{{"motionBlur", true}, {"bloom", nullptr}}));
    REQUIRE(post.motionBlur);
    REQUIRE_THAT(post.bloom, WithinAbs(0.8, 1e-6));

    SECTION("wrong types throw") {
        REQUIRE_THROWS_AS(qualityPatchFromJson(json{{"scale", "big"}}), json::exception);
    }
}

TEST_CASE("SettingsStore round-trips manager state", "[settings]") {
    fs::path path = tempPath("lucent_settings_roundtrip.json");

    {
        SceneManager manager({}, SceneRegistry{});
        QualityPatch quality;
        quality.scale = 0.75f;
        manager.setQuality(quality);
        AccessibilityPatch a11y;
        a11y.highContrast = true;
        a11y.intensityLimit = 0.5f;
        manager.setAccessibility(a11y);
        manager.setMacro("speed", 2.5f);
        manager.setMacro("customKnob", 7.0f);

        SettingsStore(path.string()).save(manager);
    }

    SceneManager restored({}, SceneRegistry{});
    REQUIRE(SettingsStore(path.string()).load(restored));
    REQUIRE_THAT(restored.quality().scale, WithinAbs(0.75, 1e-6));
    REQUIRE(restored.accessibility().highContrast);
    REQUIRE_THAT(restored.accessibility().intensityLimit, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(restored.getMacro("speed"), WithinAbs(2.5, 1e-6));
    REQUIRE_THAT(restored.getMacro("customKnob"), WithinAbs(7.0, 1e-6));

    fs::remove(path);
}

TEST_CASE("SettingsStore load edge cases", "[settings]") {
    fs::path path = tempPath("lucent_settings_edge.json");
    SceneManager manager({}, SceneRegistry{});
    SettingsStore store(path.string());

    SECTION("a missing file is not an error") {
        REQUIRE_FALSE(store.load(manager));
    }

    SECTION("malformed JSON throws") {
        writeFile(path, "{ \"quality\": ");
        REQUIRE_THROWS_AS(store.load(manager), std::runtime_error);
    }

    SECTION("a non-object document throws") {
        writeFile(path, "[1, 2, 3]");
        REQUIRE_THROWS_AS(store.load(manager), std::runtime_error);
    }

    SECTION("wrongly typed settings throw") {
        writeFile(path, R"({"post": {"ssao": "yes"}})");
        REQUIRE_THROWS_AS(store.load(manager), std::runtime_error);
    }

    SECTION("non-numeric macros are skipped") {
        writeFile(path, R"({"macros": {"intensity": "loud", "glitch": 0.4}})");
        REQUIRE(store.load(manager));
        REQUIRE_THAT(manager.getMacro("intensity"), WithinAbs(0.7, 1e-6));
        REQUIRE_THAT(manager.getMacro("glitch"), WithinAbs(0.4, 1e-6));
    }

    SECTION("declared macros are clamped on load") {
        writeFile(path, R"({"macros": {"fluidIters": 9000}})");
        REQUIRE(store.load(manager));
        REQUIRE_THAT(manager.getMacro("fluidIters"), WithinAbs(128.0, 1e-6));
    }

    fs::remove(path);
}

TEST_CASE("SettingsStore snapshot layout", "[settings]") {
    SceneManager manager({}, SceneRegistry{});
    json doc = SettingsStore::snapshot(manager);

    REQUIRE(doc.contains("quality"));
    REQUIRE(doc.contains("post"));
    REQUIRE(doc.contains("accessibility"));
    REQUIRE(doc["macros"]["intensity"].get<float>() == manager.getMacro("intensity"));
    REQUIRE(doc["accessibility"]["epilepsySafe"].get<bool>());
}
