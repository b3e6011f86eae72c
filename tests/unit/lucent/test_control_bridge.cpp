/**
 * @file test_control_bridge.cpp
 * @brief Control message parsing and application
 */

#include "fake_scene.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lucent/control_bridge.h>
#include <lucent/palette_requester.h>

using namespace lucent;
using namespace lucent::testing;
using Catch::Matchers::WithinAbs;

namespace {

const Palette COVER = Palette::fromColors({Color::fromHex(0x123456), Color::fromHex(0xabcdef)});

PaletteRequester coverRequester() {
    return PaletteRequester([](const std::string&) { return COVER; });
}

} // namespace

TEST_CASE("ControlBridge parses each message type", "[control]") {
    SECTION("set_macro") {
        auto cmd = ControlBridge::parse(R"({"type": "set_macro", "key": "intensity", "value": 0.9})");
        REQUIRE(cmd);
        REQUIRE(cmd->type == ControlCommandType::SetMacro);
        REQUIRE(cmd->key == "intensity");
        REQUIRE_THAT(cmd->value, WithinAbs(0.9, 1e-6));
    }

    SECTION("phrase with and without tempo") {
        auto cmd = ControlBridge::parse(R"({"type": "phrase", "bar": 16, "tempo": 124})");
        REQUIRE(cmd);
        REQUIRE(cmd->type == ControlCommandType::Phrase);
        REQUIRE(cmd->bar == 16);
        REQUIRE_THAT(cmd->tempo, WithinAbs(124.0, 1e-9));

        auto plain = ControlBridge::parse(R"({"type": "phrase", "bar": 4})");
        REQUIRE(plain);
        REQUIRE_THAT(plain->tempo, WithinAbs(120.0, 1e-9));
    }

    SECTION("palette from dominant and secondary") {
        auto cmd = ControlBridge::parse(
            R"({"type": "palette", "dominant": "#ff0000", "secondary": "#00ff00"})");
        REQUIRE(cmd);
        REQUIRE(cmd->type == ControlCommandType::Palette);
        REQUIRE(cmd->palette.dominant == Color::fromHex(0xff0000));
        REQUIRE(cmd->palette.secondary == Color::fromHex(0x00ff00));
        REQUIRE(cmd->palette.colors.size() == 2);
    }

    SECTION("palette from a colour list") {
        auto cmd = ControlBridge::parse(
            R"({"type": "palette", "colors": ["#000000", "#ffffff", "#ff0000"]})");
        REQUIRE(cmd);
        REQUIRE(cmd->palette.colors.size() == 3);
        REQUIRE(cmd->palette.dominant == Color::fromHex(0x000000));
    }

    SECTION("palette_url") {
        auto cmd = ControlBridge::parse(R"({"type": "palette_url", "url": "https://example.com/a.jpg"})");
        REQUIRE(cmd);
        REQUIRE(cmd->type == ControlCommandType::PaletteUrl);
        REQUIRE(cmd->url == "https://example.com/a.jpg");
    }

    SECTION("crossfade names are case-insensitive") {
        auto cmd = ControlBridge::parse(R"({"type": "crossfade", "scene": "tunnel", "seconds": 3.5})");
        REQUIRE(cmd);
        REQUIRE(cmd->type == ControlCommandType::Crossfade);
        REQUIRE(cmd->scene == SceneKind::Tunnel);
        REQUIRE_THAT(cmd->seconds, WithinAbs(3.5, 1e-9));
    }

    SECTION("settings patches") {
        auto quality = ControlBridge::parse(R"({"type": "quality", "scale": 0.75})");
        REQUIRE(quality);
        REQUIRE(quality->quality.scale);
        REQUIRE_FALSE(quality->quality.antialias);

        auto post = ControlBridge::parse(R"({"type": "post", "bloom": 1.2})");
        REQUIRE(post);
        REQUIRE_THAT(*post->post.bloom, WithinAbs(1.2, 1e-6));

        auto a11y = ControlBridge::parse(R"({"type": "accessibility", "reducedMotion": true})");
        REQUIRE(a11y);
        REQUIRE(*a11y->accessibility.reducedMotion);
        REQUIRE_FALSE(a11y->accessibility.epilepsySafe);
    }
}

TEST_CASE("ControlBridge rejects malformed messages", "[control]") {
    REQUIRE_FALSE(ControlBridge::parse("not json"));
    REQUIRE_FALSE(ControlBridge::parse("[1, 2]"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "dance"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"value": 1})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "set_macro", "key": "intensity", "value": "high"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "set_macro", "value": 0.5})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "phrase", "bar": 1.5})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "palette", "dominant": "red"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "palette", "colors": "#ff0000"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "palette"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "palette_url"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "crossfade", "scene": "Disco"})"));
    REQUIRE_FALSE(ControlBridge::parse(R"({"type": "quality", "scale": "big"})"));
}

TEST_CASE("ControlBridge queues messages until polled", "[control]") {
    FakeSceneFactory factory;
    ManualClock clock;
    SceneManager manager({}, factory.registry(), clock.source());
    PaletteRequester palettes = coverRequester();
    ControlBridge bridge;

    REQUIRE(bridge.handleMessage(R"({"type": "set_macro", "key": "intensity", "value": 0.25})"));
    REQUIRE(bridge.handleMessage(R"({"type": "post", "bloom": 1.5})"));
    REQUIRE_FALSE(bridge.handleMessage("{broken"));
    REQUIRE(bridge.queued() == 2);

    // Nothing is applied before poll()
    REQUIRE_THAT(manager.getMacro("intensity"), WithinAbs(0.7, 1e-6));

    REQUIRE(bridge.poll(manager, palettes) == 2);
    REQUIRE(bridge.queued() == 0);
    REQUIRE_THAT(manager.getMacro("intensity"), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(manager.post().bloom, WithinAbs(1.5, 1e-6));
    REQUIRE_THAT(manager.getMacro("bloom"), WithinAbs(1.5, 1e-6));

    REQUIRE(bridge.poll(manager, palettes) == 0);
}

TEST_CASE("ControlBridge applies commands to the manager", "[control]") {
    FakeSceneFactory factory;
    ManualClock clock;
    SceneManager manager({}, factory.registry(), clock.source());
    PaletteRequester palettes = coverRequester();
    manager.loadScene(SceneKind::Particles);

    SECTION("phrase reaches the primary scene") {
        auto cmd = ControlBridge::parse(R"({"type": "phrase", "bar": 8, "tempo": 128})");
        REQUIRE(ControlBridge::apply(*cmd, manager, palettes));
        auto log = factory.last(SceneKind::Particles);
        REQUIRE(log->phrases.size() == 1);
        REQUIRE(log->phrases[0].first == 8);
        REQUIRE_THAT(log->phrases[0].second, WithinAbs(128.0, 1e-9));
    }

    SECTION("palette replaces the manager palette") {
        auto cmd = ControlBridge::parse(R"({"type": "palette", "dominant": "#112233"})");
        REQUIRE(ControlBridge::apply(*cmd, manager, palettes));
        REQUIRE(manager.palette().dominant == Color::fromHex(0x112233));
        REQUIRE(factory.last(SceneKind::Particles)->palettes.size() == 1);
    }

    SECTION("palette_url starts a background request") {
        auto cmd = ControlBridge::parse(R"({"type": "palette_url", "url": "cover.jpg"})");
        REQUIRE(ControlBridge::apply(*cmd, manager, palettes));
        REQUIRE(palettes.generation() == 1);
    }

    SECTION("crossfade starts a transition") {
        auto cmd = ControlBridge::parse(R"({"type": "crossfade", "scene": "Terrain", "seconds": 1})");
        REQUIRE(ControlBridge::apply(*cmd, manager, palettes));
        REQUIRE(manager.state() == TransitionState::Transitioning);
        REQUIRE(manager.secondary()->kind() == SceneKind::Terrain);
    }

    SECTION("crossfade to a scene that fails to init is reported") {
        factory.setFaults(SceneKind::Tunnel, FaultPlan{true, false, false});
        auto cmd = ControlBridge::parse(R"({"type": "crossfade", "scene": "Tunnel"})");
        REQUIRE_FALSE(ControlBridge::apply(*cmd, manager, palettes));
        REQUIRE(manager.state() == TransitionState::SingleActive);
        REQUIRE(manager.primary()->kind() == SceneKind::Particles);
    }

    SECTION("accessibility and quality patches merge") {
        auto a11y = ControlBridge::parse(R"({"type": "accessibility", "intensityLimit": 0.3})");
        REQUIRE(ControlBridge::apply(*a11y, manager, palettes));
        REQUIRE_THAT(manager.effectiveMacro("intensity"), WithinAbs(0.3, 1e-6));
        REQUIRE(manager.accessibility().epilepsySafe);

        auto quality = ControlBridge::parse(R"({"type": "quality", "scale": 2})");
        REQUIRE(ControlBridge::apply(*quality, manager, palettes));
        REQUIRE_THAT(manager.pixelRatio(), WithinAbs(2.0, 1e-6));
    }
}
