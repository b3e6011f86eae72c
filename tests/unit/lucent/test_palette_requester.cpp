/**
 * @file test_palette_requester.cpp
 * @brief Generation handling for background palette requests
 */

#include <catch2/catch_test_macros.hpp>
#include <lucent/palette_requester.h>
#include <lucent/scene_manager.h>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace lucent;

namespace {

const Palette RED = Palette::fromColors({Color::fromHex(0xff0000), Color::fromHex(0x880000)});
const Palette GREEN = Palette::fromColors({Color::fromHex(0x00ff00), Color::fromHex(0x008800)});
const Palette GREY = Palette::fromColors({Color::fromHex(0x808080)});

template<typename Pred>
bool pollUntil(PaletteRequester& requester, SceneManager& manager, Pred done) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        requester.poll(manager);
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

} // namespace

TEST_CASE("PaletteRequester applies a finished request", "[palette][requester]") {
    SceneManager manager({}, SceneRegistry{});
    PaletteRequester requester([](const std::string& source) {
        if (source == "red.png") return RED;
        throw std::runtime_error("unexpected source");
    });

    REQUIRE(requester.generation() == 0);
    REQUIRE(requester.request("red.png") == 1);
    REQUIRE(pollUntil(requester, manager, [&] { return requester.inFlight() == 0; }));
    REQUIRE(manager.palette() == RED);
}

TEST_CASE("PaletteRequester discards stale results", "[palette][requester]") {
    SceneManager manager({}, SceneRegistry{});
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();

    PaletteRequester requester([released](const std::string& source) {
        if (source == "slow") {
            released.wait();
            return RED;
        }
        return GREEN;
    });

    uint64_t slow = requester.request("slow");
    uint64_t fast = requester.request("fast");
    REQUIRE(fast > slow);

    bool appliedFast = pollUntil(requester, manager, [&] { return manager.palette() == GREEN; });
    gate.set_value();
    REQUIRE(appliedFast);

    REQUIRE(pollUntil(requester, manager, [&] { return requester.inFlight() == 0; }));
    REQUIRE(manager.palette() == GREEN);
}

TEST_CASE("PaletteRequester falls back when the latest request fails", "[palette][requester]") {
    SceneManager manager({}, SceneRegistry{});
    PaletteRequester requester([](const std::string&) -> Palette {
        throw std::runtime_error("404");
    }, GREY);

    requester.request("https://example.invalid/cover.jpg");
    REQUIRE(pollUntil(requester, manager, [&] { return requester.inFlight() == 0; }));
    REQUIRE(manager.palette() == GREY);

    SECTION("setFallback replaces the fallback palette") {
        requester.setFallback(RED);
        requester.request("again");
        REQUIRE(pollUntil(requester, manager, [&] { return requester.inFlight() == 0; }));
        REQUIRE(manager.palette() == RED);
    }
}

TEST_CASE("PaletteRequester ignores failures of superseded requests", "[palette][requester]") {
    SceneManager manager({}, SceneRegistry{});
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();

    PaletteRequester requester([released](const std::string& source) -> Palette {
        if (source == "broken") {
            released.wait();
            throw std::runtime_error("decode failed");
        }
        return GREEN;
    }, GREY);

    requester.request("broken");
    requester.request("good");

    bool appliedGood = pollUntil(requester, manager, [&] { return manager.palette() == GREEN; });
    gate.set_value();
    REQUIRE(appliedGood);

    REQUIRE(pollUntil(requester, manager, [&] { return requester.inFlight() == 0; }));
    REQUIRE(manager.palette() == GREEN);
}

TEST_CASE("PaletteRequester destruction does not wait for slow requests", "[palette][requester]") {
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();

    auto start = std::chrono::steady_clock::now();
    {
        PaletteRequester requester([released](const std::string&) {
            released.wait();
            return RED;
        });
        requester.request("https://example.invalid/slow.jpg");
        REQUIRE(requester.inFlight() == 1);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    gate.set_value();

    REQUIRE(elapsed >= PaletteRequester::SHUTDOWN_GRACE);
    REQUIRE(elapsed < PaletteRequester::SHUTDOWN_GRACE + std::chrono::seconds(2));
}
