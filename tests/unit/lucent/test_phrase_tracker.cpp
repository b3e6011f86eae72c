/**
 * @file test_phrase_tracker.cpp
 * @brief Unit tests for PhraseTracker
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lucent/phrase_tracker.h>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace lucent;
using Catch::Matchers::WithinAbs;

namespace {

struct Recorder {
    std::vector<std::pair<int, double>> events;

    PhraseTracker::PhraseCallback callback() {
        return [this](int bar, double tempo) { events.emplace_back(bar, tempo); };
    }
};

} // namespace

TEST_CASE("PhraseTracker fires every barsPerPhrase bars from a bar list", "[phrase]") {
    PhraseTracker tracker(100.0, 4);
    tracker.setBars({0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0});
    Recorder rec;

    REQUIRE(tracker.advance(0.0, rec.callback()) == 1);
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].first == 0);
    REQUIRE_THAT(rec.events[0].second, WithinAbs(100.0, 1e-9));

    SECTION("bars between phrases are consumed silently") {
        REQUIRE(tracker.advance(3.5, rec.callback()) == 0);
        REQUIRE(tracker.nextBar() == 4);
    }

    SECTION("a late advance processes every passed bar in order") {
        REQUIRE(tracker.advance(8.5, rec.callback()) == 2);
        REQUIRE(rec.events.size() == 3);
        REQUIRE(rec.events[1].first == 4);
        REQUIRE(rec.events[2].first == 8);
    }

    SECTION("the list ends") {
        tracker.advance(100.0, rec.callback());
        REQUIRE(tracker.nextBar() == 10);
        REQUIRE(tracker.advance(200.0, rec.callback()) == 0);
    }

    SECTION("reset rewinds") {
        tracker.advance(9.0, rec.callback());
        tracker.reset();
        REQUIRE(tracker.nextBar() == 0);
        REQUIRE(tracker.advance(0.0, rec.callback()) == 1);
    }
}

TEST_CASE("PhraseTracker derives bars from tempo", "[phrase]") {
    PhraseTracker tracker(120.0);
    Recorder rec;

    // 4 beats at 120 bpm
    REQUIRE_THAT(tracker.barDuration(), WithinAbs(2.0, 1e-9));

    tracker.advance(0.0, rec.callback());
    tracker.advance(7.9, rec.callback());
    REQUIRE(rec.events.size() == 1);

    tracker.advance(8.0, rec.callback());
    REQUIRE(rec.events.size() == 2);
    REQUIRE(rec.events[1].first == 4);

    SECTION("tempo changes the bar length") {
        tracker.setTempo(60.0);
        REQUIRE_THAT(tracker.barDuration(), WithinAbs(4.0, 1e-9));
        REQUIRE_THROWS_AS(tracker.setTempo(0.0), std::invalid_argument);
        REQUIRE_THAT(tracker.tempo(), WithinAbs(60.0, 1e-9));
    }
}

TEST_CASE("PhraseTracker validates construction", "[phrase]") {
    REQUIRE_THROWS_AS(PhraseTracker(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(PhraseTracker(-10.0), std::invalid_argument);
    REQUIRE_THROWS_AS(PhraseTracker(120.0, 0), std::invalid_argument);
    REQUIRE(PhraseTracker(120.0, 8).barsPerPhrase() == 8);
}
