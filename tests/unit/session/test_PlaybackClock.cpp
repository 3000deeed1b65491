#include "session/PlaybackClock.hpp"

#include <doctest/doctest.h>

using CR::Session::PlaybackClock;
using namespace std::chrono_literals;

TEST_SUITE("session.playback_clock") {

TEST_CASE("a running clock advances with wall time") {
    PlaybackClock clock;
    auto const    start = PlaybackClock::Clock::now();
    clock.reset(12.0, start, true);

    CHECK(clock.running());
    CHECK(clock.anchor_time() == 12.0);
    CHECK(clock.anchor_wallclock() == start);
    CHECK(clock.estimate(start) == doctest::Approx(12.0));
    CHECK(clock.estimate(start + 1500ms) == doctest::Approx(13.5));
}

TEST_CASE("a frozen clock stays at its anchor") {
    PlaybackClock clock;
    auto const    start = PlaybackClock::Clock::now();
    clock.reset(42.0, start, false);
    CHECK(clock.estimate(start + 10s) == doctest::Approx(42.0));
}

TEST_CASE("instants before the anchor never run the clock backwards") {
    PlaybackClock clock;
    auto const    start = PlaybackClock::Clock::now();
    clock.reset(5.0, start, true);
    CHECK(clock.estimate(start - 3s) == doctest::Approx(5.0));
}

TEST_CASE("reset replaces the previous anchor") {
    PlaybackClock clock;
    auto const    start = PlaybackClock::Clock::now();
    clock.reset(5.0, start, true);
    clock.reset(90.0, start + 2s, false);
    CHECK_FALSE(clock.running());
    CHECK(clock.estimate(start + 20s) == doctest::Approx(90.0));
}

} // TEST_SUITE
