#pragma once

#include <chrono>

namespace CR::Session {

// Local prediction of the remote play head: anchor_time plus wall time elapsed since the anchor
// was taken, or anchor_time alone while frozen. Advisory only; re-anchored on every refresh and
// every local transport command.
class PlaybackClock {
public:
    using Clock = std::chrono::steady_clock;

    auto reset(double anchor_time, Clock::time_point anchor_wallclock, bool running) -> void;

    [[nodiscard]] auto estimate(Clock::time_point now) const -> double;

    [[nodiscard]] auto anchor_time() const -> double { return anchor_time_; }
    [[nodiscard]] auto anchor_wallclock() const -> Clock::time_point { return anchor_wallclock_; }
    [[nodiscard]] auto running() const -> bool { return running_; }

private:
    double            anchor_time_ = 0.0;
    Clock::time_point anchor_wallclock_{};
    bool              running_ = false;
};

} // namespace CR::Session
