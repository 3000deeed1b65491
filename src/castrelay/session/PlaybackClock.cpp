#include "session/PlaybackClock.hpp"

namespace CR::Session {

auto PlaybackClock::reset(double anchor_time, Clock::time_point anchor_wallclock, bool running) -> void {
    anchor_time_      = anchor_time;
    anchor_wallclock_ = anchor_wallclock;
    running_          = running;
}

auto PlaybackClock::estimate(Clock::time_point now) const -> double {
    if (!running_ || now <= anchor_wallclock_) {
        return anchor_time_;
    }
    return anchor_time_ + std::chrono::duration<double>(now - anchor_wallclock_).count();
}

} // namespace CR::Session
