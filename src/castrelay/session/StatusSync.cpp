#include "session/StatusSync.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace CR::Session {

StatusSync::StatusSync(Receiver::RemoteReceiver& receiver, StatusSyncOptions options, TimeSource now)
    : receiver_(receiver)
    , options_(options)
    , now_(std::move(now))
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

auto StatusSync::now() const -> PlaybackClock::Clock::time_point {
    if (now_) {
        return now_();
    }
    return PlaybackClock::Clock::now();
}

auto StatusSync::refresh() -> Expected<Receiver::RemoteStatus> {
    auto const attempts = std::max(options_.max_attempts, 1);
    for (int attempt = 1;; ++attempt) {
        auto status = receiver_.poll_status();
        if (status) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status->duration) {
                duration_ = status->duration;
            }
            clock_.reset(status->current_time, now(), !status->is_idle && !status->is_paused);
            last_status_ = *status;
            return status;
        }
        if (!isTransient(status.error()) || attempt >= attempts) {
            return status;
        }
        cr_log("Status poll failed, retrying: " + describeError(status.error()), "StatusSync");
        sleeper_(options_.retry_delay);
    }
}

auto StatusSync::clamp_locked(double position) const -> double {
    if (duration_) {
        return std::clamp(position, 0.0, *duration_);
    }
    return std::max(position, 0.0);
}

auto StatusSync::estimate() const -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    return clamp_locked(clock_.estimate(now()));
}

auto StatusSync::anchor(double time, bool running) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_.reset(clamp_locked(time), now(), running);
}

auto StatusSync::last_status() const -> std::optional<Receiver::RemoteStatus> {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_;
}

auto StatusSync::duration() const -> std::optional<double> {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_;
}

auto StatusSync::clock() const -> PlaybackClock {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_;
}

auto StatusSync::set_sleeper(Sleeper sleeper) -> void {
    sleeper_ = std::move(sleeper);
}

} // namespace CR::Session
