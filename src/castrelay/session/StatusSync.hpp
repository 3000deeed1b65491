#pragma once

#include "core/Error.hpp"
#include "receiver/RemoteReceiver.hpp"
#include "session/PlaybackClock.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace CR::Session {

struct StatusSyncOptions {
    int                       max_attempts = 5; // per refresh, for transient failures
    std::chrono::milliseconds retry_delay{200};
};

// Pairs authoritative status polls with a locally extrapolated play head.
class StatusSync {
public:
    using TimeSource = std::function<PlaybackClock::Clock::time_point()>;
    using Sleeper    = std::function<void(std::chrono::milliseconds)>;

    explicit StatusSync(Receiver::RemoteReceiver& receiver,
                        StatusSyncOptions         options = {},
                        TimeSource                now     = {});

    // Polls the receiver and re-anchors the clock at the reported position. Retries transient
    // failures, then surfaces the last error.
    auto refresh() -> Expected<Receiver::RemoteStatus>;

    // Never polls. Clamped to [0, duration] once a duration is known.
    [[nodiscard]] auto estimate() const -> double;

    // Re-anchors after a local seek, pause or play.
    auto anchor(double time, bool running) -> void;

    [[nodiscard]] auto last_status() const -> std::optional<Receiver::RemoteStatus>;
    [[nodiscard]] auto duration() const -> std::optional<double>;
    [[nodiscard]] auto clock() const -> PlaybackClock;

    auto set_sleeper(Sleeper sleeper) -> void;

private:
    [[nodiscard]] auto now() const -> PlaybackClock::Clock::time_point;
    [[nodiscard]] auto clamp_locked(double position) const -> double;

    Receiver::RemoteReceiver& receiver_;
    StatusSyncOptions         options_;
    TimeSource                now_;
    Sleeper                   sleeper_;

    mutable std::mutex                    mutex_;
    PlaybackClock                         clock_;
    std::optional<Receiver::RemoteStatus> last_status_;
    std::optional<double>                 duration_;
};

} // namespace CR::Session
