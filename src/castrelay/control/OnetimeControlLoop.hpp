#pragma once

#include "core/Error.hpp"
#include "log/LogHooks.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace CR::Session {
class Lifecycle;
class PlaybackSession;
class StatusSync;
} // namespace CR::Session

namespace CR::Control {

enum class OnetimeState {
    WaitingForStart,
    Playing,
    Terminated,
};

[[nodiscard]] auto onetimeStateName(OnetimeState state) -> std::string_view;

struct OnetimeControlOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds start_timeout{30000};
    std::atomic<bool> const*  interrupt_flag = nullptr;
};

// Plays the media once without a keyboard and tears the session down when it ends.
class OnetimeControlLoop {
public:
    using StateObserver = std::function<void(OnetimeState)>;

    OnetimeControlLoop(Session::StatusSync& status_sync,
                       Session::Lifecycle&  lifecycle,
                       OnetimeControlOptions options = {},
                       LogHooks             hooks   = {});
    explicit OnetimeControlLoop(Session::PlaybackSession& session, OnetimeControlOptions options = {});

    auto run() -> Expected<void>;

    auto set_state_observer(StateObserver observer) -> void;
    [[nodiscard]] auto state() const -> OnetimeState;
    [[nodiscard]] auto termination_reason() const -> std::string;

private:
    auto should_stop() -> bool;
    auto transition(OnetimeState next) -> void;
    auto finish(std::string reason) -> void;

    Session::StatusSync&  status_sync_;
    Session::Lifecycle&   lifecycle_;
    OnetimeControlOptions options_;
    LogHooks              hooks_;
    StateObserver         observer_;

    mutable std::mutex mutex_;
    OnetimeState       state_ = OnetimeState::WaitingForStart;
    std::string        stop_reason_;
};

} // namespace CR::Control
