#include "control/OnetimeControlLoop.hpp"

#include "log/TaggedLogger.hpp"
#include "session/Lifecycle.hpp"
#include "session/PlaybackSession.hpp"
#include "session/StatusSync.hpp"

#include <utility>

namespace CR::Control {

auto onetimeStateName(OnetimeState state) -> std::string_view {
    switch (state) {
    case OnetimeState::WaitingForStart:
        return "waiting_for_start";
    case OnetimeState::Playing:
        return "playing";
    case OnetimeState::Terminated:
        return "terminated";
    }
    return "unknown";
}

OnetimeControlLoop::OnetimeControlLoop(Session::StatusSync&  status_sync,
                                       Session::Lifecycle&   lifecycle,
                                       OnetimeControlOptions options,
                                       LogHooks              hooks)
    : status_sync_(status_sync)
    , lifecycle_(lifecycle)
    , options_(options)
    , hooks_(std::move(hooks)) {}

OnetimeControlLoop::OnetimeControlLoop(Session::PlaybackSession& session, OnetimeControlOptions options)
    : OnetimeControlLoop(session.status_sync(), session.lifecycle(), options, session.hooks()) {}

auto OnetimeControlLoop::set_state_observer(StateObserver observer) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

auto OnetimeControlLoop::state() const -> OnetimeState {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto OnetimeControlLoop::termination_reason() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_reason_;
}

auto OnetimeControlLoop::run() -> Expected<void> {
    using SteadyClock   = std::chrono::steady_clock;
    auto const deadline = SteadyClock::now() + options_.start_timeout;

    while (!should_stop()) {
        auto status = status_sync_.refresh();
        if (!status) {
            if (should_stop()) {
                break;
            }
            finish("lost contact with receiver: " + describeError(status.error()));
            return std::unexpected(status.error());
        }

        if (state() == OnetimeState::WaitingForStart) {
            if (!status->is_idle) {
                transition(OnetimeState::Playing);
            } else if (SteadyClock::now() >= deadline) {
                Error error{Error::Code::Timeout,
                            "receiver did not start playback within "
                                + std::to_string(options_.start_timeout.count()) + " ms"};
                finish(describeError(error));
                return std::unexpected(std::move(error));
            }
        } else if (status->is_idle) {
            finish("playback finished");
            return {};
        }
        lifecycle_.wait_for(options_.poll_interval);
    }

    finish(termination_reason());
    return {};
}

auto OnetimeControlLoop::should_stop() -> bool {
    if (lifecycle_.done()) {
        auto reason = lifecycle_.reason();
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_reason_.empty()) {
            stop_reason_ = reason.empty() ? "receiver disconnected" : reason;
        }
        return true;
    }
    if (options_.interrupt_flag != nullptr && options_.interrupt_flag->load()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_reason_.empty()) {
            stop_reason_ = "interrupted";
        }
        return true;
    }
    return false;
}

auto OnetimeControlLoop::transition(OnetimeState next) -> void {
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_   = next;
        observer = observer_;
    }
    cr_log("State " + std::string{onetimeStateName(next)}, "OnetimeControlLoop");
    if (observer) {
        observer(next);
    }
}

auto OnetimeControlLoop::finish(std::string reason) -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_reason_.empty()) {
            stop_reason_ = reason;
        }
    }
    transition(OnetimeState::Terminated);
    emit_info(hooks_, "Playback ended: " + termination_reason());
    lifecycle_.teardown(termination_reason());
}

} // namespace CR::Control
