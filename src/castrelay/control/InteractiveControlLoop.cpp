#include "control/InteractiveControlLoop.hpp"

#include "control/ProgressRenderer.hpp"
#include "log/TaggedLogger.hpp"
#include "receiver/RemoteReceiver.hpp"
#include "session/Lifecycle.hpp"
#include "session/PlaybackSession.hpp"
#include "session/StatusSync.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace CR::Control {

namespace {

using SteadyClock = std::chrono::steady_clock;

auto stateLabel(InteractiveState state) -> std::string_view {
    switch (state) {
    case InteractiveState::Connecting:
        return "Connecting";
    case InteractiveState::Playing:
        return "Playing";
    case InteractiveState::Paused:
        return "Paused";
    case InteractiveState::QuitConfirm:
        return "Quit?";
    case InteractiveState::Terminated:
        return "Stopped";
    }
    return "";
}

} // namespace

auto interactiveStateName(InteractiveState state) -> std::string_view {
    switch (state) {
    case InteractiveState::Connecting:
        return "connecting";
    case InteractiveState::Playing:
        return "playing";
    case InteractiveState::Paused:
        return "paused";
    case InteractiveState::QuitConfirm:
        return "quit_confirm";
    case InteractiveState::Terminated:
        return "terminated";
    }
    return "unknown";
}

InteractiveControlLoop::InteractiveControlLoop(Receiver::RemoteReceiver& receiver,
                                               Session::StatusSync&      status_sync,
                                               Session::Lifecycle&       lifecycle,
                                               KeySource&                keys,
                                               InteractiveControlOptions options,
                                               LogHooks                  hooks)
    : receiver_(receiver)
    , status_sync_(status_sync)
    , lifecycle_(lifecycle)
    , keys_(keys)
    , options_(std::move(options))
    , hooks_(std::move(hooks)) {}

InteractiveControlLoop::InteractiveControlLoop(Session::PlaybackSession& session,
                                               KeySource&                keys,
                                               InteractiveControlOptions options)
    : InteractiveControlLoop(session.receiver(),
                             session.status_sync(),
                             session.lifecycle(),
                             keys,
                             std::move(options),
                             session.hooks()) {}

auto InteractiveControlLoop::set_state_observer(StateObserver observer) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

auto InteractiveControlLoop::state() const -> InteractiveState {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto InteractiveControlLoop::termination_reason() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_reason_;
}

auto InteractiveControlLoop::run() -> Expected<void> {
    transition(InteractiveState::Connecting);
    if (auto connected = connect(); !connected) {
        terminate(describeError(connected.error()));
        return connected;
    }
    if (should_stop()) {
        terminate(termination_reason());
        return {};
    }
    return play();
}

auto InteractiveControlLoop::connect() -> Expected<void> {
    auto const deadline = SteadyClock::now() + options_.connect_timeout;
    while (!should_stop()) {
        auto status = status_sync_.refresh();
        if (status && !status->is_idle) {
            return {};
        }
        if (!status && !isTransient(status.error())) {
            if (should_stop()) {
                return {};
            }
            return std::unexpected(status.error());
        }
        if (SteadyClock::now() >= deadline) {
            return std::unexpected(Error{Error::Code::Timeout,
                                         "receiver did not start playback within "
                                             + std::to_string(options_.connect_timeout.count()) + " ms"});
        }
        auto const until = std::min(SteadyClock::now() + options_.connect_poll, deadline);
        while (SteadyClock::now() < until && !should_stop()) {
            wait_tick(std::min(options_.tick,
                               std::chrono::duration_cast<std::chrono::milliseconds>(until - SteadyClock::now())));
        }
    }
    return {};
}

auto InteractiveControlLoop::play() -> Expected<void> {
    transition(InteractiveState::Playing);
    render();

    auto last_refresh = SteadyClock::now();
    while (!should_stop()) {
        bool handled = false;
        if (!input_closed_) {
            if (auto key = keys_.poll_key(std::chrono::milliseconds{0})) {
                if (key->code == KeyCode::EndOfInput) {
                    input_closed_ = true;
                    cr_log("Keyboard input closed", "InteractiveControlLoop");
                } else if (auto command = options_.bindings.lookup(*key); command != Command::None) {
                    cr_log("Command " + std::string{commandName(command)}, "InteractiveControlLoop");
                    handled = true;
                    if (dispatch(command) == Outcome::Terminate) {
                        break;
                    }
                }
            }
        }
        if (should_stop()) {
            break;
        }

        auto const now = SteadyClock::now();
        if (handled || now - last_refresh >= options_.refresh_interval) {
            last_refresh = now;
            if (refresh() == Outcome::Terminate) {
                break;
            }
        }
        render();
        wait_tick(options_.tick);
    }

    terminate(termination_reason());
    return {};
}

auto InteractiveControlLoop::dispatch(Command command) -> Outcome {
    switch (command) {
    case Command::VolumeUp:
        if (auto adjusted = receiver_.adjust_volume(options_.volume_step); !adjusted) {
            report("volume up", adjusted.error());
        }
        return Outcome::Continue;
    case Command::VolumeDown:
        if (auto adjusted = receiver_.adjust_volume(-options_.volume_step); !adjusted) {
            report("volume down", adjusted.error());
        }
        return Outcome::Continue;
    case Command::SeekBackward:
        seek_by(-options_.seek_seconds);
        return Outcome::Continue;
    case Command::SeekForward:
        seek_by(options_.seek_seconds);
        return Outcome::Continue;
    case Command::TogglePause:
        return pause_until_toggled();
    case Command::Mute:
        if (auto muted = receiver_.set_volume(0.0); !muted) {
            report("mute", muted.error());
        }
        return Outcome::Continue;
    case Command::Quit:
        return confirm_quit();
    case Command::None:
        break;
    }
    return Outcome::Continue;
}

auto InteractiveControlLoop::seek_by(double delta) -> void {
    double target = std::max(0.0, status_sync_.estimate() + delta);
    if (auto total = status_sync_.duration()) {
        target = std::min(target, *total);
    }
    if (auto sought = receiver_.seek(target); !sought) {
        report("seek", sought.error());
        return;
    }
    status_sync_.anchor(target, true);
}

auto InteractiveControlLoop::pause_until_toggled() -> Outcome {
    if (auto paused = receiver_.pause(); !paused) {
        report("pause", paused.error());
        return Outcome::Continue;
    }
    status_sync_.anchor(status_sync_.estimate(), false);
    transition(InteractiveState::Paused);
    render();

    while (true) {
        if (should_stop()) {
            return Outcome::Terminate;
        }
        auto key = keys_.poll_key(options_.tick);
        if (!key) {
            continue;
        }
        if (key->code == KeyCode::EndOfInput) {
            input_closed_ = true;
            std::lock_guard<std::mutex> lock(mutex_);
            stop_reason_ = "input closed";
            return Outcome::Terminate;
        }
        if (options_.bindings.lookup(*key) == Command::TogglePause) {
            break;
        }
    }

    if (auto resumed = receiver_.play(); !resumed) {
        report("play", resumed.error());
    }
    status_sync_.anchor(status_sync_.estimate(), true);
    transition(InteractiveState::Playing);
    return Outcome::Continue;
}

auto InteractiveControlLoop::confirm_quit() -> Outcome {
    if (auto paused = receiver_.pause(); !paused) {
        report("pause", paused.error());
    }
    status_sync_.anchor(status_sync_.estimate(), false);
    transition(InteractiveState::QuitConfirm);
    write("\r\x1b[KQuit playback? [Y/n] ");

    while (true) {
        if (should_stop()) {
            return Outcome::Terminate;
        }
        auto key = keys_.poll_key(options_.tick);
        if (!key) {
            continue;
        }
        if (key->code == KeyCode::EndOfInput) {
            input_closed_ = true;
        } else if (IsNegativeAnswer(*key)) {
            if (auto resumed = receiver_.play(); !resumed) {
                report("play", resumed.error());
            }
            status_sync_.anchor(status_sync_.estimate(), true);
            transition(InteractiveState::Playing);
            return Outcome::Continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        stop_reason_ = "quit confirmed";
        return Outcome::Terminate;
    }
}

auto InteractiveControlLoop::refresh() -> Outcome {
    auto status = status_sync_.refresh();
    if (!status) {
        if (should_stop()) {
            return Outcome::Terminate;
        }
        if (isTransient(status.error())) {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_reason_ = "lost contact with receiver: " + describeError(status.error());
            return Outcome::Terminate;
        }
        report("status poll", status.error());
        return Outcome::Continue;
    }
    if (status->is_idle) {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_reason_ = "playback finished";
        return Outcome::Terminate;
    }
    return Outcome::Continue;
}

auto InteractiveControlLoop::should_stop() -> bool {
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

auto InteractiveControlLoop::wait_tick(std::chrono::milliseconds duration) -> void {
    if (duration.count() <= 0) {
        return;
    }
    // Wakes early once a teardown from another thread completes.
    lifecycle_.wait_for(duration);
}

auto InteractiveControlLoop::transition(InteractiveState next) -> void {
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == next && next != InteractiveState::Connecting) {
            return;
        }
        state_   = next;
        observer = observer_;
    }
    cr_log("State " + std::string{interactiveStateName(next)}, "InteractiveControlLoop");
    if (observer) {
        observer(next);
    }
}

auto InteractiveControlLoop::terminate(std::string_view reason) -> void {
    transition(InteractiveState::Terminated);
    write("\n");
    lifecycle_.teardown(reason.empty() ? std::string_view{"control loop finished"} : reason);
}

auto InteractiveControlLoop::render() -> void {
    auto          state  = this->state();
    ProgressFrame frame;
    frame.position = status_sync_.estimate();
    frame.duration = status_sync_.duration();
    frame.label    = stateLabel(state);
    if (auto status = status_sync_.last_status()) {
        frame.volume = status->volume;
    }
    write(RenderProgressLine(frame, options_.bar_width));
}

auto InteractiveControlLoop::write(std::string_view text) -> void {
    if (options_.output) {
        options_.output(text);
        return;
    }
    std::cout << text << std::flush;
}

auto InteractiveControlLoop::report(std::string_view action, Error const& error) -> void {
    emit_error(hooks_, "castrelay: " + std::string{action} + " failed: " + describeError(error));
}

} // namespace CR::Control
