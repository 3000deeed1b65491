#pragma once

#include "control/KeyBindings.hpp"
#include "control/TerminalInput.hpp"
#include "core/Error.hpp"
#include "log/LogHooks.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace CR::Receiver {
class RemoteReceiver;
}

namespace CR::Session {
class Lifecycle;
class PlaybackSession;
class StatusSync;
} // namespace CR::Session

namespace CR::Control {

enum class InteractiveState {
    Connecting,
    Playing,
    Paused,
    QuitConfirm,
    Terminated,
};

[[nodiscard]] auto interactiveStateName(InteractiveState state) -> std::string_view;

struct InteractiveControlOptions {
    double                    volume_step  = 0.01;
    double                    seek_seconds = 30.0;
    std::chrono::milliseconds tick{100};
    std::chrono::milliseconds refresh_interval{1000};
    std::chrono::milliseconds connect_poll{500};
    std::chrono::milliseconds connect_timeout{30000};
    int                       bar_width = 30;
    KeyBindings               bindings  = KeyBindings::defaults();
    // Raised by the signal handler; observed once per tick.
    std::atomic<bool> const* interrupt_flag = nullptr;
    // Receives progress frames and prompts. Defaults to std::cout.
    std::function<void(std::string_view)> output;
};

// Keyboard-driven transport control for one session. Every exit path ends in a single
// Lifecycle teardown.
class InteractiveControlLoop {
public:
    using StateObserver = std::function<void(InteractiveState)>;

    InteractiveControlLoop(Receiver::RemoteReceiver& receiver,
                           Session::StatusSync&      status_sync,
                           Session::Lifecycle&       lifecycle,
                           KeySource&                keys,
                           InteractiveControlOptions options = {},
                           LogHooks                  hooks   = {});
    InteractiveControlLoop(Session::PlaybackSession& session, KeySource& keys, InteractiveControlOptions options = {});

    // Returns after teardown. Fails only when the receiver never started playing or could not
    // be polled at all.
    auto run() -> Expected<void>;

    auto set_state_observer(StateObserver observer) -> void;
    [[nodiscard]] auto state() const -> InteractiveState;
    [[nodiscard]] auto termination_reason() const -> std::string;

private:
    enum class Outcome { Continue, Terminate };

    auto connect() -> Expected<void>;
    auto play() -> Expected<void>;
    auto dispatch(Command command) -> Outcome;
    auto pause_until_toggled() -> Outcome;
    auto confirm_quit() -> Outcome;
    auto seek_by(double delta) -> void;
    auto refresh() -> Outcome;

    auto should_stop() -> bool;
    auto wait_tick(std::chrono::milliseconds duration) -> void;
    auto transition(InteractiveState next) -> void;
    auto terminate(std::string_view reason) -> void;
    auto render() -> void;
    auto write(std::string_view text) -> void;
    auto report(std::string_view action, Error const& error) -> void;

    Receiver::RemoteReceiver& receiver_;
    Session::StatusSync&      status_sync_;
    Session::Lifecycle&       lifecycle_;
    KeySource&                keys_;
    InteractiveControlOptions options_;
    LogHooks                  hooks_;
    StateObserver             observer_;

    mutable std::mutex mutex_;
    InteractiveState   state_ = InteractiveState::Connecting;
    std::string        stop_reason_;
    bool               input_closed_ = false;
};

} // namespace CR::Control
