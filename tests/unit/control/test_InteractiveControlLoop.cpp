#include "CastRelayTestHelper.hpp"
#include "control/InteractiveControlLoop.hpp"
#include "http/RangeFileServer.hpp"
#include "media/MediaResource.hpp"
#include "session/Lifecycle.hpp"
#include "session/StatusSync.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace CR;
using namespace std::chrono_literals;
using Control::InteractiveState;
using Control::KeyCode;
using Control::KeyPress;

namespace {

struct LoopHarness {
    Test::FakeReceiver       receiver;
    Session::StatusSync      sync{receiver, Session::StatusSyncOptions{.max_attempts = 1, .retry_delay = 1ms}};
    Session::Lifecycle       lifecycle;
    Test::ScriptedKeySource  keys;
    std::mutex               mutex;
    std::string              output;
    std::vector<std::string> errors;
    std::vector<InteractiveState> states;

    LoopHarness() {
        lifecycle.attach_receiver(&receiver);
        receiver.set_disconnect_callback([this](std::string_view reason) { lifecycle.teardown(reason); });
    }

    auto options() -> Control::InteractiveControlOptions {
        Control::InteractiveControlOptions options;
        options.tick             = 5ms;
        options.refresh_interval = 20ms;
        options.connect_poll     = 5ms;
        options.connect_timeout  = 2000ms;
        options.bar_width        = 10;
        options.output           = [this](std::string_view text) {
            std::lock_guard<std::mutex> lock(mutex);
            output.append(text);
        };
        return options;
    }

    auto hooks() -> LogHooks {
        LogHooks hooks;
        hooks.info  = [](std::string_view) {};
        hooks.error = [this](std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.emplace_back(message);
        };
        return hooks;
    }

    auto make_loop(Control::InteractiveControlOptions loop_options) -> Control::InteractiveControlLoop {
        return Control::InteractiveControlLoop(receiver, sync, lifecycle, keys, std::move(loop_options), hooks());
    }

    auto observe(Control::InteractiveControlLoop& loop) -> void {
        loop.set_state_observer([this](InteractiveState state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
        });
    }

    auto recorded_states() -> std::vector<InteractiveState> {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }
    auto captured_output() -> std::string {
        std::lock_guard<std::mutex> lock(mutex);
        return output;
    }
};

} // namespace

TEST_SUITE("control.interactive") {

TEST_CASE("quit confirmed with y tears the session down once") {
    LoopHarness harness;
    harness.keys.push('q');
    harness.keys.push('y');
    auto loop = harness.make_loop(harness.options());
    harness.observe(loop);

    REQUIRE(loop.run());
    CHECK(loop.state() == InteractiveState::Terminated);
    CHECK(loop.termination_reason() == "quit confirmed");
    CHECK(harness.lifecycle.completed());
    CHECK(harness.lifecycle.reason() == "quit confirmed");
    CHECK(harness.receiver.count("pause") == 1);
    CHECK(harness.receiver.stop_calls() == 1);
    CHECK(harness.receiver.quit_calls() == 1);

    auto output = harness.captured_output();
    CHECK(output.find("Quit playback? [Y/n] ") != std::string::npos);
    CHECK(output.find("vol 100%  Playing") != std::string::npos);

    auto states = harness.recorded_states();
    REQUIRE(states.size() == 4);
    CHECK(states[0] == InteractiveState::Connecting);
    CHECK(states[1] == InteractiveState::Playing);
    CHECK(states[2] == InteractiveState::QuitConfirm);
    CHECK(states[3] == InteractiveState::Terminated);
}

TEST_CASE("pause ignores other keys until toggled again") {
    LoopHarness harness;
    for (char ch : std::string{" x."}) {
        harness.keys.push(ch);
    }
    harness.keys.push(KeyPress::special(KeyCode::Up));
    harness.keys.push('p');
    harness.keys.push('q');
    harness.keys.push('Y');
    auto loop = harness.make_loop(harness.options());
    harness.observe(loop);

    REQUIRE(loop.run());
    CHECK(loop.termination_reason() == "quit confirmed");
    CHECK(harness.receiver.count("pause") == 2);
    CHECK(harness.receiver.count("play") == 1);
    CHECK(harness.receiver.count("seek") == 0);
    CHECK(harness.receiver.count("adjust_volume") == 0);

    auto states = harness.recorded_states();
    REQUIRE(states.size() == 6);
    CHECK(states[2] == InteractiveState::Paused);
    CHECK(states[3] == InteractiveState::Playing);
    CHECK(states[4] == InteractiveState::QuitConfirm);
    CHECK(harness.captured_output().find("Paused") != std::string::npos);
}

TEST_CASE("declining the quit prompt resumes playback until the media ends") {
    LoopHarness harness;
    harness.keys.push('q');
    harness.keys.push('n');
    harness.receiver.set_command_hook([&](std::string const& command) {
        if (command == "play") {
            harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.is_idle = true; });
        }
    });
    auto loop = harness.make_loop(harness.options());
    harness.observe(loop);

    REQUIRE(loop.run());
    CHECK(loop.termination_reason() == "playback finished");
    CHECK(harness.receiver.count("pause") == 1);
    CHECK(harness.receiver.count("play") == 1);
    CHECK(harness.receiver.stop_calls() == 1);

    auto states = harness.recorded_states();
    REQUIRE(states.size() == 5);
    CHECK(states[2] == InteractiveState::QuitConfirm);
    CHECK(states[3] == InteractiveState::Playing);
    CHECK(states[4] == InteractiveState::Terminated);
}

TEST_CASE("seeking is clamped to the media bounds") {
    LoopHarness harness;
    harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.current_time = 590.0; });
    harness.keys.push('.');
    harness.keys.push(KeyPress::special(KeyCode::Left));
    harness.keys.push('q');
    harness.keys.push('y');
    auto loop = harness.make_loop(harness.options());

    REQUIRE(loop.run());
    auto seeks = harness.receiver.seeks();
    REQUIRE(seeks.size() == 2);
    CHECK(seeks[0] == doctest::Approx(600.0));
    CHECK(seeks[1] == doctest::Approx(570.0));
}

TEST_CASE("seeking backwards near the start lands on zero") {
    LoopHarness harness;
    harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.current_time = 10.0; });
    harness.keys.push(',');
    harness.keys.push('q');
    harness.keys.push('y');
    auto loop = harness.make_loop(harness.options());

    REQUIRE(loop.run());
    auto seeks = harness.receiver.seeks();
    REQUIRE(seeks.size() == 1);
    CHECK(seeks[0] == 0.0);
}

TEST_CASE("volume keys step the receiver volume and m mutes") {
    LoopHarness harness;
    auto        options = harness.options();
    options.volume_step = 0.1;
    harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.volume = 0.5; });
    for (char ch : std::string{"+=-m"}) {
        harness.keys.push(ch);
    }
    harness.keys.push('q');
    harness.keys.push('y');
    auto loop = harness.make_loop(options);

    REQUIRE(loop.run());
    CHECK(harness.receiver.count("adjust_volume") == 3);
    CHECK(harness.receiver.count("set_volume") == 1);
    CHECK(harness.receiver.status().volume == 0.0);
}

TEST_CASE("failed commands are reported and playback continues") {
    LoopHarness harness;
    harness.receiver.fail_command("seek", Error{Error::Code::InvalidState, "not seekable"});
    harness.keys.push('.');
    harness.keys.push('q');
    harness.keys.push('y');
    auto loop = harness.make_loop(harness.options());

    REQUIRE(loop.run());
    CHECK(loop.termination_reason() == "quit confirmed");
    std::lock_guard<std::mutex> lock(harness.mutex);
    REQUIRE(harness.errors.size() == 1);
    CHECK(harness.errors[0] == "castrelay: seek failed: invalid_state:not seekable");
}

TEST_CASE("the loop ends when the receiver goes idle") {
    LoopHarness harness;
    auto        loop = harness.make_loop(harness.options());
    harness.observe(loop);

    Expected<void> result;
    std::thread    runner([&]() { result = loop.run(); });
    REQUIRE(Test::WaitUntil([&]() { return loop.state() == InteractiveState::Playing; }));
    harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.is_idle = true; });
    runner.join();

    CHECK(result);
    CHECK(loop.termination_reason() == "playback finished");
    CHECK(harness.lifecycle.reason() == "playback finished");
    CHECK(harness.receiver.stop_calls() == 1);
}

TEST_CASE("a disconnect during the quit prompt ends the loop through one teardown") {
    LoopHarness   harness;
    Test::TempDir dir;
    auto          path      = dir.write_pattern("a.mp4", 4096);
    auto          resources = Media::ResolveMediaResourceSet(path, std::nullopt, std::nullopt, "text/vtt");
    REQUIRE(resources);
    Http::RangeFileServer::Options server_options;
    server_options.host = "127.0.0.1";
    server_options.port = 0;
    Http::RangeFileServer server(std::move(*resources), server_options);
    REQUIRE(server.start());
    harness.lifecycle.attach_server(&server);

    harness.keys.push('q');
    auto loop = harness.make_loop(harness.options());

    Expected<void> result;
    std::thread    runner([&]() { result = loop.run(); });
    REQUIRE(Test::WaitUntil([&]() { return loop.state() == InteractiveState::QuitConfirm; }));
    harness.receiver.fire_disconnect("wifi dropped");
    runner.join();

    CHECK(result);
    CHECK(loop.state() == InteractiveState::Terminated);
    CHECK(loop.termination_reason() == "wifi dropped");
    CHECK(harness.lifecycle.reason() == "wifi dropped");
    CHECK(harness.receiver.stop_calls() == 1);
    CHECK(harness.receiver.quit_calls() == 1);
    CHECK_FALSE(server.is_running());
    server.join();
}

TEST_CASE("losing contact with the receiver ends the loop") {
    LoopHarness harness;
    auto        loop = harness.make_loop(harness.options());

    Expected<void> result;
    std::thread    runner([&]() { result = loop.run(); });
    REQUIRE(Test::WaitUntil([&]() { return loop.state() == InteractiveState::Playing; }));
    harness.receiver.fail_next_polls(1000);
    runner.join();

    CHECK(result);
    CHECK(loop.termination_reason() == "lost contact with receiver: not_connected:scripted poll failure");
    CHECK(harness.lifecycle.completed());
}

TEST_CASE("the interrupt flag stops a running loop") {
    LoopHarness       harness;
    std::atomic<bool> interrupted{false};
    auto              options = harness.options();
    options.interrupt_flag    = &interrupted;
    auto loop                 = harness.make_loop(options);

    Expected<void> result;
    std::thread    runner([&]() { result = loop.run(); });
    REQUIRE(Test::WaitUntil([&]() { return loop.state() == InteractiveState::Playing; }));
    interrupted = true;
    runner.join();

    CHECK(result);
    CHECK(loop.termination_reason() == "interrupted");
    CHECK(harness.lifecycle.reason() == "interrupted");
}

TEST_CASE("closing the keyboard while paused ends the session") {
    LoopHarness harness;
    harness.keys.push(' ');
    harness.keys.push(KeyPress::special(KeyCode::EndOfInput));
    auto loop = harness.make_loop(harness.options());

    REQUIRE(loop.run());
    CHECK(loop.termination_reason() == "input closed");
    CHECK(harness.receiver.stop_calls() == 1);
}

TEST_CASE("a receiver that never starts playing fails with Timeout") {
    LoopHarness harness;
    harness.receiver.update_status([](Receiver::RemoteStatus& status) { status.is_idle = true; });
    auto options            = harness.options();
    options.connect_timeout = 50ms;
    auto loop               = harness.make_loop(options);

    auto result = loop.run();
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::Timeout);
    CHECK(result.error().message.value() == "receiver did not start playback within 50 ms");
    CHECK(loop.state() == InteractiveState::Terminated);
    CHECK(harness.lifecycle.reason() == "timeout:receiver did not start playback within 50 ms");
}

TEST_CASE("a disconnect before playback starts ends the loop quietly") {
    LoopHarness harness;
    auto        loop = harness.make_loop(harness.options());
    harness.receiver.fire_disconnect("gone before start");

    REQUIRE(loop.run());
    CHECK(loop.termination_reason() == "gone before start");
    CHECK(harness.receiver.count("seek") == 0);
}

} // TEST_SUITE
