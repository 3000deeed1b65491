#pragma once

#include "control/TerminalInput.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace CR::Control {

enum class Command {
    None,
    VolumeUp,
    VolumeDown,
    SeekBackward,
    SeekForward,
    TogglePause,
    Mute,
    Quit,
};

[[nodiscard]] auto commandName(Command command) -> std::string_view;

class KeyBindings {
public:
    // +/= and Up raise the volume, - and Down lower it, Left/, and Right/. seek,
    // Space/p toggles pause, m mutes, q quits.
    [[nodiscard]] static auto defaults() -> KeyBindings;

    auto bind(KeyPress key, Command command) -> void;
    [[nodiscard]] auto lookup(KeyPress key) const -> Command;

private:
    std::vector<std::pair<KeyPress, Command>> bindings_;
};

// "n"/"N" at the quit prompt keeps playing.
[[nodiscard]] auto IsNegativeAnswer(KeyPress key) -> bool;

} // namespace CR::Control
