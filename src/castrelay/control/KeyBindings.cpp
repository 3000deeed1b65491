#include "control/KeyBindings.hpp"

#include <algorithm>

namespace CR::Control {

auto commandName(Command command) -> std::string_view {
    switch (command) {
    case Command::None:
        return "none";
    case Command::VolumeUp:
        return "volume_up";
    case Command::VolumeDown:
        return "volume_down";
    case Command::SeekBackward:
        return "seek_backward";
    case Command::SeekForward:
        return "seek_forward";
    case Command::TogglePause:
        return "toggle_pause";
    case Command::Mute:
        return "mute";
    case Command::Quit:
        return "quit";
    }
    return "none";
}

auto KeyBindings::defaults() -> KeyBindings {
    KeyBindings bindings;
    bindings.bind(KeyPress::character('+'), Command::VolumeUp);
    bindings.bind(KeyPress::character('='), Command::VolumeUp);
    bindings.bind(KeyPress::special(KeyCode::Up), Command::VolumeUp);
    bindings.bind(KeyPress::character('-'), Command::VolumeDown);
    bindings.bind(KeyPress::special(KeyCode::Down), Command::VolumeDown);
    bindings.bind(KeyPress::character(','), Command::SeekBackward);
    bindings.bind(KeyPress::special(KeyCode::Left), Command::SeekBackward);
    bindings.bind(KeyPress::character('.'), Command::SeekForward);
    bindings.bind(KeyPress::special(KeyCode::Right), Command::SeekForward);
    bindings.bind(KeyPress::character(' '), Command::TogglePause);
    bindings.bind(KeyPress::character('p'), Command::TogglePause);
    bindings.bind(KeyPress::character('m'), Command::Mute);
    bindings.bind(KeyPress::character('q'), Command::Quit);
    return bindings;
}

auto KeyBindings::bind(KeyPress key, Command command) -> void {
    auto it = std::find_if(bindings_.begin(), bindings_.end(), [&](auto const& entry) { return entry.first == key; });
    if (it != bindings_.end()) {
        it->second = command;
        return;
    }
    bindings_.emplace_back(key, command);
}

auto KeyBindings::lookup(KeyPress key) const -> Command {
    auto it = std::find_if(bindings_.begin(), bindings_.end(), [&](auto const& entry) { return entry.first == key; });
    return it == bindings_.end() ? Command::None : it->second;
}

auto IsNegativeAnswer(KeyPress key) -> bool {
    return key.code == KeyCode::Character && (key.ch == 'n' || key.ch == 'N');
}

} // namespace CR::Control
