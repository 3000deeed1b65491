#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <termios.h>

namespace CR::Control {

enum class KeyCode {
    Character,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    EndOfInput,
};

struct KeyPress {
    KeyCode code = KeyCode::Character;
    char    ch   = 0;

    auto operator==(KeyPress const&) const -> bool = default;

    static auto character(char c) -> KeyPress { return KeyPress{KeyCode::Character, c}; }
    static auto special(KeyCode code) -> KeyPress { return KeyPress{code, 0}; }
};

class KeySource {
public:
    virtual ~KeySource() = default;
    // Waits at most `timeout` for a key; a zero timeout never blocks.
    virtual auto poll_key(std::chrono::milliseconds timeout) -> std::optional<KeyPress> = 0;
};

// Splits raw terminal bytes into key presses, recognising ANSI arrow sequences.
[[nodiscard]] auto DecodeKeys(std::string_view bytes) -> std::vector<KeyPress>;

// Raw-mode keyboard on a file descriptor (canonical mode and echo off). The previous terminal
// settings come back on restore() or destruction, whichever comes first.
class TerminalInput final : public KeySource {
public:
    explicit TerminalInput(int fd = 0);
    ~TerminalInput() override;

    TerminalInput(TerminalInput const&)                    = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;

    // Fails with NotSupported when fd is not a terminal; keys can still be polled then.
    auto activate() -> Expected<void>;
    // Idempotent and safe from any thread.
    auto restore() -> void;
    [[nodiscard]] auto active() const -> bool;

    auto poll_key(std::chrono::milliseconds timeout) -> std::optional<KeyPress> override;

private:
    auto wait_readable(std::chrono::milliseconds timeout) -> bool;

    int                  fd_;
    mutable std::mutex   mutex_;
    bool                 active_ = false;
    termios              original_{};
    std::deque<KeyPress> pending_;
    bool                 eof_ = false;
};

} // namespace CR::Control
