#include "control/TerminalInput.hpp"

#include "log/TaggedLogger.hpp"

#include <array>
#include <cerrno>

#include <poll.h>
#include <unistd.h>

namespace CR::Control {

namespace {

constexpr char                      kEscape = '\x1b';
constexpr std::chrono::milliseconds kSequenceGrace{30};

} // namespace

auto DecodeKeys(std::string_view bytes) -> std::vector<KeyPress> {
    std::vector<KeyPress> keys;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        char ch = bytes[i];
        if (ch == kEscape) {
            if (i + 2 < bytes.size() && (bytes[i + 1] == '[' || bytes[i + 1] == 'O')) {
                switch (bytes[i + 2]) {
                case 'A':
                    keys.push_back(KeyPress::special(KeyCode::Up));
                    break;
                case 'B':
                    keys.push_back(KeyPress::special(KeyCode::Down));
                    break;
                case 'C':
                    keys.push_back(KeyPress::special(KeyCode::Right));
                    break;
                case 'D':
                    keys.push_back(KeyPress::special(KeyCode::Left));
                    break;
                default:
                    keys.push_back(KeyPress::special(KeyCode::Escape));
                    break;
                }
                i += 2;
                continue;
            }
            keys.push_back(KeyPress::special(KeyCode::Escape));
            continue;
        }
        if (ch == '\r' || ch == '\n') {
            keys.push_back(KeyPress::special(KeyCode::Enter));
            continue;
        }
        keys.push_back(KeyPress::character(ch));
    }
    return keys;
}

TerminalInput::TerminalInput(int fd)
    : fd_(fd) {}

TerminalInput::~TerminalInput() {
    restore();
}

auto TerminalInput::activate() -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        return {};
    }
    if (!isatty(fd_)) {
        return std::unexpected(Error{Error::Code::NotSupported, "input is not a terminal"});
    }
    if (tcgetattr(fd_, &original_) == -1) {
        return std::unexpected(Error{Error::Code::IoError, "tcgetattr failed"});
    }
    termios raw = original_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSAFLUSH, &raw) == -1) {
        return std::unexpected(Error{Error::Code::IoError, "tcsetattr failed"});
    }
    active_ = true;
    cr_log("Terminal switched to raw mode", "TerminalInput");
    return {};
}

auto TerminalInput::restore() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return;
    }
    tcsetattr(fd_, TCSAFLUSH, &original_);
    active_ = false;
    cr_log("Terminal restored", "TerminalInput");
}

auto TerminalInput::active() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

auto TerminalInput::wait_readable(std::chrono::milliseconds timeout) -> bool {
    pollfd descriptor{.fd = fd_, .events = POLLIN, .revents = 0};
    int    ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    return ready > 0 && (descriptor.revents & (POLLIN | POLLHUP)) != 0;
}

auto TerminalInput::poll_key(std::chrono::milliseconds timeout) -> std::optional<KeyPress> {
    if (!pending_.empty()) {
        auto key = pending_.front();
        pending_.pop_front();
        return key;
    }
    if (eof_) {
        return KeyPress::special(KeyCode::EndOfInput);
    }
    if (!wait_readable(timeout)) {
        return std::nullopt;
    }

    std::array<char, 16> buffer{};
    auto                 count = ::read(fd_, buffer.data(), buffer.size());
    if (count < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return std::nullopt;
        }
        eof_ = true;
        return KeyPress::special(KeyCode::EndOfInput);
    }
    if (count == 0) {
        eof_ = true;
        return KeyPress::special(KeyCode::EndOfInput);
    }

    std::string bytes(buffer.data(), static_cast<std::size_t>(count));
    // An escape sequence can straddle two reads.
    while (bytes.back() == kEscape || (bytes.size() >= 2 && bytes[bytes.size() - 2] == kEscape && bytes.back() == '[')) {
        if (!wait_readable(kSequenceGrace)) {
            break;
        }
        auto more = ::read(fd_, buffer.data(), buffer.size());
        if (more <= 0) {
            break;
        }
        bytes.append(buffer.data(), static_cast<std::size_t>(more));
    }

    for (auto const& key : DecodeKeys(bytes)) {
        pending_.push_back(key);
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto key = pending_.front();
    pending_.pop_front();
    return key;
}

} // namespace CR::Control
