#pragma once

#include "control/TerminalInput.hpp"
#include "receiver/RemoteReceiver.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace CR::Test {

// Byte i of a pattern file is i % 251, so any slice can be checked without reading the file.
inline auto PatternByte(std::uint64_t offset) -> char {
    return static_cast<char>(offset % 251);
}

inline auto PatternSlice(std::uint64_t first, std::uint64_t last) -> std::string {
    std::string bytes;
    bytes.reserve(static_cast<std::size_t>(last - first + 1));
    for (auto offset = first; offset <= last; ++offset) {
        bytes.push_back(PatternByte(offset));
    }
    return bytes;
}

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto name = "castrelay-test-" + std::to_string(rd()) + "-" + std::to_string(rd());
        path_     = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const&)                    = delete;
    auto operator=(TempDir const&) -> TempDir& = delete;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }

    auto write(std::string const& name, std::string const& contents) const -> std::string {
        auto          target = path_ / name;
        std::ofstream out(target, std::ios::binary);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        return target.string();
    }

    auto write_pattern(std::string const& name, std::uint64_t size) const -> std::string {
        auto          target = path_ / name;
        std::ofstream out(target, std::ios::binary);
        std::string   block;
        block.reserve(1 << 16);
        for (std::uint64_t offset = 0; offset < size; ++offset) {
            block.push_back(PatternByte(offset));
            if (block.size() == (1u << 16)) {
                out.write(block.data(), static_cast<std::streamsize>(block.size()));
                block.clear();
            }
        }
        out.write(block.data(), static_cast<std::streamsize>(block.size()));
        return target.string();
    }

private:
    std::filesystem::path path_;
};

inline auto WaitUntil(std::function<bool()> const& predicate,
                      std::chrono::milliseconds    timeout = std::chrono::milliseconds{3000}) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    return predicate();
}

// Keys handed to the control loops one at a time. An empty script waits out the timeout.
class ScriptedKeySource final : public Control::KeySource {
public:
    auto push(Control::KeyPress key) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        keys_.push_back(key);
    }
    auto push(char ch) -> void { push(Control::KeyPress::character(ch)); }

    auto poll_key(std::chrono::milliseconds timeout) -> std::optional<Control::KeyPress> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++polls_;
            if (!keys_.empty()) {
                auto key = keys_.front();
                keys_.pop_front();
                return key;
            }
        }
        if (timeout.count() > 0) {
            std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds{5}));
        }
        return std::nullopt;
    }

    [[nodiscard]] auto pending() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return keys_.size();
    }
    [[nodiscard]] auto polls() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return polls_;
    }

private:
    mutable std::mutex                  mutex_;
    std::deque<Control::KeyPress>       keys_;
    int                                 polls_ = 0;
};

// Receiver with a scripted status. Every command is recorded by name; stop() and quit() leave
// the receiver idle.
class FakeReceiver final : public Receiver::RemoteReceiver {
public:
    using CommandHook = std::function<void(std::string const&)>;

    FakeReceiver() {
        status_.is_idle   = false;
        status_.connected = true;
        status_.duration  = 600.0;
    }

    [[nodiscard]] auto name() const -> std::string override { return "fake"; }

    auto wait(std::chrono::milliseconds) -> Expected<void> override { return record("wait"); }
    auto play_media(Receiver::PlayMediaRequest const& request) -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_request_ = request;
        }
        return record("play_media");
    }
    auto block_until_active(std::chrono::milliseconds) -> Expected<void> override {
        return record("block_until_active");
    }
    auto poll_status() -> Expected<Receiver::RemoteStatus> override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++polls_;
        if (failing_polls_ > 0) {
            --failing_polls_;
            return std::unexpected(Error{Error::Code::NotConnected, "scripted poll failure"});
        }
        if (!reachable_) {
            return std::unexpected(Error{Error::Code::NotConnected, "unreachable"});
        }
        return status_;
    }

    auto seek(double seconds) -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.current_time = seconds;
            seeks_.push_back(seconds);
        }
        return record("seek");
    }
    auto play() -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.is_paused = false;
        }
        return record("play");
    }
    auto pause() -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.is_paused = true;
        }
        return record("pause");
    }
    auto adjust_volume(double delta) -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.volume = std::clamp(status_.volume + delta, 0.0, 1.0);
        }
        return record("adjust_volume");
    }
    auto set_volume(double level) -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.volume = std::clamp(level, 0.0, 1.0);
        }
        return record("set_volume");
    }
    auto stop() -> Expected<void> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.is_idle = true;
        }
        stop_calls_.fetch_add(1);
        return record("stop");
    }
    auto quit() -> Expected<void> override {
        quit_calls_.fetch_add(1);
        return record("quit");
    }

    auto set_disconnect_callback(Receiver::DisconnectCallback callback) -> void override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    // Fires the registered disconnect callback on the calling thread, then stops answering polls.
    auto fire_disconnect(std::string_view reason) -> void {
        Receiver::DisconnectCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(reason);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        reachable_ = false;
    }

    auto set_status(Receiver::RemoteStatus status) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    auto update_status(std::function<void(Receiver::RemoteStatus&)> const& edit) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        edit(status_);
    }
    auto fail_next_polls(int count) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_polls_ = count;
    }
    auto fail_command(std::string const& command, Error error) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.insert_or_assign(command, std::move(error));
    }
    auto set_command_hook(CommandHook hook) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    [[nodiscard]] auto status() const -> Receiver::RemoteStatus {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }
    [[nodiscard]] auto commands() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }
    [[nodiscard]] auto count(std::string const& command) const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(commands_.begin(), commands_.end(), command));
    }
    [[nodiscard]] auto seeks() const -> std::vector<double> {
        std::lock_guard<std::mutex> lock(mutex_);
        return seeks_;
    }
    [[nodiscard]] auto polls() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return polls_;
    }
    [[nodiscard]] auto last_request() const -> std::optional<Receiver::PlayMediaRequest> {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }
    [[nodiscard]] auto stop_calls() const -> int { return stop_calls_.load(); }
    [[nodiscard]] auto quit_calls() const -> int { return quit_calls_.load(); }

private:
    auto record(std::string const& command) -> Expected<void> {
        CommandHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
            hook = hook_;
            if (auto it = failures_.find(command); it != failures_.end()) {
                return std::unexpected(it->second);
            }
        }
        if (hook) {
            hook(command);
        }
        return {};
    }

    mutable std::mutex                        mutex_;
    Receiver::RemoteStatus                    status_;
    bool                                      reachable_     = true;
    int                                       failing_polls_ = 0;
    int                                       polls_         = 0;
    std::vector<std::string>                  commands_;
    std::vector<double>                       seeks_;
    std::map<std::string, Error>              failures_;
    std::optional<Receiver::PlayMediaRequest> last_request_;
    Receiver::DisconnectCallback              callback_;
    CommandHook                               hook_;
    std::atomic<int>                          stop_calls_{0};
    std::atomic<int>                          quit_calls_{0};
};

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = std::string(existing);
        }
        if (value) {
            setenv(key_.c_str(), value, 1);
        } else {
            unsetenv(key_.c_str());
        }
    }
    ~EnvGuard() {
        if (original_) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    EnvGuard(EnvGuard const&)                    = delete;
    auto operator=(EnvGuard const&) -> EnvGuard& = delete;

private:
    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace CR::Test
