#pragma once

#include "log/LogHooks.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace CR::Receiver {
class RemoteReceiver;
}

namespace CR::Http {
class RangeFileServer;
}

namespace CR::Session {

// Single-shot session teardown shared by the control loop and the receiver's disconnect
// callback. The first teardown() does the work; concurrent callers block until it is finished;
// later callers return at once.
class Lifecycle {
public:
    explicit Lifecycle(LogHooks hooks = {});

    Lifecycle(Lifecycle const&)                    = delete;
    auto operator=(Lifecycle const&) -> Lifecycle& = delete;

    auto attach_receiver(Receiver::RemoteReceiver* receiver) -> void;
    auto attach_server(Http::RangeFileServer* server) -> void;
    auto set_terminal_restore(std::function<void()> restore) -> void;

    auto teardown(std::string_view reason) -> void;

    // True as soon as a teardown has begun.
    [[nodiscard]] auto done() const -> bool;
    [[nodiscard]] auto completed() const -> bool;
    [[nodiscard]] auto reason() const -> std::string;
    // False on timeout.
    auto wait_for(std::chrono::milliseconds timeout) const -> bool;

private:
    auto perform() -> void;

    LogHooks                  hooks_;
    Receiver::RemoteReceiver* receiver_ = nullptr;
    Http::RangeFileServer*    server_   = nullptr;
    std::function<void()>     restore_terminal_;

    std::once_flag                  once_;
    std::atomic<bool>               done_{false};
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    bool                            completed_ = false;
    std::string                     reason_;
};

} // namespace CR::Session
