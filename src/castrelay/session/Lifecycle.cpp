#include "session/Lifecycle.hpp"

#include "http/RangeFileServer.hpp"
#include "log/TaggedLogger.hpp"
#include "receiver/RemoteReceiver.hpp"

#include <utility>

namespace CR::Session {

Lifecycle::Lifecycle(LogHooks hooks)
    : hooks_(std::move(hooks)) {}

auto Lifecycle::attach_receiver(Receiver::RemoteReceiver* receiver) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    receiver_ = receiver;
}

auto Lifecycle::attach_server(Http::RangeFileServer* server) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    server_ = server;
}

auto Lifecycle::set_terminal_restore(std::function<void()> restore) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    restore_terminal_ = std::move(restore);
}

auto Lifecycle::teardown(std::string_view reason) -> void {
    std::call_once(once_, [&]() {
        done_.store(true);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reason_ = std::string{reason};
        }
        cr_log("Teardown: " + std::string{reason}, "Lifecycle");
        perform();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_ = true;
        }
        cv_.notify_all();
    });
}

auto Lifecycle::perform() -> void {
    Receiver::RemoteReceiver* receiver = nullptr;
    Http::RangeFileServer*    server   = nullptr;
    std::function<void()>     restore;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        receiver = receiver_;
        server   = server_;
        restore  = restore_terminal_;
    }

    // The receiver may already be gone; its failures never stop the rest of the teardown.
    if (receiver != nullptr) {
        if (auto stopped = receiver->stop(); !stopped) {
            emit_error(hooks_, "castrelay: receiver stop failed: " + describeError(stopped.error()));
        }
        if (auto quit = receiver->quit(); !quit) {
            emit_error(hooks_, "castrelay: receiver quit failed: " + describeError(quit.error()));
        }
    }
    if (server != nullptr) {
        server->stop();
    }
    if (restore) {
        restore();
    }
}

auto Lifecycle::done() const -> bool {
    return done_.load();
}

auto Lifecycle::completed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

auto Lifecycle::reason() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

auto Lifecycle::wait_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return completed_; });
}

} // namespace CR::Session
