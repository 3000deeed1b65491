#include "receiver/LoopbackReceiver.hpp"

#include "log/TaggedLogger.hpp"
#include "receiver/HttpUrl.hpp"

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <algorithm>
#include <charconv>
#include <utility>

namespace CR::Receiver {

namespace {

constexpr std::chrono::milliseconds kFetchRetryDelay{200};
constexpr std::chrono::milliseconds kActivePollInterval{10};

auto not_connected(std::string_view command) -> Error {
    return Error{Error::Code::NotConnected, "loopback receiver unreachable during " + std::string{command}};
}

auto parse_length(std::string const& text) -> std::uint64_t {
    std::uint64_t value  = 0;
    auto          result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{}) {
        return 0;
    }
    return value;
}

} // namespace

LoopbackReceiver::LoopbackReceiver()
    : LoopbackReceiver(Options{}) {}

LoopbackReceiver::LoopbackReceiver(Options options)
    : options_(std::move(options)) {
    volume_ = std::clamp(options_.initial_volume, 0.0, 1.0);
}

LoopbackReceiver::~LoopbackReceiver() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        end_session_locked();
    }
    stop_fetcher();
    if (notifier_.joinable()) {
        notifier_.join();
    }
}

auto LoopbackReceiver::name() const -> std::string {
    return "loopback";
}

auto LoopbackReceiver::now() const -> Clock::time_point {
    if (options_.now) {
        return options_.now();
    }
    return Clock::now();
}

auto LoopbackReceiver::position_locked(Clock::time_point at) const -> double {
    if (!has_session_) {
        return 0.0;
    }
    double position = anchor_position_;
    if (playing_ && at > anchor_at_) {
        position += std::chrono::duration<double>(at - anchor_at_).count();
    }
    return std::clamp(position, 0.0, options_.media_duration);
}

auto LoopbackReceiver::require_reachable_locked(std::string_view command) -> Expected<void> {
    if (!reachable_) {
        return std::unexpected(not_connected(command));
    }
    commands_.emplace_back(command);
    return {};
}

auto LoopbackReceiver::require_session_locked(std::string_view command) -> Expected<void> {
    if (auto reachable = require_reachable_locked(command); !reachable) {
        return reachable;
    }
    if (!has_session_) {
        return std::unexpected(Error{Error::Code::InvalidState, std::string{command} + " without a media session"});
    }
    return {};
}

auto LoopbackReceiver::anchor_locked(double position, bool playing) -> void {
    anchor_position_ = std::clamp(position, 0.0, options_.media_duration);
    anchor_at_       = std::max(now(), active_at_);
    playing_         = playing;
}

auto LoopbackReceiver::end_session_locked() -> void {
    has_session_ = false;
    playing_     = false;
    fetch_cv_.notify_all();
}

auto LoopbackReceiver::stop_fetcher() -> void {
    std::lock_guard<std::mutex> lock(fetcher_mutex_);
    if (fetcher_.joinable()) {
        fetcher_.join();
    }
}

auto LoopbackReceiver::wait(std::chrono::milliseconds timeout) -> Expected<void> {
    auto deadline = Clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reachable_) {
                commands_.emplace_back("wait");
                return {};
            }
        }
        if (Clock::now() >= deadline) {
            return std::unexpected(Error{Error::Code::Timeout, "loopback receiver did not come online"});
        }
        std::this_thread::sleep_for(kActivePollInterval);
    }
}

auto LoopbackReceiver::play_media(PlayMediaRequest const& request) -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto reachable = require_reachable_locked("play_media"); !reachable) {
            return reachable;
        }
        end_session_locked();
    }
    stop_fetcher();

    auto url = ParseHttpUrl(request.url);
    if (!url) {
        return std::unexpected(url.error());
    }

    httplib::Client client(url->scheme_host_port);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(2, 0);
    auto probe = client.Head(url->path);
    if (!probe) {
        return std::unexpected(Error{Error::Code::NotConnected,
                                     "media probe failed: " + httplib::to_string(probe.error())});
    }

    std::uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        probe_status_ = probe->status;
        if (probe->status != 200) {
            return std::unexpected(Error{Error::Code::NotFound,
                                         "media probe returned " + std::to_string(probe->status)});
        }
        content_length_ = parse_length(probe->get_header_value("Content-Length"));
        last_request_   = request;
        session         = ++session_id_;
        has_session_    = true;
        active_at_      = now() + options_.startup_delay;
        fetch_offset_   = 0;
        ++seek_generation_;
        anchor_locked(0.0, true);
    }
    cr_log("Loopback receiver playing " + request.url, "LoopbackReceiver");

    if (options_.fetch_media) {
        std::lock_guard<std::mutex> fetch_lock(fetcher_mutex_);
        if (fetcher_.joinable()) {
            fetcher_.join();
        }
        fetcher_ = std::thread(&LoopbackReceiver::fetch_loop, this, url->scheme_host_port, url->path, session);
    }
    return {};
}

auto LoopbackReceiver::fetch_loop(std::string base, std::string path, std::uint64_t session) -> void {
    httplib::Client client(base);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(5, 0);

    auto still_current = [&](std::uint64_t generation) {
        return has_session_ && session_id_ == session && seek_generation_ == generation;
    };

    while (true) {
        std::uint64_t generation = 0;
        std::uint64_t offset     = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!has_session_ || session_id_ != session) {
                return;
            }
            if (content_length_ > 0 && fetch_offset_ >= content_length_) {
                auto seen = seek_generation_;
                fetch_cv_.wait(lock, [&]() {
                    return !has_session_ || session_id_ != session || seek_generation_ != seen;
                });
                continue;
            }
            generation = seek_generation_;
            offset     = fetch_offset_;
            range_requests_.push_back("bytes=" + std::to_string(offset) + "-");
        }

        httplib::Headers headers{{"Range", "bytes=" + std::to_string(offset) + "-"}};
        auto result = client.Get(path, headers, [&](char const*, std::size_t length) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!still_current(generation)) {
                return false;
            }
            bytes_fetched_ += length;
            fetch_offset_ += length;
            return true;
        });

        std::unique_lock<std::mutex> lock(mutex_);
        if (!result) {
            if (result.error() == httplib::Error::Canceled) {
                cr_log("Loopback fetch abandoned after seek", "LoopbackReceiver");
                continue;
            }
            cr_log("Loopback fetch failed: " + httplib::to_string(result.error()), "LoopbackReceiver");
            fetch_cv_.wait_for(lock, kFetchRetryDelay, [&]() { return !still_current(generation); });
            continue;
        }
        if (result->status != 206 && result->status != 200) {
            cr_log("Loopback fetch got status " + std::to_string(result->status), "LoopbackReceiver");
            fetch_cv_.wait_for(lock, kFetchRetryDelay, [&]() { return !still_current(generation); });
            continue;
        }
        if (content_length_ == 0) {
            // Length unknown: one complete read is all there is until the next seek.
            fetch_cv_.wait(lock, [&]() { return !still_current(generation); });
        }
    }
}

auto LoopbackReceiver::block_until_active(std::chrono::milliseconds timeout) -> Expected<void> {
    auto deadline = Clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reachable_) {
                return std::unexpected(not_connected("block_until_active"));
            }
            if (!has_session_) {
                return std::unexpected(Error{Error::Code::InvalidState, "no media session to wait for"});
            }
            if (now() >= active_at_) {
                return {};
            }
        }
        if (Clock::now() >= deadline) {
            return std::unexpected(Error{Error::Code::Timeout, "media session did not become active"});
        }
        std::this_thread::sleep_for(kActivePollInterval);
    }
}

auto LoopbackReceiver::poll_status() -> Expected<RemoteStatus> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reachable_) {
        return std::unexpected(not_connected("poll_status"));
    }
    if (failing_polls_ > 0) {
        --failing_polls_;
        return std::unexpected(not_connected("poll_status"));
    }
    auto const at = now();
    RemoteStatus status;
    status.connected = true;
    status.volume    = volume_;
    if (has_session_ && at >= active_at_ && position_locked(at) >= options_.media_duration) {
        cr_log("Loopback media reached its end", "LoopbackReceiver");
        anchor_position_ = options_.media_duration;
        end_session_locked();
        status.current_time = options_.media_duration;
        return status;
    }
    status.is_idle      = !has_session_ || at < active_at_;
    status.current_time = position_locked(at);
    status.is_paused    = has_session_ && !playing_;
    if (has_session_) {
        status.duration = options_.media_duration;
    }
    return status;
}

auto LoopbackReceiver::seek(double seconds) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ok = require_session_locked("seek"); !ok) {
        return ok;
    }
    anchor_locked(seconds, playing_);
    if (content_length_ > 0 && options_.media_duration > 0.0) {
        auto fraction = anchor_position_ / options_.media_duration;
        auto offset   = static_cast<std::uint64_t>(fraction * static_cast<double>(content_length_));
        fetch_offset_ = std::min(offset, content_length_ - 1);
    }
    ++seek_generation_;
    fetch_cv_.notify_all();
    return {};
}

auto LoopbackReceiver::play() -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ok = require_session_locked("play"); !ok) {
        return ok;
    }
    anchor_locked(position_locked(now()), true);
    return {};
}

auto LoopbackReceiver::pause() -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ok = require_session_locked("pause"); !ok) {
        return ok;
    }
    anchor_locked(position_locked(now()), false);
    return {};
}

auto LoopbackReceiver::adjust_volume(double delta) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ok = require_reachable_locked("adjust_volume"); !ok) {
        return ok;
    }
    volume_ = std::clamp(volume_ + delta, 0.0, 1.0);
    return {};
}

auto LoopbackReceiver::set_volume(double level) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ok = require_reachable_locked("set_volume"); !ok) {
        return ok;
    }
    volume_ = std::clamp(level, 0.0, 1.0);
    return {};
}

auto LoopbackReceiver::stop() -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto ok = require_reachable_locked("stop"); !ok) {
            return ok;
        }
        end_session_locked();
    }
    stop_fetcher();
    return {};
}

auto LoopbackReceiver::quit() -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto ok = require_reachable_locked("quit"); !ok) {
            return ok;
        }
        end_session_locked();
    }
    stop_fetcher();
    return {};
}

auto LoopbackReceiver::set_disconnect_callback(DisconnectCallback callback) -> void {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    disconnect_callback_ = std::move(callback);
}

auto LoopbackReceiver::simulate_disconnect(std::string reason) -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reachable_ = false;
        end_session_locked();
    }
    DisconnectCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = disconnect_callback_;
        if (notifier_.joinable()) {
            notifier_.join();
        }
        if (callback) {
            notifier_ = std::thread([callback = std::move(callback), reason = std::move(reason)]() {
                callback(reason);
            });
        }
    }
}

auto LoopbackReceiver::set_reachable(bool reachable) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_ = reachable;
}

auto LoopbackReceiver::fail_next_polls(int count) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_polls_ = count;
}

auto LoopbackReceiver::last_request() const -> std::optional<PlayMediaRequest> {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
}

auto LoopbackReceiver::probe_status() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_status_;
}

auto LoopbackReceiver::bytes_fetched() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_fetched_;
}

auto LoopbackReceiver::range_requests() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return range_requests_;
}

auto LoopbackReceiver::commands() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
}

} // namespace CR::Receiver
