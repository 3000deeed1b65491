#pragma once

#include "receiver/RemoteReceiver.hpp"

#include "nlohmann/json.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace CR::Receiver {

// Drives a Kodi media center through its JSON-RPC over HTTP interface (POST /jsonrpc).
class KodiReceiver final : public RemoteReceiver {
public:
    struct Options {
        std::string               host = "127.0.0.1";
        int                       port = 8080;
        std::string               user;
        std::string               password;
        std::chrono::milliseconds request_timeout{2000};
        std::chrono::milliseconds heartbeat_interval{1000};
        int                       heartbeat_failures = 3; // consecutive failed pings before disconnect
    };

    explicit KodiReceiver(Options options);
    ~KodiReceiver() override;

    KodiReceiver(KodiReceiver const&)                    = delete;
    auto operator=(KodiReceiver const&) -> KodiReceiver& = delete;

    [[nodiscard]] auto name() const -> std::string override;

    auto wait(std::chrono::milliseconds timeout) -> Expected<void> override;
    auto play_media(PlayMediaRequest const& request) -> Expected<void> override;
    auto block_until_active(std::chrono::milliseconds timeout) -> Expected<void> override;
    auto poll_status() -> Expected<RemoteStatus> override;

    auto seek(double seconds) -> Expected<void> override;
    auto play() -> Expected<void> override;
    auto pause() -> Expected<void> override;
    auto adjust_volume(double delta) -> Expected<void> override;
    auto set_volume(double level) -> Expected<void> override;
    auto stop() -> Expected<void> override;
    auto quit() -> Expected<void> override;

    auto set_disconnect_callback(DisconnectCallback callback) -> void override;

    // One JSON-RPC round trip. Returns the "result" member.
    auto call(std::string const& method, nlohmann::json params = nlohmann::json::object()) -> Expected<nlohmann::json>;

private:
    auto active_player() -> Expected<std::optional<int>>;
    auto require_player() -> Expected<int>;
    auto read_volume() -> Expected<double>;
    auto start_heartbeat() -> void;
    auto stop_heartbeat() -> void;
    auto heartbeat_loop() -> void;

    Options           options_;
    std::atomic<long> next_id_{1};

    std::mutex                 pending_mutex_;
    std::optional<std::string> pending_subtitles_;

    std::mutex              heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    bool                    heartbeat_stop_ = false;
    std::thread             heartbeat_;

    std::mutex         callback_mutex_;
    DisconnectCallback disconnect_callback_;
};

// Kodi expresses positions as {hours, minutes, seconds, milliseconds}.
[[nodiscard]] auto ToKodiTime(double seconds) -> nlohmann::json;
[[nodiscard]] auto FromKodiTime(nlohmann::json const& time) -> double;

} // namespace CR::Receiver
