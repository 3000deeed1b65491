#pragma once

#include "receiver/RemoteReceiver.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace CR::Receiver {

// In-process stand-in for a playback device. It fetches the media URL over HTTP the way a real
// receiver does (HEAD probe, then ranged GETs restarted on every seek) and advances a simulated
// play head with the clock.
class LoopbackReceiver final : public RemoteReceiver {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Options {
        double                    media_duration = 60.0;
        std::chrono::milliseconds startup_delay{0};
        bool                      fetch_media    = true;
        double                    initial_volume = 1.0;
        NowFn                     now; // defaults to steady_clock::now
    };

    LoopbackReceiver();
    explicit LoopbackReceiver(Options options);
    ~LoopbackReceiver() override;

    LoopbackReceiver(LoopbackReceiver const&)                    = delete;
    auto operator=(LoopbackReceiver const&) -> LoopbackReceiver& = delete;

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

    // Marks the device unreachable and fires the disconnect callback on a receiver thread.
    auto simulate_disconnect(std::string reason) -> void;
    // While unreachable every command fails with NotConnected.
    auto set_reachable(bool reachable) -> void;
    // The next `count` polls fail with NotConnected.
    auto fail_next_polls(int count) -> void;

    [[nodiscard]] auto last_request() const -> std::optional<PlayMediaRequest>;
    [[nodiscard]] auto probe_status() const -> int;
    [[nodiscard]] auto bytes_fetched() const -> std::uint64_t;
    [[nodiscard]] auto range_requests() const -> std::vector<std::string>;
    [[nodiscard]] auto commands() const -> std::vector<std::string>;

private:
    [[nodiscard]] auto now() const -> Clock::time_point;
    [[nodiscard]] auto position_locked(Clock::time_point at) const -> double;
    auto require_reachable_locked(std::string_view command) -> Expected<void>;
    auto require_session_locked(std::string_view command) -> Expected<void>;
    auto anchor_locked(double position, bool playing) -> void;
    auto end_session_locked() -> void;
    auto stop_fetcher() -> void;
    auto fetch_loop(std::string base, std::string path, std::uint64_t session) -> void;

    Options options_;

    mutable std::mutex      mutex_;
    std::condition_variable fetch_cv_;
    bool                    reachable_     = true;
    int                     failing_polls_ = 0;
    bool                    has_session_   = false;
    std::uint64_t           session_id_    = 0;
    Clock::time_point       active_at_{};
    double                  anchor_position_ = 0.0;
    Clock::time_point       anchor_at_{};
    bool                    playing_ = false;
    double                  volume_  = 1.0;

    std::optional<PlayMediaRequest> last_request_;
    int                             probe_status_   = 0;
    std::uint64_t                   content_length_ = 0;
    std::uint64_t                   fetch_offset_   = 0;
    std::uint64_t                   seek_generation_ = 0;
    std::uint64_t                   bytes_fetched_  = 0;
    std::vector<std::string>        range_requests_;
    std::vector<std::string>        commands_;

    std::mutex         fetcher_mutex_;
    std::thread        fetcher_;
    std::mutex         callback_mutex_;
    DisconnectCallback disconnect_callback_;
    std::thread        notifier_;
};

} // namespace CR::Receiver
