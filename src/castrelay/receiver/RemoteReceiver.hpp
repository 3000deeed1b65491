#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace CR::Receiver {

// Authoritative snapshot from one poll. Never modified locally.
struct RemoteStatus {
    bool                  is_idle      = true;
    double                current_time = 0.0; // seconds
    double                volume       = 1.0; // [0, 1]
    bool                  connected    = false;
    bool                  is_paused    = false;
    std::optional<double> duration;
};

struct PlayMediaRequest {
    std::string                url;
    std::string                mime_type;
    std::optional<std::string> subtitles_url;
    std::optional<std::string> subtitles_mime;
    std::string                title;
};

using DisconnectCallback = std::function<void(std::string_view reason)>;

// Transport controls of one remote playback device. Calls are synchronous and may block for a
// network round trip. An unreachable device reports Error::Code::NotConnected.
class RemoteReceiver {
public:
    virtual ~RemoteReceiver() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    // Blocks until the device accepts commands.
    virtual auto wait(std::chrono::milliseconds timeout) -> Expected<void> = 0;
    virtual auto play_media(PlayMediaRequest const& request) -> Expected<void> = 0;
    // Blocks until the media session the last play_media started is active.
    virtual auto block_until_active(std::chrono::milliseconds timeout) -> Expected<void> = 0;
    virtual auto poll_status() -> Expected<RemoteStatus> = 0;

    virtual auto seek(double seconds) -> Expected<void> = 0;
    virtual auto play() -> Expected<void> = 0;
    virtual auto pause() -> Expected<void> = 0;
    // Relative change, clamped by the device to [0, 1].
    virtual auto adjust_volume(double delta) -> Expected<void> = 0;
    virtual auto set_volume(double level) -> Expected<void> = 0;
    virtual auto stop() -> Expected<void> = 0;
    // Ends the media session on the device.
    virtual auto quit() -> Expected<void> = 0;

    // May be invoked from a receiver-owned thread at any time after registration.
    virtual auto set_disconnect_callback(DisconnectCallback callback) -> void = 0;
};

} // namespace CR::Receiver
