#pragma once

#include "core/Error.hpp"
#include "http/RangeFileServer.hpp"
#include "log/LogHooks.hpp"
#include "media/MediaResource.hpp"
#include "receiver/RemoteReceiver.hpp"
#include "session/HostAddress.hpp"
#include "session/Lifecycle.hpp"
#include "session/StatusSync.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace CR::Session {

struct PlaybackSessionOptions {
    Http::RangeFileServer::Options server;
    std::string                    title;
    std::optional<std::string>     advertise_host; // skips the outbound address probe
    std::string                    probe_host{kDefaultProbeHost};
    std::uint16_t                  probe_port = kDefaultProbePort;
    std::chrono::milliseconds      receiver_ready_timeout{10000};
    std::chrono::milliseconds      active_timeout{30000};
    StatusSyncOptions              status_sync;
};

// Serves the media set and hands its URL to the receiver. Owns the server, the status sync and
// the lifecycle of one cast.
class PlaybackSession {
public:
    PlaybackSession(Media::MediaResourceSet   resources,
                    Receiver::RemoteReceiver& receiver,
                    PlaybackSessionOptions    options,
                    LogHooks                  hooks = {});
    ~PlaybackSession();

    PlaybackSession(PlaybackSession const&)                    = delete;
    auto operator=(PlaybackSession const&) -> PlaybackSession& = delete;

    // Returns once the receiver reports an active media session. Any failure tears down what was
    // started so far.
    [[nodiscard]] auto start() -> Expected<void>;

    [[nodiscard]] auto server() -> Http::RangeFileServer& { return server_; }
    [[nodiscard]] auto receiver() -> Receiver::RemoteReceiver& { return receiver_; }
    [[nodiscard]] auto lifecycle() -> Lifecycle& { return *lifecycle_; }
    [[nodiscard]] auto status_sync() -> StatusSync& { return status_sync_; }
    [[nodiscard]] auto hooks() const -> LogHooks const& { return hooks_; }

    [[nodiscard]] auto primary_url() const -> std::string const& { return primary_url_; }
    [[nodiscard]] auto subtitles_url() const -> std::optional<std::string> const& { return subtitles_url_; }

private:
    auto fail(Error error) -> Expected<void>;

    Receiver::RemoteReceiver&  receiver_;
    PlaybackSessionOptions     options_;
    LogHooks                   hooks_;
    Http::RangeFileServer      server_;
    std::shared_ptr<Lifecycle> lifecycle_;
    StatusSync                 status_sync_;
    std::string                primary_url_;
    std::optional<std::string> subtitles_url_;
};

} // namespace CR::Session
