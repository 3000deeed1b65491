#include "session/PlaybackSession.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace CR::Session {

PlaybackSession::PlaybackSession(Media::MediaResourceSet   resources,
                                 Receiver::RemoteReceiver& receiver,
                                 PlaybackSessionOptions    options,
                                 LogHooks                  hooks)
    : receiver_(receiver)
    , options_(std::move(options))
    , hooks_(std::move(hooks))
    , server_(std::move(resources), options_.server, hooks_)
    , lifecycle_(std::make_shared<Lifecycle>(hooks_))
    , status_sync_(receiver, options_.status_sync) {}

PlaybackSession::~PlaybackSession() {
    lifecycle_->teardown("session closed");
    receiver_.set_disconnect_callback({});
}

auto PlaybackSession::fail(Error error) -> Expected<void> {
    lifecycle_->teardown("session start failed");
    return std::unexpected(std::move(error));
}

auto PlaybackSession::start() -> Expected<void> {
    if (auto ready = receiver_.wait(options_.receiver_ready_timeout); !ready) {
        return std::unexpected(ready.error());
    }

    if (auto started = server_.start(); !started) {
        return std::unexpected(started.error());
    }
    lifecycle_->attach_server(&server_);
    lifecycle_->attach_receiver(&receiver_);

    // Holds the lifecycle, not the session, so a late callback never touches a dead session.
    receiver_.set_disconnect_callback([lifecycle = lifecycle_, hooks = hooks_](std::string_view reason) {
        emit_info(hooks, "Receiver disconnected: " + std::string{reason});
        lifecycle->teardown(reason);
    });

    std::string host;
    if (options_.advertise_host && !options_.advertise_host->empty()) {
        host = *options_.advertise_host;
    } else {
        auto outbound = DetermineOutboundAddress(options_.probe_host, options_.probe_port);
        if (!outbound) {
            return fail(outbound.error());
        }
        host = std::move(*outbound);
    }

    auto const& resources = server_.resources();
    primary_url_          = BuildResourceUrl(host, server_.port(), Media::kPrimaryPath);
    if (resources.subtitles) {
        subtitles_url_ = BuildResourceUrl(host, server_.port(), Media::kSubtitlesPath);
    }

    Receiver::PlayMediaRequest request;
    request.url       = primary_url_;
    request.mime_type = resources.primary.mime_type;
    request.title     = options_.title;
    if (resources.subtitles) {
        request.subtitles_url  = subtitles_url_;
        request.subtitles_mime = resources.subtitles->mime_type;
    }
    cr_log("Asking " + receiver_.name() + " to play " + primary_url_, "PlaybackSession");
    if (auto played = receiver_.play_media(request); !played) {
        return fail(played.error());
    }

    if (auto active = receiver_.block_until_active(options_.active_timeout); !active) {
        if (active.error().code == Error::Code::Timeout) {
            return fail(Error{Error::Code::Timeout,
                              "receiver did not become active within "
                                  + std::to_string(options_.active_timeout.count()) + " ms"});
        }
        return fail(active.error());
    }
    emit_info(hooks_, "Casting " + options_.title + " to " + receiver_.name() + " from " + primary_url_);
    return {};
}

} // namespace CR::Session
