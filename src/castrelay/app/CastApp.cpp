#include "app/CastApp.hpp"

#include "control/InteractiveControlLoop.hpp"
#include "control/OnetimeControlLoop.hpp"
#include "control/TerminalInput.hpp"
#include "log/TaggedLogger.hpp"
#include "media/MediaResource.hpp"
#include "receiver/HttpUrl.hpp"
#include "receiver/KodiReceiver.hpp"
#include "receiver/LoopbackReceiver.hpp"
#include "session/PlaybackSession.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

namespace CR::App {

namespace {

constexpr std::string_view kKodiScheme = "kodi://";

auto to_millis(double seconds) -> std::chrono::milliseconds {
    return std::chrono::milliseconds{static_cast<long long>(seconds * 1000.0)};
}

// Keeps user-facing lines from being overwritten by the progress bar.
auto interactive_hooks(LogHooks base) -> LogHooks {
    LogHooks hooks;
    hooks.info = [base](std::string_view message) {
        std::string line = "\r\x1b[K" + std::string{message};
        if (base.info) {
            base.info(line);
        } else {
            std::cout << line << '\n' << std::flush;
        }
    };
    hooks.error = [base](std::string_view message) {
        std::string line = "\r\x1b[K" + std::string{message};
        if (base.error) {
            base.error(line);
        } else {
            std::cerr << line << '\n' << std::flush;
        }
    };
    return hooks;
}

} // namespace

auto ParseKodiDevice(std::string_view device) -> Expected<KodiEndpoint> {
    if (!device.starts_with(kKodiScheme)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "expected kodi://<host>[:port]"});
    }
    std::string authority{device.substr(kKodiScheme.size())};
    while (!authority.empty() && authority.back() == '/') {
        authority.pop_back();
    }
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "kodi device is missing a host"});
    }
    auto colon     = authority.rfind(':');
    auto closing   = authority.rfind(']');
    bool has_port  = colon != std::string::npos && (closing == std::string::npos || colon > closing);
    bool bare_ipv6 = closing == std::string::npos && authority.find(':') != colon;
    if (bare_ipv6) {
        return std::unexpected(Error{Error::Code::MalformedInput, "IPv6 kodi hosts must be in brackets"});
    }
    if (!has_port) {
        authority += ":8080";
    }
    auto url = Receiver::ParseHttpUrl("http://" + authority);
    if (!url) {
        return std::unexpected(url.error());
    }
    return KodiEndpoint{.host = url->host, .port = url->port};
}

auto BuildReceiverDirectory(CastOptions const& options) -> Receiver::ReceiverDirectory {
    Receiver::ReceiverDirectory directory;

    auto loopback_duration = options.loopback_duration_seconds;
    directory.register_name("loopback", [loopback_duration](std::string_view) -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
        Receiver::LoopbackReceiver::Options loopback;
        loopback.media_duration = loopback_duration;
        return std::make_unique<Receiver::LoopbackReceiver>(loopback);
    });

    auto user     = options.kodi_user;
    auto password = options.kodi_password;
    directory.register_scheme(std::string{kKodiScheme},
                              [user, password](std::string_view device) -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
                                  auto endpoint = ParseKodiDevice(device);
                                  if (!endpoint) {
                                      return std::unexpected(endpoint.error());
                                  }
                                  Receiver::KodiReceiver::Options kodi;
                                  kodi.host     = endpoint->host;
                                  kodi.port     = endpoint->port;
                                  kodi.user     = user;
                                  kodi.password = password;
                                  auto receiver = std::make_unique<Receiver::KodiReceiver>(kodi);
                                  // Unreachable devices fail here with a transient code and are retried.
                                  if (auto reachable = receiver->wait(kodi.request_timeout); !reachable) {
                                      return std::unexpected(reachable.error());
                                  }
                                  return receiver;
                              });
    return directory;
}

auto RunCast(CastOptions const& options, std::atomic<bool> const* interrupt_flag, LogHooks hooks) -> Expected<void> {
    std::optional<std::string_view> subtitles;
    if (!options.subtitles_file.empty()) {
        subtitles = options.subtitles_file;
    }
    std::optional<std::string> mime;
    if (!options.mime_type.empty()) {
        mime = options.mime_type;
    }
    auto resources = Media::ResolveMediaResourceSet(options.filename, mime, subtitles, options.subtitles_mime_type);
    if (!resources) {
        return std::unexpected(resources.error());
    }

    auto directory = BuildReceiverDirectory(options);
    auto receiver  = directory.find(options.device);
    if (!receiver) {
        return std::unexpected(receiver.error());
    }

    Session::PlaybackSessionOptions session_options;
    session_options.server.host    = options.host;
    session_options.server.port    = options.port;
    session_options.active_timeout = to_millis(options.active_timeout_seconds);
    session_options.title          = options.title.empty()
                                         ? std::filesystem::path{resources->primary.path}.filename().string()
                                         : options.title;
    if (!options.advertise_host.empty()) {
        session_options.advertise_host = options.advertise_host;
    }

    bool const interactive = options.mode == CastMode::Interactive;
    if (interactive) {
        hooks = interactive_hooks(std::move(hooks));
    }

    // Declared before the session so the terminal outlives the lifecycle that restores it.
    Control::TerminalInput keyboard;
    Session::PlaybackSession session(std::move(*resources), **receiver, session_options, hooks);

    if (interactive) {
        if (auto raw = keyboard.activate(); !raw) {
            emit_info(hooks, "castrelay: keyboard control limited: " + describeError(raw.error()));
        }
        session.lifecycle().set_terminal_restore([&keyboard]() { keyboard.restore(); });
    }

    if (auto started = session.start(); !started) {
        keyboard.restore();
        return std::unexpected(started.error());
    }

    if (interactive) {
        Control::InteractiveControlOptions loop_options;
        loop_options.seek_seconds    = options.seek_seconds;
        loop_options.volume_step     = options.volume_step;
        loop_options.connect_timeout = to_millis(options.active_timeout_seconds);
        loop_options.interrupt_flag  = interrupt_flag;
        Control::InteractiveControlLoop loop(session, keyboard, std::move(loop_options));
        auto                            result = loop.run();
        cr_log("Interactive loop ended: " + loop.termination_reason(), "CastApp");
        return result;
    }

    Control::OnetimeControlOptions loop_options;
    loop_options.start_timeout  = to_millis(options.active_timeout_seconds);
    loop_options.interrupt_flag = interrupt_flag;
    Control::OnetimeControlLoop loop(session, loop_options);
    return loop.run();
}

} // namespace CR::App
