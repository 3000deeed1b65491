#include "receiver/KodiReceiver.hpp"

#include "log/TaggedLogger.hpp"

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace CR::Receiver {

namespace {

constexpr std::chrono::milliseconds kRetryDelay{250};

auto to_timeout_pair(std::chrono::milliseconds ms) -> std::pair<time_t, long> {
    auto seconds      = std::chrono::duration_cast<std::chrono::seconds>(ms);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(ms - seconds);
    return {static_cast<time_t>(seconds.count()), static_cast<long>(microseconds.count())};
}

auto json_number(nlohmann::json const& object, char const* key) -> double {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

auto malformed(std::string const& method, char const* what) -> Error {
    return Error{Error::Code::MalformedInput, method + " returned " + what};
}

} // namespace

auto ToKodiTime(double seconds) -> nlohmann::json {
    auto total_ms = static_cast<long long>(std::llround(std::max(seconds, 0.0) * 1000.0));
    return nlohmann::json{{"hours", total_ms / 3'600'000},
                          {"minutes", (total_ms / 60'000) % 60},
                          {"seconds", (total_ms / 1000) % 60},
                          {"milliseconds", total_ms % 1000}};
}

auto FromKodiTime(nlohmann::json const& time) -> double {
    if (!time.is_object()) {
        return 0.0;
    }
    return json_number(time, "hours") * 3600.0 + json_number(time, "minutes") * 60.0 + json_number(time, "seconds")
           + json_number(time, "milliseconds") / 1000.0;
}

KodiReceiver::KodiReceiver(Options options)
    : options_(std::move(options)) {}

KodiReceiver::~KodiReceiver() {
    stop_heartbeat();
}

auto KodiReceiver::name() const -> std::string {
    return "kodi://" + options_.host + ":" + std::to_string(options_.port);
}

auto KodiReceiver::call(std::string const& method, nlohmann::json params) -> Expected<nlohmann::json> {
    httplib::Client client(options_.host, options_.port);
    auto [sec, usec] = to_timeout_pair(options_.request_timeout);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
    if (!options_.user.empty()) {
        client.set_basic_auth(options_.user, options_.password);
    }

    nlohmann::json request{{"jsonrpc", "2.0"}, {"id", next_id_.fetch_add(1)}, {"method", method}};
    if (!params.empty()) {
        request["params"] = std::move(params);
    }
    auto response = client.Post("/jsonrpc", request.dump(), "application/json");
    if (!response) {
        return std::unexpected(Error{Error::Code::NotConnected,
                                     method + " failed: " + httplib::to_string(response.error())});
    }
    if (response->status == 401) {
        return std::unexpected(Error{Error::Code::InvalidState, "Kodi rejected the credentials"});
    }
    if (response->status != 200) {
        return std::unexpected(Error{Error::Code::UnknownError,
                                     method + " returned HTTP " + std::to_string(response->status)});
    }
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, method + " returned invalid JSON"});
    }
    if (auto error = body.find("error"); error != body.end()) {
        std::string message = "unknown error";
        if (error->is_object()) {
            if (auto text = error->find("message"); text != error->end() && text->is_string()) {
                message = text->get<std::string>();
            }
        } else if (error->is_string()) {
            message = error->get<std::string>();
        }
        return std::unexpected(Error{Error::Code::UnknownError, method + ": " + message});
    }
    cr_log("Kodi " + method + " ok", "KodiReceiver");
    return body.value("result", nlohmann::json{});
}

auto KodiReceiver::active_player() -> Expected<std::optional<int>> {
    auto players = call("Player.GetActivePlayers");
    if (!players) {
        return std::unexpected(players.error());
    }
    if (players->is_null()) {
        return std::optional<int>{};
    }
    if (!players->is_array()) {
        return std::unexpected(malformed("Player.GetActivePlayers", "a non-array player list"));
    }
    std::optional<int> first;
    for (auto const& player : *players) {
        if (!player.is_object()) {
            return std::unexpected(malformed("Player.GetActivePlayers", "a non-object player entry"));
        }
        auto id = player.find("playerid");
        if (id == player.end() || !id->is_number_integer()) {
            return std::unexpected(malformed("Player.GetActivePlayers", "a player without an id"));
        }
        auto type = player.find("type");
        if (type != player.end() && type->is_string() && type->get<std::string>() == "video") {
            return std::optional<int>{id->get<int>()};
        }
        if (!first) {
            first = id->get<int>();
        }
    }
    return first;
}

auto KodiReceiver::require_player() -> Expected<int> {
    auto player = active_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    if (!*player) {
        return std::unexpected(Error{Error::Code::InvalidState, "no active player"});
    }
    return **player;
}

auto KodiReceiver::read_volume() -> Expected<double> {
    auto properties = call("Application.GetProperties", {{"properties", {"volume", "muted"}}});
    if (!properties) {
        return std::unexpected(properties.error());
    }
    if (!properties->is_object()) {
        return std::unexpected(malformed("Application.GetProperties", "a non-object result"));
    }
    if (auto muted = properties->find("muted"); muted != properties->end()) {
        if (!muted->is_boolean()) {
            return std::unexpected(malformed("Application.GetProperties", "a non-boolean mute flag"));
        }
        if (muted->get<bool>()) {
            return 0.0;
        }
    }
    return std::clamp(json_number(*properties, "volume") / 100.0, 0.0, 1.0);
}

auto KodiReceiver::wait(std::chrono::milliseconds timeout) -> Expected<void> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto pong = call("JSONRPC.Ping");
        if (pong) {
            return {};
        }
        if (!isTransient(pong.error())) {
            return std::unexpected(pong.error());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected(Error{Error::Code::Timeout, "Kodi did not answer at " + name()});
        }
        std::this_thread::sleep_for(kRetryDelay);
    }
}

auto KodiReceiver::play_media(PlayMediaRequest const& request) -> Expected<void> {
    auto opened = call("Player.Open", {{"item", {{"file", request.url}}}});
    if (!opened) {
        return std::unexpected(opened.error());
    }
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_subtitles_ = request.subtitles_url;
    }
    start_heartbeat();
    return {};
}

auto KodiReceiver::block_until_active(std::chrono::milliseconds timeout) -> Expected<void> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto player = active_player();
        if (player && *player) {
            std::optional<std::string> subtitles;
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                subtitles.swap(pending_subtitles_);
            }
            if (subtitles) {
                auto added = call("Player.AddSubtitle", {{"playerid", **player}, {"subtitle", *subtitles}});
                if (!added) {
                    cr_log("Kodi refused subtitles: " + describeError(added.error()), "KodiReceiver");
                }
            }
            return {};
        }
        if (!player && !isTransient(player.error())) {
            return std::unexpected(player.error());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected(Error{Error::Code::Timeout, "Kodi never started a player"});
        }
        std::this_thread::sleep_for(kRetryDelay);
    }
}

auto KodiReceiver::poll_status() -> Expected<RemoteStatus> {
    RemoteStatus status;
    auto volume = read_volume();
    if (!volume) {
        return std::unexpected(volume.error());
    }
    status.connected = true;
    status.volume    = *volume;

    auto player = active_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    if (!*player) {
        status.is_idle = true;
        return status;
    }
    auto properties = call("Player.GetProperties",
                           {{"playerid", **player}, {"properties", {"time", "totaltime", "speed"}}});
    if (!properties) {
        return std::unexpected(properties.error());
    }
    if (!properties->is_object()) {
        return std::unexpected(malformed("Player.GetProperties", "a non-object result"));
    }
    status.is_idle      = false;
    status.current_time = FromKodiTime(properties->value("time", nlohmann::json{}));
    status.is_paused    = json_number(*properties, "speed") == 0.0;
    auto total          = FromKodiTime(properties->value("totaltime", nlohmann::json{}));
    if (total > 0.0) {
        status.duration = total;
    }
    return status;
}

auto KodiReceiver::seek(double seconds) -> Expected<void> {
    auto player = require_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    auto result = call("Player.Seek", {{"playerid", *player}, {"value", {{"time", ToKodiTime(seconds)}}}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto KodiReceiver::play() -> Expected<void> {
    auto player = require_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    auto result = call("Player.PlayPause", {{"playerid", *player}, {"play", true}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto KodiReceiver::pause() -> Expected<void> {
    auto player = require_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    auto result = call("Player.PlayPause", {{"playerid", *player}, {"play", false}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto KodiReceiver::adjust_volume(double delta) -> Expected<void> {
    auto current = read_volume();
    if (!current) {
        return std::unexpected(current.error());
    }
    return set_volume(*current + delta);
}

auto KodiReceiver::set_volume(double level) -> Expected<void> {
    auto percent = static_cast<int>(std::lround(std::clamp(level, 0.0, 1.0) * 100.0));
    auto result  = call("Application.SetVolume", {{"volume", percent}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto KodiReceiver::stop() -> Expected<void> {
    auto player = active_player();
    if (!player) {
        return std::unexpected(player.error());
    }
    if (!*player) {
        return {};
    }
    auto result = call("Player.Stop", {{"playerid", **player}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto KodiReceiver::quit() -> Expected<void> {
    stop_heartbeat();
    return stop();
}

auto KodiReceiver::set_disconnect_callback(DisconnectCallback callback) -> void {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    disconnect_callback_ = std::move(callback);
}

auto KodiReceiver::start_heartbeat() -> void {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (heartbeat_.joinable()) {
        return;
    }
    heartbeat_stop_ = false;
    heartbeat_      = std::thread([this]() { heartbeat_loop(); });
}

auto KodiReceiver::stop_heartbeat() -> void {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = true;
        heartbeat_cv_.notify_all();
        worker = std::move(heartbeat_);
    }
    if (!worker.joinable()) {
        return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
        // Teardown triggered by our own disconnect callback; the loop exits right after it returns.
        worker.detach();
        return;
    }
    worker.join();
}

auto KodiReceiver::heartbeat_loop() -> void {
    int failures = 0;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(heartbeat_mutex_);
            if (heartbeat_cv_.wait_for(lock, options_.heartbeat_interval, [this]() { return heartbeat_stop_; })) {
                return;
            }
        }
        auto pong = call("JSONRPC.Ping");
        failures  = pong ? 0 : failures + 1;
        if (failures < std::max(options_.heartbeat_failures, 1)) {
            continue;
        }
        DisconnectCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = disconnect_callback_;
        }
        cr_log("Kodi stopped answering pings", "KodiReceiver");
        if (callback) {
            callback("Kodi at " + name() + " stopped responding");
        }
        return;
    }
}

} // namespace CR::Receiver
