#include "CastRelayTestHelper.hpp"
#include "app/CastApp.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

using namespace CR;

TEST_SUITE("app.cast_app") {

TEST_CASE("kodi device strings resolve to a host and port") {
    auto plain = App::ParseKodiDevice("kodi://192.168.1.5");
    REQUIRE(plain);
    CHECK(plain->host == "192.168.1.5");
    CHECK(plain->port == 8080);

    auto with_port = App::ParseKodiDevice("kodi://tv.local:9090/");
    REQUIRE(with_port);
    CHECK(with_port->host == "tv.local");
    CHECK(with_port->port == 9090);

    auto ipv6 = App::ParseKodiDevice("kodi://[fe80::1]:8081");
    REQUIRE(ipv6);
    CHECK(ipv6->host == "fe80::1");
    CHECK(ipv6->port == 8081);

    auto ipv6_default = App::ParseKodiDevice("kodi://[::1]");
    REQUIRE(ipv6_default);
    CHECK(ipv6_default->host == "::1");
    CHECK(ipv6_default->port == 8080);
}

TEST_CASE("malformed kodi devices are rejected") {
    for (auto const* device : {"kodi://", "http://tv.local", "kodi://fe80::1", "kodi://tv:port", "kodi://tv:0"}) {
        CAPTURE(device);
        auto endpoint = App::ParseKodiDevice(device);
        REQUIRE_FALSE(endpoint);
        CHECK(endpoint.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("the receiver directory knows loopback and kodi") {
    App::CastOptions options;
    auto             directory = App::BuildReceiverDirectory(options);

    auto names = directory.known_devices();
    REQUIRE(names.size() == 2);
    CHECK(names[0] == "loopback");
    CHECK(names[1] == "kodi://<host>[:port]");

    auto loopback = directory.find("loopback");
    REQUIRE(loopback);
    CHECK((*loopback)->name() == "loopback");

    auto unknown = directory.find("chromecast:Living Room");
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == Error::Code::NotFound);
    CHECK(unknown.error().message.value().starts_with("Couldn't find device 'chromecast:Living Room'"));
}

TEST_CASE("a malformed kodi device fails without retrying") {
    App::CastOptions options;
    auto             directory = App::BuildReceiverDirectory(options);
    auto             found     = directory.find("kodi://fe80::1");
    REQUIRE_FALSE(found);
    CHECK(found.error().code == Error::Code::MalformedInput);
}

TEST_CASE("a missing media file stops the cast before any device is contacted") {
    Test::TempDir    dir;
    App::CastOptions options;
    options.device   = "loopback";
    options.filename = (dir.path() / "absent.mp4").string();

    auto result = App::RunCast(options, nullptr);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::NotFound);
}

TEST_CASE("an unknown device is reported with the available options") {
    Test::TempDir    dir;
    App::CastOptions options;
    options.device   = "airplay";
    options.filename = dir.write_pattern("clip.mp4", 1000);

    auto result = App::RunCast(options, nullptr);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::NotFound);
    CHECK(result.error().message.value() == "Couldn't find device 'airplay', options are: [loopback, kodi://<host>[:port]]");
}

TEST_CASE("a onetime cast to the loopback receiver plays to the end") {
    Test::TempDir    dir;
    App::CastOptions options;
    options.device                    = "loopback";
    options.filename                  = dir.write_pattern("clip.mp4", 300000);
    options.host                      = "127.0.0.1";
    options.port                      = 0;
    options.advertise_host            = "127.0.0.1";
    options.mode                      = App::CastMode::Onetime;
    options.loopback_duration_seconds = 0.3;
    options.active_timeout_seconds    = 5.0;

    std::mutex               mutex;
    std::vector<std::string> infos;
    LogHooks                 hooks;
    hooks.info = [&](std::string_view message) {
        std::lock_guard<std::mutex> lock(mutex);
        infos.emplace_back(message);
    };
    hooks.error = [](std::string_view) {};

    std::atomic<bool> interrupted{false};
    auto              result = App::RunCast(options, &interrupted, hooks);
    REQUIRE(result);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(infos.size() >= 2);
    CHECK(infos.front().starts_with("Casting clip.mp4 to loopback from http://127.0.0.1:"));
    CHECK(infos.back() == "Playback ended: playback finished");
}

} // TEST_SUITE
