#include "CastRelayTestHelper.hpp"
#include "receiver/ReceiverDirectory.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace CR;
using namespace std::chrono_literals;

namespace {

auto make_fake() -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
    return std::unique_ptr<Receiver::RemoteReceiver>(std::make_unique<Test::FakeReceiver>());
}

} // namespace

TEST_SUITE("receiver.directory") {

TEST_CASE("exact names win over scheme prefixes") {
    Receiver::ReceiverDirectory directory;
    std::vector<std::string>    seen;
    directory.register_scheme("fake", [&](std::string_view device) {
        seen.push_back("scheme:" + std::string{device});
        return make_fake();
    });
    directory.register_name("fake", [&](std::string_view device) {
        seen.push_back("name:" + std::string{device});
        return make_fake();
    });

    REQUIRE(directory.find("fake"));
    REQUIRE(directory.find("fake://living-room"));
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "name:fake");
    CHECK(seen[1] == "scheme:fake://living-room");
}

TEST_CASE("unknown devices list the available options") {
    Receiver::ReceiverDirectory directory;
    directory.register_name("loopback", [](std::string_view) { return make_fake(); });
    directory.register_scheme("kodi://", [](std::string_view) { return make_fake(); });

    auto names = directory.known_devices();
    REQUIRE(names.size() == 2);
    CHECK(names[0] == "loopback");
    CHECK(names[1] == "kodi://<host>[:port]");

    auto found = directory.find("chromecast");
    REQUIRE_FALSE(found);
    CHECK(found.error().code == Error::Code::NotFound);
    CHECK(found.error().message.value() == "Couldn't find device 'chromecast', options are: [loopback, kodi://<host>[:port]]");
}

TEST_CASE("transient factory failures are retried with exponential backoff") {
    Receiver::ReceiverLookupOptions options;
    options.max_attempts    = 4;
    options.initial_backoff = 100ms;
    Receiver::ReceiverDirectory directory(options);

    std::vector<std::chrono::milliseconds> sleeps;
    directory.set_sleeper([&](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

    int calls = 0;
    directory.register_name("flaky", [&](std::string_view) -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
        if (++calls < 3) {
            return std::unexpected(Error{Error::Code::NotConnected, "not yet"});
        }
        return make_fake();
    });

    auto found = directory.find("flaky");
    REQUIRE(found);
    CHECK((*found)->name() == "fake");
    CHECK(calls == 3);
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0] == 100ms);
    CHECK(sleeps[1] == 200ms);
}

TEST_CASE("the last transient failure surfaces once attempts run out") {
    Receiver::ReceiverDirectory directory;
    int                         sleeps = 0;
    directory.set_sleeper([&](std::chrono::milliseconds) { ++sleeps; });
    int calls = 0;
    directory.register_name("gone", [&](std::string_view) -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
        ++calls;
        return std::unexpected(Error{Error::Code::Timeout, "no answer"});
    });

    auto found = directory.find("gone");
    REQUIRE_FALSE(found);
    CHECK(found.error().code == Error::Code::Timeout);
    CHECK(calls == 3);
    CHECK(sleeps == 2);
}

TEST_CASE("permanent failures are not retried") {
    Receiver::ReceiverDirectory directory;
    int                         sleeps = 0;
    directory.set_sleeper([&](std::chrono::milliseconds) { ++sleeps; });
    int calls = 0;
    directory.register_name("locked", [&](std::string_view) -> Expected<std::unique_ptr<Receiver::RemoteReceiver>> {
        ++calls;
        return std::unexpected(Error{Error::Code::InvalidState, "credentials rejected"});
    });

    auto found = directory.find("locked");
    REQUIRE_FALSE(found);
    CHECK(found.error().code == Error::Code::InvalidState);
    CHECK(calls == 1);
    CHECK(sleeps == 0);
}

} // TEST_SUITE
