#include "receiver/HttpUrl.hpp"

#include <doctest/doctest.h>

using CR::Receiver::ParseHttpUrl;

TEST_SUITE("receiver.http_url") {

TEST_CASE("explicit port and path are split out") {
    auto url = ParseHttpUrl("http://192.168.1.20:8080/primary");
    REQUIRE(url);
    CHECK(url->host == "192.168.1.20");
    CHECK(url->port == 8080);
    CHECK(url->path == "/primary");
    CHECK(url->scheme_host_port == "http://192.168.1.20:8080");
}

TEST_CASE("missing port defaults to 80 and missing path to root") {
    auto url = ParseHttpUrl("http://media.local");
    REQUIRE(url);
    CHECK(url->host == "media.local");
    CHECK(url->port == 80);
    CHECK(url->path == "/");
    CHECK(url->scheme_host_port == "http://media.local:80");
}

TEST_CASE("query strings stay with the path") {
    auto url = ParseHttpUrl("http://host:9000/primary?x=1");
    REQUIRE(url);
    CHECK(url->path == "/primary?x=1");
}

TEST_CASE("bracketed IPv6 hosts are unwrapped") {
    auto url = ParseHttpUrl("http://[::1]:8081/subtitles");
    REQUIRE(url);
    CHECK(url->host == "::1");
    CHECK(url->port == 8081);
    CHECK(url->scheme_host_port == "http://[::1]:8081");
}

TEST_CASE("malformed URLs are rejected") {
    for (auto const* raw : {"https://host/primary", "ftp://host", "http://", "http://:80/x", "http://host:0/",
                            "http://host:70000/", "http://host:12ab/", "http://[::1/primary", "http://[::1]x/"}) {
        CAPTURE(raw);
        auto url = ParseHttpUrl(raw);
        REQUIRE_FALSE(url);
        CHECK(url.error().code == CR::Error::Code::MalformedInput);
    }
}

} // TEST_SUITE
