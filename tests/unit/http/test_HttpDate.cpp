#include "http/HttpDate.hpp"

#include <doctest/doctest.h>

#include <chrono>

TEST_CASE("HTTP dates use the IMF-fixdate format") {
    using namespace std::chrono;
    // Sun, 06 Nov 1994 08:49:37 GMT
    auto tp = system_clock::time_point{seconds{784111777}};
    CHECK(CR::Http::format_http_date(tp) == "Sun, 06 Nov 1994 08:49:37 GMT");

    auto epoch = system_clock::time_point{};
    CHECK(CR::Http::format_http_date(epoch) == "Thu, 01 Jan 1970 00:00:00 GMT");
}
