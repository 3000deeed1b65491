#pragma once

#include <chrono>
#include <string>

namespace CR::Http {

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT". Independent of the global locale.
auto format_http_date(std::chrono::system_clock::time_point tp) -> std::string;

} // namespace CR::Http
