#include "http/HttpDate.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace CR::Http {

namespace {

constexpr std::array<std::string_view, 7> kWeekdays{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::array<std::string_view, 12> kMonths{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool gmtime_utc(std::time_t value, std::tm& out) {
    return gmtime_r(&value, &out) != nullptr;
}

} // namespace

auto format_http_date(std::chrono::system_clock::time_point tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    std::time_t raw   = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm tm{};
    if (!gmtime_utc(raw, tm) || tm.tm_wday < 0 || tm.tm_wday > 6 || tm.tm_mon < 0 || tm.tm_mon > 11) {
        return "Thu, 01 Jan 1970 00:00:00 GMT";
    }

    std::ostringstream oss;
    oss << kWeekdays[static_cast<std::size_t>(tm.tm_wday)] << ", ";
    oss << std::setw(2) << std::setfill('0') << tm.tm_mday << ' ';
    oss << kMonths[static_cast<std::size_t>(tm.tm_mon)] << ' ';
    oss << std::setw(4) << std::setfill('0') << (tm.tm_year + 1900) << ' ';
    oss << std::setw(2) << std::setfill('0') << tm.tm_hour << ':';
    oss << std::setw(2) << std::setfill('0') << tm.tm_min << ':';
    oss << std::setw(2) << std::setfill('0') << tm.tm_sec << " GMT";
    return oss.str();
}

} // namespace CR::Http
