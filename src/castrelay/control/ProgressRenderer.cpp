#include "control/ProgressRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace CR::Control {

namespace {

constexpr double kOneHour = 3600.0;

} // namespace

auto FormatPlaybackTime(double seconds, bool with_hours) -> std::string {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    auto total   = static_cast<long long>(std::floor(seconds));
    auto hours   = total / 3600;
    auto minutes = (total / 60) % 60;
    auto secs    = total % 60;

    char buffer[32];
    if (with_hours || hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", hours, minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld", minutes, secs);
    }
    return buffer;
}

auto RenderProgressLine(ProgressFrame const& frame, int bar_width) -> std::string {
    bar_width = std::max(bar_width, 1);

    double fraction = 0.0;
    if (frame.duration && *frame.duration > 0.0) {
        fraction = std::clamp(frame.position / *frame.duration, 0.0, 1.0);
    }
    auto filled = static_cast<int>(std::floor(fraction * bar_width));

    bool with_hours = frame.position >= kOneHour || (frame.duration && *frame.duration >= kOneHour);

    std::string line = "\r[";
    line.append(static_cast<std::size_t>(filled), '#');
    line.append(static_cast<std::size_t>(bar_width - filled), '-');
    line += "] ";
    line += FormatPlaybackTime(frame.position, with_hours);
    line += " / ";
    line += frame.duration ? FormatPlaybackTime(*frame.duration, with_hours) : std::string{with_hours ? "--:--:--" : "--:--"};

    auto percent = static_cast<int>(std::lround(std::clamp(frame.volume, 0.0, 1.0) * 100.0));
    line += "  vol " + std::to_string(percent) + "%";
    if (!frame.label.empty()) {
        line += "  ";
        line.append(frame.label.data(), frame.label.size());
    }
    line += "\x1b[K";
    return line;
}

} // namespace CR::Control
