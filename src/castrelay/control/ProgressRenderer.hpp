#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace CR::Control {

struct ProgressFrame {
    double                position = 0.0; // seconds
    std::optional<double> duration;
    double                volume = 1.0;
    std::string_view      label;
};

// MM:SS, or HH:MM:SS when `with_hours` is set. Negative input renders as zero.
[[nodiscard]] auto FormatPlaybackTime(double seconds, bool with_hours = false) -> std::string;

// "\r[#####-----] MM:SS / MM:SS  vol NN%  Label\x1b[K", redrawn in place. Hours appear on both
// times once either reaches one hour; an unknown duration renders as "--:--".
[[nodiscard]] auto RenderProgressLine(ProgressFrame const& frame, int bar_width) -> std::string;

} // namespace CR::Control
