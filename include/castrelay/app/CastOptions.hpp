#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace CR::App {

enum class CastMode {
    Interactive,
    Onetime,
};

struct CastOptions {
    std::string device;
    int         port{8080};
    std::string host{"0.0.0.0"};
    std::string advertise_host;
    std::string filename;
    std::string subtitles_file;
    std::string subtitles_mime_type{"text/vtt"};
    std::string mime_type;
    std::string title;
    CastMode    mode{CastMode::Interactive};
    double      seek_seconds{30.0};
    double      volume_step{0.01};
    double      active_timeout_seconds{30.0};
    double      loopback_duration_seconds{60.0};
    std::string kodi_user;
    std::string kodi_password;
    bool        show_help{false};
};

// Environment variables are applied first; flags override them.
auto ParseCastArguments(int argc, char const* const* argv) -> std::optional<CastOptions>;

void PrintCastUsage();

bool ApplyCastEnvOverrides(CastOptions& options);

auto ValidateCastOptions(CastOptions const& options) -> std::optional<std::string>;

bool IsValidCastPort(int port);
auto ParseCastMode(std::string_view text) -> std::optional<CastMode>;

} // namespace CR::App
