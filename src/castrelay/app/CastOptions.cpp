#include <castrelay/app/CastOptions.hpp>

#include "app/CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

namespace CR::App {

namespace {

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (char const* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto apply_non_empty_env(char const* key, std::string& target) -> bool {
    return apply_env(key, [&](std::string_view value) {
        if (value.empty()) {
            std::cerr << key << " must not be empty\n";
            return false;
        }
        target = std::string{value};
        return true;
    });
}

} // namespace

bool IsValidCastPort(int port) {
    return port >= 0 && port <= 65535;
}

auto ParseCastMode(std::string_view text) -> std::optional<CastMode> {
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "interactive") {
        return CastMode::Interactive;
    }
    if (normalized == "onetime") {
        return CastMode::Onetime;
    }
    return std::nullopt;
}

auto ValidateCastOptions(CastOptions const& options) -> std::optional<std::string> {
    if (options.device.empty()) {
        return std::string{"--device is required"};
    }
    if (options.filename.empty()) {
        return std::string{"a media file name is required"};
    }
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidCastPort(options.port)) {
        return std::string{"--port must be within 0-65535"};
    }
    if (!(options.seek_seconds > 0.0)) {
        return std::string{"--seek-seconds must be > 0"};
    }
    if (!(options.volume_step > 0.0) || options.volume_step > 1.0) {
        return std::string{"--volume-step must be within (0, 1]"};
    }
    if (!(options.active_timeout_seconds > 0.0)) {
        return std::string{"--active-timeout must be > 0"};
    }
    if (!(options.loopback_duration_seconds > 0.0)) {
        return std::string{"--loopback-duration must be > 0"};
    }
    if (options.subtitles_mime_type.empty()) {
        return std::string{"--subtitles_mime_type must not be empty"};
    }
    return std::nullopt;
}

bool ApplyCastEnvOverrides(CastOptions& options) {
    if (!apply_non_empty_env("CASTRELAY_DEVICE", options.device)) {
        return false;
    }

    if (!apply_env("CASTRELAY_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
                std::cerr << "CASTRELAY_PORT must be within 0-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty_env("CASTRELAY_HOST", options.host)) {
        return false;
    }
    if (!apply_non_empty_env("CASTRELAY_ADVERTISE_HOST", options.advertise_host)) {
        return false;
    }

    if (!apply_env("CASTRELAY_MODE", [&](std::string_view value) {
            auto mode = ParseCastMode(value);
            if (!mode) {
                std::cerr << "CASTRELAY_MODE must be 'interactive' or 'onetime'\n";
                return false;
            }
            options.mode = *mode;
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty_env("CASTRELAY_KODI_USER", options.kodi_user)) {
        return false;
    }
    return apply_env("CASTRELAY_KODI_PASSWORD", [&](std::string_view value) {
        options.kodi_password = std::string{value};
        return true;
    });
}

void PrintCastUsage() {
    std::cout << "Usage: castrelay --device <name> [options] FILENAME\n"
              << "  --device <name>               Receiver: loopback or kodi://<host>[:port]\n"
              << "  --port <port>                 HTTP port to serve the media on (default 8080, 0 = any)\n"
              << "  --host <addr>                 Bind address (default 0.0.0.0)\n"
              << "  --advertise-host <addr>       Address put into the media URLs (default: probed)\n"
              << "  --subtitles_file <path>       Subtitles to serve alongside the media\n"
              << "  --subtitles_mime_type <mime>  Subtitles content type (default text/vtt)\n"
              << "  --mime-type <mime>            Media content type (default: guessed from the extension)\n"
              << "  --title <text>                Title shown by the receiver (default: file name)\n"
              << "  --interactive                 Keyboard control with a progress bar (default)\n"
              << "  --onetime                     Play once without keyboard control\n"
              << "  --seek-seconds <sec>          Seek step (default 30)\n"
              << "  --volume-step <fraction>      Volume step (default 0.01)\n"
              << "  --active-timeout <sec>        Wait for the receiver to start playing (default 30)\n"
              << "  --loopback-duration <sec>     Simulated media length for the loopback device (default 60)\n"
              << "  --kodi-user <user>            Kodi web server user\n"
              << "  --kodi-password <password>    Kodi web server password\n"
              << "  --help, -h                    Show this message\n"
              << "Keys: +/- or Up/Down volume, Left/Right or ,/. seek, space or p pause, m mute, q quit\n"
              << "Environment: CASTRELAY_DEVICE, CASTRELAY_PORT, CASTRELAY_HOST, CASTRELAY_ADVERTISE_HOST,\n"
              << "             CASTRELAY_MODE, CASTRELAY_KODI_USER, CASTRELAY_KODI_PASSWORD\n";
}

auto ParseCastArguments(int argc, char const* const* argv) -> std::optional<CastOptions> {
    CastOptions options{};
    if (!ApplyCastEnvOverrides(options)) {
        return std::nullopt;
    }

    auto non_empty = [](std::string_view flag, std::string& target) {
        return [flag = std::string{flag}, &target](std::string_view value) -> CommandLine::ParseError {
            if (value.empty()) {
                return flag + " must not be empty";
            }
            target = std::string{value};
            return std::nullopt;
        };
    };

    CommandLine cli;
    cli.set_program_name("castrelay");
    cli.add_value("--device", non_empty("--device", options.device));
    cli.add_value("--port", [&](std::string_view value) -> CommandLine::ParseError {
        int parsed = options.port;
        if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
            return std::string{"--port must be within 0-65535"};
        }
        options.port = parsed;
        return std::nullopt;
    });
    cli.add_value("--host", non_empty("--host", options.host));
    cli.add_value("--advertise-host", non_empty("--advertise-host", options.advertise_host));
    cli.add_value("--subtitles_file", non_empty("--subtitles_file", options.subtitles_file));
    cli.add_alias("--subtitles-file", "--subtitles_file");
    cli.add_value("--subtitles_mime_type", non_empty("--subtitles_mime_type", options.subtitles_mime_type));
    cli.add_alias("--subtitles-mime-type", "--subtitles_mime_type");
    cli.add_value("--mime-type", non_empty("--mime-type", options.mime_type));
    cli.add_value("--title", [&](std::string_view value) -> CommandLine::ParseError {
        options.title = std::string{value};
        return std::nullopt;
    });
    cli.add_flag("--interactive", [&]() { options.mode = CastMode::Interactive; });
    cli.add_flag("--onetime", [&]() { options.mode = CastMode::Onetime; });
    cli.add_double("--seek-seconds", [&](double value) { options.seek_seconds = value; });
    cli.add_double("--volume-step", [&](double value) { options.volume_step = value; });
    cli.add_double("--active-timeout", [&](double value) { options.active_timeout_seconds = value; });
    cli.add_double("--loopback-duration", [&](double value) { options.loopback_duration_seconds = value; });
    cli.add_value("--kodi-user", non_empty("--kodi-user", options.kodi_user));
    cli.add_value("--kodi-password", [&](std::string_view value) -> CommandLine::ParseError {
        options.kodi_password = std::string{value};
        return std::nullopt;
    });
    cli.add_flag("--help", [&]() { options.show_help = true; });
    cli.add_alias("-h", "--help");
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        if (!options.filename.empty()) {
            return "only one media file can be cast, got '" + options.filename + "' and '" + std::string{token} + "'";
        }
        options.filename = std::string{token};
        return std::nullopt;
    });

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

} // namespace CR::App
