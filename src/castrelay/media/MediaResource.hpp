#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace CR::Media {

inline constexpr std::string_view kPrimaryPath          = "/primary";
inline constexpr std::string_view kSubtitlesPath        = "/subtitles";
inline constexpr std::string_view kDefaultSubtitlesMime = "text/vtt";
inline constexpr std::string_view kFallbackMime         = "application/octet-stream";

enum class ResourceKind {
    Primary,
    Subtitle,
};

struct MediaResource {
    std::string                           path;
    std::uint64_t                         content_length = 0;
    std::string                           mime_type;
    ResourceKind                          kind = ResourceKind::Primary;
    std::chrono::system_clock::time_point last_modified{};
};

// Immutable once handed to the server.
struct MediaResourceSet {
    MediaResource                primary;
    std::optional<MediaResource> subtitles;

    [[nodiscard]] auto find(std::string_view logical_path) const -> MediaResource const*;
};

// Expands a leading "~" and makes the path absolute and lexically normal.
[[nodiscard]] auto CanonicalizeFilePath(std::string_view raw) -> std::string;

[[nodiscard]] auto GuessMimeType(std::string_view path) -> std::string;

// Stats the file once. Fails with NotFound when it is missing, not a regular file or unreadable.
[[nodiscard]] auto ResolveMediaResource(std::string_view raw_path,
                                        ResourceKind     kind,
                                        std::optional<std::string> mime_override = std::nullopt)
    -> Expected<MediaResource>;

[[nodiscard]] auto ResolveMediaResourceSet(std::string_view                primary_path,
                                           std::optional<std::string>      primary_mime,
                                           std::optional<std::string_view> subtitles_path,
                                           std::string                     subtitles_mime)
    -> Expected<MediaResourceSet>;

} // namespace CR::Media
