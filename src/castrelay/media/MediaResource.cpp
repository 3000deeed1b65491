#include "media/MediaResource.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace CR::Media {

namespace {

struct MimeEntry {
    std::string_view extension;
    std::string_view mime;
};

constexpr std::array<MimeEntry, 18> kMimeTable{{
    {".mp4", "video/mp4"},
    {".m4v", "video/x-m4v"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".ts", "video/mp2t"},
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/mp4"},
    {".aac", "audio/aac"},
    {".flac", "audio/flac"},
    {".ogg", "audio/ogg"},
    {".wav", "audio/wav"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".vtt", "text/vtt"},
    {".srt", "application/x-subrip"},
}};

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

auto MediaResourceSet::find(std::string_view logical_path) const -> MediaResource const* {
    if (logical_path == kPrimaryPath) {
        return &primary;
    }
    if (logical_path == kSubtitlesPath && subtitles) {
        return &*subtitles;
    }
    return nullptr;
}

auto CanonicalizeFilePath(std::string_view raw) -> std::string {
    namespace fs = std::filesystem;
    std::string expanded{raw};
    if (!expanded.empty() && expanded.front() == '~'
        && (expanded.size() == 1 || expanded[1] == '/')) {
        if (char const* home = std::getenv("HOME")) {
            expanded = std::string{home} + expanded.substr(1);
        }
    }
    std::error_code ec;
    auto absolute = fs::absolute(fs::path{expanded}, ec);
    if (ec) {
        return fs::path{expanded}.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

auto GuessMimeType(std::string_view path) -> std::string {
    auto extension = to_lower(std::filesystem::path{path}.extension().string());
    for (auto const& entry : kMimeTable) {
        if (entry.extension == extension) {
            return std::string{entry.mime};
        }
    }
    return std::string{kFallbackMime};
}

auto ResolveMediaResource(std::string_view           raw_path,
                          ResourceKind               kind,
                          std::optional<std::string> mime_override) -> Expected<MediaResource> {
    namespace fs = std::filesystem;
    MediaResource resource;
    resource.path = CanonicalizeFilePath(raw_path);
    resource.kind = kind;

    std::error_code ec;
    auto status = fs::status(resource.path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return std::unexpected(Error{Error::Code::NotFound, "no such file: " + resource.path});
    }
    resource.content_length = fs::file_size(resource.path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot stat " + resource.path + ": " + ec.message()});
    }
    auto write_time = fs::last_write_time(resource.path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot stat " + resource.path + ": " + ec.message()});
    }
    resource.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(write_time));

    std::ifstream probe(resource.path, std::ios::binary);
    if (!probe) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + resource.path});
    }

    if (mime_override && !mime_override->empty()) {
        resource.mime_type = std::move(*mime_override);
    } else {
        resource.mime_type = GuessMimeType(resource.path);
    }
    cr_log("Resolved " + resource.path + " (" + std::to_string(resource.content_length) + " bytes, "
               + resource.mime_type + ")",
           "Media");
    return resource;
}

auto ResolveMediaResourceSet(std::string_view                primary_path,
                             std::optional<std::string>      primary_mime,
                             std::optional<std::string_view> subtitles_path,
                             std::string                     subtitles_mime) -> Expected<MediaResourceSet> {
    auto primary = ResolveMediaResource(primary_path, ResourceKind::Primary, std::move(primary_mime));
    if (!primary) {
        return std::unexpected(primary.error());
    }
    MediaResourceSet set{.primary = std::move(*primary), .subtitles = std::nullopt};
    if (subtitles_path) {
        if (subtitles_mime.empty()) {
            subtitles_mime = std::string{kDefaultSubtitlesMime};
        }
        auto subtitles = ResolveMediaResource(*subtitles_path, ResourceKind::Subtitle, std::move(subtitles_mime));
        if (!subtitles) {
            return std::unexpected(subtitles.error());
        }
        set.subtitles = std::move(*subtitles);
    }
    return set;
}

} // namespace CR::Media
