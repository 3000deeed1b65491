#include "CastRelayTestHelper.hpp"
#include "media/MediaResource.hpp"

#include <doctest/doctest.h>

#include <filesystem>

TEST_SUITE("media.resource") {

TEST_CASE("mime types are guessed from the extension") {
    CHECK(CR::Media::GuessMimeType("/x/movie.mp4") == "video/mp4");
    CHECK(CR::Media::GuessMimeType("/x/MOVIE.MKV") == "video/x-matroska");
    CHECK(CR::Media::GuessMimeType("song.mp3") == "audio/mpeg");
    CHECK(CR::Media::GuessMimeType("subs.vtt") == "text/vtt");
    CHECK(CR::Media::GuessMimeType("no_extension") == "application/octet-stream");
}

TEST_CASE("paths are expanded and normalised") {
    CR::Test::EnvGuard home("HOME", "/home/tester");
    CHECK(CR::Media::CanonicalizeFilePath("~/videos/a.mp4") == "/home/tester/videos/a.mp4");
    CHECK(CR::Media::CanonicalizeFilePath("/a/b/../c/./d.mp4") == "/a/c/d.mp4");

    auto relative = CR::Media::CanonicalizeFilePath("clip.mp4");
    CHECK(std::filesystem::path{relative}.is_absolute());
    CHECK(std::filesystem::path{relative}.filename() == "clip.mp4");
}

TEST_CASE("resolving a file records its size and type once") {
    CR::Test::TempDir dir;
    auto              path = dir.write_pattern("clip.webm", 5000);

    auto resource = CR::Media::ResolveMediaResource(path, CR::Media::ResourceKind::Primary);
    REQUIRE(resource);
    CHECK(resource->content_length == 5000);
    CHECK(resource->mime_type == "video/webm");
    CHECK(resource->kind == CR::Media::ResourceKind::Primary);
    CHECK(resource->last_modified.time_since_epoch().count() != 0);

    auto overridden = CR::Media::ResolveMediaResource(path, CR::Media::ResourceKind::Primary, "video/custom");
    REQUIRE(overridden);
    CHECK(overridden->mime_type == "video/custom");
}

TEST_CASE("missing files and directories are not found") {
    CR::Test::TempDir dir;
    auto missing = CR::Media::ResolveMediaResource((dir.path() / "nope.mp4").string(), CR::Media::ResourceKind::Primary);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == CR::Error::Code::NotFound);

    auto directory = CR::Media::ResolveMediaResource(dir.path().string(), CR::Media::ResourceKind::Primary);
    REQUIRE_FALSE(directory);
    CHECK(directory.error().code == CR::Error::Code::NotFound);
}

TEST_CASE("resource sets route the two logical paths") {
    CR::Test::TempDir dir;
    auto              media     = dir.write_pattern("clip.mp4", 100);
    auto              subtitles = dir.write("clip.srt", "1\n00:00:00,000 --> 00:00:01,000\nhi\n");

    auto without = CR::Media::ResolveMediaResourceSet(media, std::nullopt, std::nullopt, "text/vtt");
    REQUIRE(without);
    CHECK(without->find("/primary") == &without->primary);
    CHECK(without->find("/subtitles") == nullptr);
    CHECK(without->find("/other") == nullptr);

    auto with = CR::Media::ResolveMediaResourceSet(media, std::nullopt, std::string_view{subtitles}, "");
    REQUIRE(with);
    REQUIRE(with->subtitles);
    CHECK(with->find("/subtitles") == &*with->subtitles);
    CHECK(with->subtitles->mime_type == "text/vtt");
    CHECK(with->subtitles->kind == CR::Media::ResourceKind::Subtitle);

    auto broken = CR::Media::ResolveMediaResourceSet(media, std::nullopt, std::string_view{"/no/such.vtt"}, "text/vtt");
    CHECK_FALSE(broken);
}

}
