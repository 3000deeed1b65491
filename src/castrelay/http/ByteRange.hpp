#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace CR::Http {

// Parsed "bytes=<start>-<end>?". When end is present, end >= start.
struct ByteRange {
    std::uint64_t                start = 0;
    std::optional<std::uint64_t> end;

    auto operator==(ByteRange const&) const -> bool = default;
};

// Inclusive span inside a resource of known length.
struct ResolvedRange {
    std::uint64_t first = 0;
    std::uint64_t last  = 0;

    [[nodiscard]] auto length() const -> std::uint64_t { return last - first + 1; }

    auto operator==(ResolvedRange const&) const -> bool = default;
};

// Returns nullopt for an absent or malformed header, which means "serve the whole resource".
// Only the leading range of a multi-range header is honoured.
[[nodiscard]] auto ParseRangeHeader(std::string_view header) -> std::optional<ByteRange>;

// Clamps an open or overflowing end to content_length - 1. Returns nullopt when start lies
// beyond the resource and no byte can be served.
[[nodiscard]] auto ResolveRange(ByteRange const& range, std::uint64_t content_length)
    -> std::optional<ResolvedRange>;

[[nodiscard]] auto FormatContentRange(ResolvedRange const& range, std::uint64_t content_length) -> std::string;

} // namespace CR::Http
