#include "http/ByteRange.hpp"

#include <cctype>
#include <charconv>

namespace CR::Http {

namespace {

constexpr std::string_view kUnitPrefix = "bytes=";

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool starts_with_ci(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

// Consumes a run of digits from the front of text.
std::optional<std::uint64_t> take_number(std::string_view& text) {
    std::size_t digits = 0;
    while (digits < text.size() && is_digit(text[digits])) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + digits, value);
    if (result.ec != std::errc{}) {
        return std::nullopt;
    }
    text.remove_prefix(digits);
    return value;
}

} // namespace

auto ParseRangeHeader(std::string_view header) -> std::optional<ByteRange> {
    while (!header.empty() && (header.front() == ' ' || header.front() == '\t')) {
        header.remove_prefix(1);
    }
    if (!starts_with_ci(header, kUnitPrefix)) {
        return std::nullopt;
    }
    header.remove_prefix(kUnitPrefix.size());

    auto start = take_number(header);
    if (!start) {
        return std::nullopt;
    }
    if (header.empty() || header.front() != '-') {
        return std::nullopt;
    }
    header.remove_prefix(1);

    ByteRange range{.start = *start, .end = std::nullopt};
    if (!header.empty() && is_digit(header.front())) {
        auto end = take_number(header);
        if (!end || *end < *start) {
            return std::nullopt;
        }
        range.end = *end;
    }
    return range;
}

auto ResolveRange(ByteRange const& range, std::uint64_t content_length) -> std::optional<ResolvedRange> {
    if (content_length == 0 || range.start >= content_length) {
        return std::nullopt;
    }
    auto last = content_length - 1;
    if (range.end && *range.end < last) {
        last = *range.end;
    }
    return ResolvedRange{.first = range.start, .last = last};
}

auto FormatContentRange(ResolvedRange const& range, std::uint64_t content_length) -> std::string {
    return "bytes " + std::to_string(range.first) + "-" + std::to_string(range.last) + "/"
           + std::to_string(content_length);
}

} // namespace CR::Http
