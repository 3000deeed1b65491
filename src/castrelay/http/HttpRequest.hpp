#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CR::Http {

inline constexpr std::size_t kMaxRequestHeadBytes = 16 * 1024;

struct HttpRequestHead {
    std::string                                      method;
    std::string                                      target;
    std::string                                      path; // target without query or fragment
    std::string                                      version;
    std::vector<std::pair<std::string, std::string>> headers;

    // Case-insensitive; first match wins.
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string_view>;
};

// Parses the request line and header fields. `raw` is everything before the blank line.
[[nodiscard]] auto ParseRequestHead(std::string_view raw) -> Expected<HttpRequestHead>;

[[nodiscard]] auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool;

} // namespace CR::Http
