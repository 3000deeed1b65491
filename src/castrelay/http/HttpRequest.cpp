#include "http/HttpRequest.hpp"

#include <cctype>

namespace CR::Http {

namespace {

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.remove_suffix(1);
    }
    return value;
}

auto next_line(std::string_view& text) -> std::string_view {
    auto newline = text.find('\n');
    std::string_view line;
    if (newline == std::string_view::npos) {
        line = text;
        text = {};
    } else {
        line = text.substr(0, newline);
        text.remove_prefix(newline + 1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

auto HttpRequestHead::header(std::string_view name) const -> std::optional<std::string_view> {
    for (auto const& [key, value] : headers) {
        if (EqualsIgnoreCase(key, name)) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

auto ParseRequestHead(std::string_view raw) -> Expected<HttpRequestHead> {
    if (raw.size() > kMaxRequestHeadBytes) {
        return std::unexpected(malformed("request head too large"));
    }
    auto request_line = next_line(raw);
    auto first_space  = request_line.find(' ');
    auto last_space   = request_line.rfind(' ');
    if (first_space == std::string_view::npos || last_space == first_space) {
        return std::unexpected(malformed("bad request line"));
    }

    HttpRequestHead head;
    head.method  = std::string{request_line.substr(0, first_space)};
    head.target  = std::string{trim(request_line.substr(first_space + 1, last_space - first_space - 1))};
    head.version = std::string{request_line.substr(last_space + 1)};
    if (head.method.empty() || head.target.empty() || !head.version.starts_with("HTTP/")) {
        return std::unexpected(malformed("bad request line"));
    }

    auto path_end = head.target.find_first_of("?#");
    head.path     = head.target.substr(0, path_end);

    while (!raw.empty()) {
        auto line = next_line(raw);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::unexpected(malformed("bad header line"));
        }
        head.headers.emplace_back(std::string{trim(line.substr(0, colon))},
                                  std::string{trim(line.substr(colon + 1))});
    }
    return head;
}

} // namespace CR::Http
