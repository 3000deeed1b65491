#include "receiver/HttpUrl.hpp"

#include <charconv>

namespace CR::Receiver {

auto ParseHttpUrl(std::string_view url) -> Expected<HttpUrl> {
    constexpr std::string_view kScheme = "http://";
    if (!url.starts_with(kScheme)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "only http:// URLs are supported: " + std::string{url}});
    }
    auto rest      = url.substr(kScheme.size());
    auto path_pos  = rest.find('/');
    auto authority = rest.substr(0, path_pos);

    HttpUrl parsed;
    parsed.path = path_pos == std::string_view::npos ? std::string{"/"} : std::string{rest.substr(path_pos)};

    std::string_view port_text;
    bool             has_port = false;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(Error{Error::Code::MalformedInput, "unterminated IPv6 literal in " + std::string{url}});
        }
        parsed.host = std::string{authority.substr(1, close - 1)};
        auto after  = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(Error{Error::Code::MalformedInput, "bad authority in " + std::string{url}});
            }
            port_text = after.substr(1);
            has_port  = true;
        }
    } else {
        auto colon = authority.rfind(':');
        parsed.host = std::string{authority.substr(0, colon)};
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
            has_port  = true;
        }
    }
    if (parsed.host.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "missing host in " + std::string{url}});
    }
    if (has_port) {
        int  port   = 0;
        auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size() || port <= 0
            || port > 65535) {
            return std::unexpected(Error{Error::Code::MalformedInput, "bad port in " + std::string{url}});
        }
        parsed.port = port;
    }
    parsed.scheme_host_port = std::string{kScheme} + std::string{authority};
    if (!has_port) {
        parsed.scheme_host_port += ":" + std::to_string(parsed.port);
    }
    return parsed;
}

} // namespace CR::Receiver
