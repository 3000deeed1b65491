#pragma once

#include "http/ByteRange.hpp"
#include "http/HttpRequest.hpp"
#include "media/MediaResource.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CR::Http {

inline constexpr std::string_view kNotFoundBody = "File not found";
inline constexpr std::string_view kServerName   = "castrelay";

// Everything a connection handler needs to answer one request, computed without touching a socket.
struct ResponsePlan {
    int                                              status = 200;
    std::string                                      reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body; // used when no file span is streamed
    Media::MediaResource const*                      resource = nullptr;
    std::optional<ResolvedRange>                     span;
    bool                                             send_body = true;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string_view>;
};

[[nodiscard]] auto PlanResponse(HttpRequestHead const&                request,
                                Media::MediaResourceSet const&        resources,
                                std::chrono::system_clock::time_point now) -> ResponsePlan;

[[nodiscard]] auto PlanBadRequest(std::chrono::system_clock::time_point now) -> ResponsePlan;

// Used when a known resource turns out to be unreadable at request time.
[[nodiscard]] auto PlanNotFound(bool send_body, std::chrono::system_clock::time_point now) -> ResponsePlan;

// Status line plus header block, terminated by the blank line.
[[nodiscard]] auto SerializeResponseHead(ResponsePlan const& plan) -> std::string;

} // namespace CR::Http
