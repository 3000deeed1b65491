#include "http/ResponsePlan.hpp"

#include "http/HttpDate.hpp"

namespace CR::Http {

namespace {

void add_common_headers(ResponsePlan& plan, std::chrono::system_clock::time_point now) {
    plan.headers.emplace_back("Date", format_http_date(now));
    plan.headers.emplace_back("Server", std::string{kServerName});
    plan.headers.emplace_back("Connection", "close");
}

auto plan_text(int status,
               std::string reason,
               std::string body,
               bool send_body,
               std::chrono::system_clock::time_point now) -> ResponsePlan {
    ResponsePlan plan;
    plan.status    = status;
    plan.reason    = std::move(reason);
    plan.send_body = send_body;
    plan.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    plan.headers.emplace_back("Content-Length", std::to_string(body.size()));
    add_common_headers(plan, now);
    plan.body = std::move(body);
    return plan;
}

} // namespace

auto ResponsePlan::header(std::string_view name) const -> std::optional<std::string_view> {
    for (auto const& [key, value] : headers) {
        if (EqualsIgnoreCase(key, name)) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

auto PlanBadRequest(std::chrono::system_clock::time_point now) -> ResponsePlan {
    return plan_text(400, "Bad Request", "Bad request", true, now);
}

auto PlanNotFound(bool send_body, std::chrono::system_clock::time_point now) -> ResponsePlan {
    return plan_text(404, "Not Found", std::string{kNotFoundBody}, send_body, now);
}

auto PlanResponse(HttpRequestHead const&                request,
                  Media::MediaResourceSet const&        resources,
                  std::chrono::system_clock::time_point now) -> ResponsePlan {
    bool const is_head = request.method == "HEAD";
    if (!is_head && request.method != "GET") {
        auto plan = plan_text(501, "Not Implemented", "Not implemented", true, now);
        plan.headers.emplace_back("Allow", "GET, HEAD");
        return plan;
    }

    auto const* resource = resources.find(request.path);
    if (resource == nullptr) {
        return PlanNotFound(!is_head, now);
    }

    auto const total = resource->content_length;
    std::optional<ByteRange> requested;
    if (auto range_header = request.header("Range")) {
        requested = ParseRangeHeader(*range_header);
    }

    ResponsePlan plan;
    plan.resource  = resource;
    plan.send_body = !is_head;
    plan.headers.emplace_back("Content-Type", resource->mime_type);

    if (requested) {
        auto resolved = ResolveRange(*requested, total);
        if (!resolved) {
            plan.status    = 416;
            plan.reason    = "Range Not Satisfiable";
            plan.resource  = nullptr;
            plan.send_body = false;
            plan.headers.emplace_back("Content-Length", "0");
            plan.headers.emplace_back("Content-Range", "bytes */" + std::to_string(total));
            add_common_headers(plan, now);
            return plan;
        }
        plan.status = 206;
        plan.reason = "Partial Content";
        plan.span   = resolved;
        plan.headers.emplace_back("Content-Length", std::to_string(resolved->length()));
        plan.headers.emplace_back("Content-Range", FormatContentRange(*resolved, total));
    } else {
        plan.status = 200;
        plan.reason = "OK";
        if (total > 0) {
            plan.span = ResolvedRange{.first = 0, .last = total - 1};
        }
        plan.headers.emplace_back("Content-Length", std::to_string(total));
    }
    plan.headers.emplace_back("Last-Modified", format_http_date(resource->last_modified));
    plan.headers.emplace_back("Accept-Ranges", "bytes");
    plan.headers.emplace_back("Access-Control-Allow-Origin", "*");
    add_common_headers(plan, now);
    return plan;
}

auto SerializeResponseHead(ResponsePlan const& plan) -> std::string {
    std::string head = "HTTP/1.1 " + std::to_string(plan.status) + " " + plan.reason + "\r\n";
    for (auto const& [key, value] : plan.headers) {
        head.append(key).append(": ").append(value).append("\r\n");
    }
    head.append("\r\n");
    return head;
}

} // namespace CR::Http
