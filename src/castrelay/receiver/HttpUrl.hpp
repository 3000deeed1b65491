#pragma once

#include "core/Error.hpp"

#include <string>
#include <string_view>

namespace CR::Receiver {

struct HttpUrl {
    std::string scheme_host_port; // "http://host:port", accepted by httplib::Client
    std::string host;
    int         port = 80;
    std::string path; // includes any query, "/" when empty
};

[[nodiscard]] auto ParseHttpUrl(std::string_view url) -> Expected<HttpUrl>;

} // namespace CR::Receiver
