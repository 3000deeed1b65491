#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace CR::Session {

inline constexpr std::string_view kDefaultProbeHost = "8.8.8.8";
inline constexpr std::uint16_t    kDefaultProbePort = 80;

// Local address the OS would route through to reach probe_host. Connecting a UDP socket only
// performs the route lookup; nothing is sent.
[[nodiscard]] auto DetermineOutboundAddress(std::string_view probe_host = kDefaultProbeHost,
                                            std::uint16_t    probe_port = kDefaultProbePort) -> Expected<std::string>;

// "http://host:port/path", bracketing IPv6 literals.
[[nodiscard]] auto BuildResourceUrl(std::string_view host, std::uint16_t port, std::string_view path) -> std::string;

} // namespace CR::Session
