#pragma once

#include <castrelay/app/CastOptions.hpp>

#include "core/Error.hpp"
#include "log/LogHooks.hpp"
#include "receiver/ReceiverDirectory.hpp"

#include <atomic>
#include <string>
#include <string_view>

namespace CR::App {

struct KodiEndpoint {
    std::string host;
    int         port = 8080;
};

// "kodi://host[:port]" with IPv6 hosts in brackets. The port defaults to Kodi's 8080.
[[nodiscard]] auto ParseKodiDevice(std::string_view device) -> Expected<KodiEndpoint>;

// The devices castrelay can drive: "loopback" and "kodi://".
[[nodiscard]] auto BuildReceiverDirectory(CastOptions const& options) -> Receiver::ReceiverDirectory;

// Casts options.filename to options.device and runs the selected control loop until the
// session ends.
auto RunCast(CastOptions const& options, std::atomic<bool> const* interrupt_flag, LogHooks hooks = {}) -> Expected<void>;

} // namespace CR::App
