#pragma once

#include "core/Error.hpp"
#include "log/LogHooks.hpp"
#include "media/MediaResource.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace CR::Http {

// Serves the resources of one MediaResourceSet with byte-range support. One handler thread per
// connection, one request per connection.
class RangeFileServer {
public:
    struct Options {
        std::string host       = "0.0.0.0";
        int         port       = 8080; // 0 picks an ephemeral port
        std::size_t chunk_size = 64 * 1024;
        // Runs one connection handler. Defaults to a detached std::thread. A std::system_error
        // thrown here drops that connection only.
        std::function<void(std::function<void()>)> launch_handler;
    };

    explicit RangeFileServer(Media::MediaResourceSet resources);
    RangeFileServer(Media::MediaResourceSet resources, Options options, LogHooks hooks = {});
    ~RangeFileServer();

    RangeFileServer(RangeFileServer const&)                    = delete;
    auto operator=(RangeFileServer const&) -> RangeFileServer& = delete;
    RangeFileServer(RangeFileServer&&)                         = delete;
    auto operator=(RangeFileServer&&) -> RangeFileServer&      = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    // Closes the listener, shuts down in-flight connections and waits for every handler to exit.
    auto stop() -> void;
    // Blocks until a stop() issued elsewhere has completed. Returns at once if never started.
    auto join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;
    [[nodiscard]] auto resources() const -> Media::MediaResourceSet const&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace CR::Http
