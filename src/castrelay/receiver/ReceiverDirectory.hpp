#pragma once

#include "receiver/RemoteReceiver.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace CR::Receiver {

struct ReceiverLookupOptions {
    int                       max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    double                    backoff_multiplier = 2.0;
};

// Resolves a device string to a receiver. Exact names ("loopback") are matched first, then
// scheme prefixes ("kodi://").
class ReceiverDirectory {
public:
    using Factory = std::function<Expected<std::unique_ptr<RemoteReceiver>>(std::string_view device)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ReceiverDirectory();
    explicit ReceiverDirectory(ReceiverLookupOptions options);

    auto register_name(std::string name, Factory factory) -> void;
    auto register_scheme(std::string scheme, Factory factory) -> void;
    // Tests replace the backoff sleep.
    auto set_sleeper(Sleeper sleeper) -> void;

    // Transient factory failures are retried with exponential backoff, up to max_attempts.
    [[nodiscard]] auto find(std::string_view device) const -> Expected<std::unique_ptr<RemoteReceiver>>;
    [[nodiscard]] auto known_devices() const -> std::vector<std::string>;

private:
    struct Entry {
        std::string key;
        bool        is_scheme = false;
        Factory     factory;
    };

    [[nodiscard]] auto match(std::string_view device) const -> Entry const*;

    ReceiverLookupOptions options_;
    std::vector<Entry>    entries_;
    Sleeper               sleeper_;
};

} // namespace CR::Receiver
