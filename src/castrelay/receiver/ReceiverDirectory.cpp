#include "receiver/ReceiverDirectory.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace CR::Receiver {

ReceiverDirectory::ReceiverDirectory()
    : ReceiverDirectory(ReceiverLookupOptions{}) {}

ReceiverDirectory::ReceiverDirectory(ReceiverLookupOptions options)
    : options_(options)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

auto ReceiverDirectory::register_name(std::string name, Factory factory) -> void {
    entries_.push_back(Entry{.key = std::move(name), .is_scheme = false, .factory = std::move(factory)});
}

auto ReceiverDirectory::register_scheme(std::string scheme, Factory factory) -> void {
    entries_.push_back(Entry{.key = std::move(scheme), .is_scheme = true, .factory = std::move(factory)});
}

auto ReceiverDirectory::set_sleeper(Sleeper sleeper) -> void {
    sleeper_ = std::move(sleeper);
}

auto ReceiverDirectory::match(std::string_view device) const -> Entry const* {
    for (auto const& entry : entries_) {
        if (!entry.is_scheme && entry.key == device) {
            return &entry;
        }
    }
    for (auto const& entry : entries_) {
        if (entry.is_scheme && device.starts_with(entry.key)) {
            return &entry;
        }
    }
    return nullptr;
}

auto ReceiverDirectory::known_devices() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (auto const& entry : entries_) {
        names.push_back(entry.is_scheme ? entry.key + "<host>[:port]" : entry.key);
    }
    return names;
}

auto ReceiverDirectory::find(std::string_view device) const -> Expected<std::unique_ptr<RemoteReceiver>> {
    auto const* entry = match(device);
    if (entry == nullptr) {
        std::string options;
        for (auto const& name : known_devices()) {
            if (!options.empty()) {
                options.append(", ");
            }
            options.append(name);
        }
        return std::unexpected(Error{Error::Code::NotFound,
                                     "Couldn't find device '" + std::string{device} + "', options are: [" + options
                                         + "]"});
    }

    auto const attempts = std::max(options_.max_attempts, 1);
    auto       backoff  = options_.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        auto receiver = entry->factory(device);
        if (receiver || !isTransient(receiver.error()) || attempt >= attempts) {
            return receiver;
        }
        cr_log("Receiver lookup attempt " + std::to_string(attempt) + " failed: " + describeError(receiver.error()),
               "ReceiverDirectory");
        sleeper_(backoff);
        backoff = std::chrono::milliseconds{
            static_cast<long long>(static_cast<double>(backoff.count()) * options_.backoff_multiplier)};
    }
}

} // namespace CR::Receiver
