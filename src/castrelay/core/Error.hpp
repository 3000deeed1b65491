#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace CR {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        MalformedInput,
        Timeout,
        NotConnected,
        InvalidState,
        IoError,
        AddressInUse,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::NotConnected:
        return "not_connected";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::AddressInUse:
        return "address_in_use";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

// Receivers report these while momentarily unreachable; callers may retry.
[[nodiscard]] inline auto isTransient(Error const& error) -> bool {
    return error.code == Error::Code::NotConnected || error.code == Error::Code::Timeout;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace CR
