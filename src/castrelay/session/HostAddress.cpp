#include "session/HostAddress.hpp"

#include "log/TaggedLogger.hpp"

#include <asio.hpp>

#include <system_error>

namespace CR::Session {

auto DetermineOutboundAddress(std::string_view probe_host, std::uint16_t probe_port) -> Expected<std::string> {
    std::error_code ec;
    auto            target = asio::ip::make_address(std::string{probe_host}, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid probe address '" + std::string{probe_host} + "'"});
    }
    asio::io_context      io;
    asio::ip::udp::socket socket(io);
    socket.open(target.is_v6() ? asio::ip::udp::v6() : asio::ip::udp::v4(), ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot open probe socket: " + ec.message()});
    }
    socket.connect(asio::ip::udp::endpoint(target, probe_port), ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::NotConnected, "no route to " + std::string{probe_host} + ": " + ec.message()});
    }
    auto            local = socket.local_endpoint(ec);
    std::error_code ignored;
    socket.close(ignored);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot read local endpoint: " + ec.message()});
    }
    auto address = local.address().to_string();
    cr_log("Outbound address is " + address, "HostAddress");
    return address;
}

auto BuildResourceUrl(std::string_view host, std::uint16_t port, std::string_view path) -> std::string {
    std::string url = "http://";
    if (host.find(':') != std::string_view::npos && !host.starts_with("[")) {
        url.append("[").append(host).append("]");
    } else {
        url.append(host);
    }
    url.append(":").append(std::to_string(port)).append(path);
    return url;
}

} // namespace CR::Session
