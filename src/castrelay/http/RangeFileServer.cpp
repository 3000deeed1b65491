#include "http/RangeFileServer.hpp"

#include "http/HttpRequest.hpp"
#include "http/ResponsePlan.hpp"
#include "log/TaggedLogger.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace CR::Http {
namespace {

constexpr std::size_t kDefaultChunkSize = 64 * 1024;

class ScopedSocketCloser {
public:
    explicit ScopedSocketCloser(asio::ip::tcp::socket& socket)
        : socket_(socket) {}

    ~ScopedSocketCloser() {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    asio::ip::tcp::socket& socket_;
};

// Address a throwaway client can reach to unblock a pending accept().
auto wake_address(asio::ip::address const& bound) -> asio::ip::address {
    if (bound.is_unspecified()) {
        if (bound.is_v6()) {
            return asio::ip::address_v6::loopback();
        }
        return asio::ip::address_v4::loopback();
    }
    return bound;
}

} // namespace

class RangeFileServer::Impl {
public:
    Impl(Media::MediaResourceSet resources, Options options, LogHooks hooks)
        : resources_(std::move(resources))
        , options_(std::move(options))
        , hooks_(std::move(hooks)) {
        if (options_.chunk_size == 0) {
            options_.chunk_size = kDefaultChunkSize;
        }
    }

    ~Impl() {
        stop();
    }

    auto start() -> Expected<void> {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (running_.load()) {
            return {};
        }
        if (options_.port < 0 || options_.port > 65535) {
            return std::unexpected(Error{Error::Code::MalformedInput, "port out of range"});
        }
        std::error_code ec;
        auto address = asio::ip::make_address(options_.host, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::MalformedInput, "invalid bind address '" + options_.host + "'"});
        }
        asio::ip::tcp::endpoint endpoint(address, static_cast<std::uint16_t>(options_.port));
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol(), ec);
        if (ec) {
            acceptor_.reset();
            return std::unexpected(Error{Error::Code::IoError, "failed to open acceptor: " + ec.message()});
        }
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
        acceptor_->bind(endpoint, ec);
        if (ec) {
            acceptor_.reset();
            auto code = ec == asio::error::address_in_use ? Error::Code::AddressInUse : Error::Code::IoError;
            return std::unexpected(Error{code, "failed to bind " + options_.host + ":" + std::to_string(options_.port)
                                                   + ": " + ec.message()});
        }
        acceptor_->listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            acceptor_.reset();
            return std::unexpected(Error{Error::Code::IoError, "failed to listen: " + ec.message()});
        }
        bound_address_ = address;
        actual_port_   = acceptor_->local_endpoint().port();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            stopped_ = false;
        }
        running_       = true;
        accept_thread_ = std::thread([this]() { accept_loop(); });
        cr_log("RangeFileServer listening on " + options_.host + ":" + std::to_string(actual_port_),
               "RangeFileServer");
        return {};
    }

    void stop() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        wake_acceptor();
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        std::error_code ec;
        acceptor_->close(ec);

        std::unique_lock<std::mutex> lock(state_mutex_);
        for (auto& [id, socket] : connections_) {
            socket->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        }
        state_cv_.wait(lock, [this]() { return connections_.empty(); });
        acceptor_.reset();
        stopped_ = true;
        state_cv_.notify_all();
        cr_log("RangeFileServer stopped", "RangeFileServer");
    }

    void join() {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this]() { return stopped_; });
    }

    [[nodiscard]] bool running() const {
        return running_.load();
    }

    [[nodiscard]] std::uint16_t port() const {
        return actual_port_;
    }

    [[nodiscard]] Media::MediaResourceSet const& resources() const {
        return resources_;
    }

private:
    void wake_acceptor() {
        std::error_code        ec;
        asio::ip::tcp::socket  waker(io_context_);
        asio::ip::tcp::endpoint target(wake_address(bound_address_), actual_port_);
        waker.connect(target, ec);
        waker.close(ec);
    }

    void accept_loop() {
        while (running()) {
            auto           socket = std::make_shared<asio::ip::tcp::socket>(io_context_);
            std::error_code ec;
            acceptor_->accept(*socket, ec);
            if (!running()) {
                socket->close(ec);
                break;
            }
            if (ec) {
                cr_log("RangeFileServer accept failed: " + ec.message(), "RangeFileServer");
                continue;
            }
            std::uint64_t id = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                id = next_connection_id_++;
                connections_.emplace(id, socket);
            }
            launch_handler(id, std::move(socket));
        }
    }

    void launch_handler(std::uint64_t id, std::shared_ptr<asio::ip::tcp::socket> socket) {
        auto task = [this, id, socket]() { handle_connection(id, socket); };
        try {
            if (options_.launch_handler) {
                options_.launch_handler(std::move(task));
            } else {
                std::thread(std::move(task)).detach();
            }
        } catch (std::system_error const& error) {
            emit_error(hooks_, std::string{"castrelay: cannot start a connection handler: "} + error.what());
            std::error_code ec;
            socket->close(ec);
            std::lock_guard<std::mutex> lock(state_mutex_);
            connections_.erase(id);
            state_cv_.notify_all();
        }
    }

    void handle_connection(std::uint64_t id, std::shared_ptr<asio::ip::tcp::socket> socket) {
        {
            ScopedSocketCloser closer(*socket);
            serve(*socket);
        }
        socket.reset();
        std::lock_guard<std::mutex> lock(state_mutex_);
        connections_.erase(id);
        state_cv_.notify_all();
    }

    void serve(asio::ip::tcp::socket& socket) {
        asio::streambuf buffer(kMaxRequestHeadBytes);
        std::error_code ec;
        auto head_bytes = asio::read_until(socket, buffer, "\r\n\r\n", ec);
        auto now        = std::chrono::system_clock::now();
        if (ec) {
            if (ec == asio::error::not_found) {
                write_plan(socket, PlanBadRequest(now));
            }
            return;
        }
        auto        data = buffer.data();
        std::string raw(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(head_bytes));
        auto        request = ParseRequestHead(raw);
        if (!request) {
            cr_log("Rejecting request: " + describeError(request.error()), "RangeFileServer");
            write_plan(socket, PlanBadRequest(now));
            return;
        }

        auto          plan = PlanResponse(*request, resources_, now);
        std::ifstream file;
        if (plan.resource != nullptr) {
            file.open(plan.resource->path, std::ios::binary);
            if (!file) {
                cr_log("Cannot open " + plan.resource->path, "RangeFileServer");
                plan = PlanNotFound(plan.send_body, now);
            }
        }
        cr_log(request->method + " " + request->target + " -> " + std::to_string(plan.status), "RangeFileServer");

        if (!write_plan(socket, plan)) {
            return;
        }
        if (plan.send_body && plan.span && file.is_open()) {
            stream_span(socket, file, *plan.span, plan.resource->path);
        }
    }

    // Writes the head and any inline body. False when the peer has gone away.
    bool write_plan(asio::ip::tcp::socket& socket, ResponsePlan const& plan) {
        std::error_code ec;
        auto            head = SerializeResponseHead(plan);
        asio::write(socket, asio::buffer(head), ec);
        if (!ec && plan.send_body && !plan.span && !plan.body.empty()) {
            asio::write(socket, asio::buffer(plan.body), ec);
        }
        if (ec) {
            cr_log("Client went away before headers were sent: " + ec.message(), "RangeFileServer");
            return false;
        }
        return true;
    }

    void stream_span(asio::ip::tcp::socket& socket,
                     std::ifstream&         file,
                     ResolvedRange const&   span,
                     std::string const&     path) {
        file.seekg(static_cast<std::streamoff>(span.first));
        if (!file) {
            emit_error(hooks_, "castrelay: cannot seek in " + path);
            return;
        }
        std::vector<char> chunk(options_.chunk_size);
        auto              remaining = span.length();
        while (remaining > 0) {
            auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, chunk.size()));
            file.read(chunk.data(), want);
            auto got = file.gcount();
            if (got <= 0) {
                emit_error(hooks_, "castrelay: short read from " + path);
                return;
            }
            std::error_code ec;
            asio::write(socket, asio::buffer(chunk.data(), static_cast<std::size_t>(got)), ec);
            if (ec) {
                // Receivers drop the connection whenever they stop or seek.
                cr_log("Client disconnected mid-stream: " + ec.message(), "RangeFileServer");
                return;
            }
            cr_log("Sent " + std::to_string(got) + " bytes", "RangeFileServer", "StreamChunk");
            remaining -= static_cast<std::uint64_t>(got);
        }
    }

    Media::MediaResourceSet resources_;
    Options                 options_;
    LogHooks                hooks_;

    asio::io_context                         io_context_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    asio::ip::address                        bound_address_;
    std::thread                              accept_thread_;
    std::atomic<bool>                        running_{false};
    std::uint16_t                            actual_port_{0};
    std::mutex                               lifecycle_mutex_;

    std::mutex                                                                 state_mutex_;
    std::condition_variable                                                    state_cv_;
    std::unordered_map<std::uint64_t, std::shared_ptr<asio::ip::tcp::socket>> connections_;
    std::uint64_t                                                              next_connection_id_{0};
    bool                                                                       stopped_{true};
};

RangeFileServer::RangeFileServer(Media::MediaResourceSet resources)
    : RangeFileServer(std::move(resources), Options{}, LogHooks{}) {}

RangeFileServer::RangeFileServer(Media::MediaResourceSet resources, Options options, LogHooks hooks)
    : impl_(std::make_unique<Impl>(std::move(resources), std::move(options), std::move(hooks))) {}

RangeFileServer::~RangeFileServer() {
    stop();
}

auto RangeFileServer::start() -> Expected<void> {
    return impl_->start();
}

auto RangeFileServer::stop() -> void {
    impl_->stop();
}

auto RangeFileServer::join() -> void {
    impl_->join();
}

auto RangeFileServer::is_running() const -> bool {
    return impl_->running();
}

auto RangeFileServer::port() const -> std::uint16_t {
    return impl_->port();
}

auto RangeFileServer::resources() const -> Media::MediaResourceSet const& {
    return impl_->resources();
}

} // namespace CR::Http
