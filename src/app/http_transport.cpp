#include "app/http_transport.hpp"

#include <chrono>
#include <sys/socket.h>
#include <sys/time.h>
#include <utility>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "core/config/proxy_config.hpp"
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"

namespace wrapmcp::app {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

namespace {

constexpr const char* kEndpoint = "/mcp";
constexpr std::size_t kBodyLimit = 16 * 1024 * 1024;
constexpr std::chrono::milliseconds kAcceptIdle{50};
constexpr std::chrono::seconds kStreamWake{1};
constexpr int kKeepAliveEvery = 15;  // stream wake-ups between keep-alive comments

void set_receive_timeout(tcp::socket& socket, const int seconds) {
    timeval timeout{};
    timeout.tv_sec = seconds;
    static_cast<void>(setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &timeout,
                                 sizeof(timeout)));
}

}  // namespace

HttpTransport::HttpTransport(proxy::ProxyOrchestrator& orchestrator, std::string host,
                             const std::uint16_t port)
    : orchestrator_(orchestrator), host_(std::move(host)), port_(port), acceptor_(io_) {}

HttpTransport::~HttpTransport() {
    stop();
}

core::errors::Status HttpTransport::start() {
    beast::error_code ec;
    const auto address = net::ip::make_address(host_, ec);
    if (ec) {
        return ProxyError{ErrorCategory::Input, "Invalid HTTP host: " + host_, "invalid_http_host"};
    }

    const tcp::endpoint endpoint{address, port_};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor_.non_blocking(true, ec);
    }
    if (ec) {
        return ProxyError{ErrorCategory::Internal,
                          "Cannot listen on " + host_ + ":" + std::to_string(port_) + ": " +
                              ec.message(),
                          "http_bind_failed", "Pick another port with --port."};
    }

    bound_port_.store(acceptor_.local_endpoint(ec).port());
    running_.store(true);
    accept_thread_ = std::thread([this] { accept_loop(); });
    LOG_INFO("Listening on http://" + host_ + ":" + std::to_string(bound_port()) + kEndpoint);
    return core::errors::ok();
}

void HttpTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    beast::error_code ec;
    acceptor_.close(ec);

    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (const auto& stream : streams_) {
            std::lock_guard<std::mutex> stream_lock(stream->mutex);
            stream->closed = true;
            stream->cv.notify_all();
        }
    }

    std::vector<Connection> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
    LOG_INFO("HTTP transport stopped");
}

void HttpTransport::reap_finished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpTransport::accept_loop() {
    while (running_.load()) {
        tcp::socket socket(io_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            if (ec != net::error::would_block && ec != net::error::try_again) {
                LOG_WARN("HTTP accept failed: " + ec.message());
            }
            std::this_thread::sleep_for(kAcceptIdle);
            continue;
        }

        reap_finished();
        set_receive_timeout(socket, 5);
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(Connection{
            std::thread([this, peer = std::move(socket), done]() mutable {
                serve(std::move(peer));
                done->store(true);
            }),
            done});
    }
}

void HttpTransport::serve(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request_parser<http::string_body> parser;
    parser.body_limit(kBodyLimit);
    http::read(socket, buffer, parser, ec);
    if (ec) {
        LOG_DEBUG("HTTP read failed: " + ec.message());
        return;
    }
    const auto request = parser.release();

    http::response<http::string_body> response{http::status::ok, request.version()};
    response.set(http::field::server, core::config::kProgramName);
    response.keep_alive(false);

    if (request.target() != kEndpoint) {
        response.result(http::status::not_found);
    } else if (request.method() == http::verb::get) {
        stream_events(socket);
        return;
    } else if (request.method() != http::verb::post) {
        response.result(http::status::method_not_allowed);
        response.set(http::field::allow, "GET, POST");
    } else {
        auto decoded = protocol::decode_message(request.body());
        if (core::errors::is_error(decoded)) {
            const auto& error = core::errors::get_error(decoded);
            response.result(http::status::bad_request);
            response.set(http::field::content_type, "application/json");
            response.body() = protocol::dump_safe(protocol::encode(protocol::failure(
                nullptr,
                protocol::RpcError{error.rpc_code.value_or(protocol::rpc_codes::kInvalidRequest),
                                   error.message, std::nullopt})));
        } else if (auto reply = orchestrator_.handle_message(core::errors::get_value(decoded))) {
            response.set(http::field::content_type, "application/json");
            response.body() = protocol::dump_safe(*reply);
        } else {
            response.result(http::status::accepted);
        }
    }

    response.prepare_payload();
    http::write(socket, response, ec);
    if (ec) {
        LOG_DEBUG("HTTP write failed: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void HttpTransport::stream_events(tcp::socket& socket) {
    auto stream = std::make_shared<EventStream>();
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.push_back(stream);
    }

    beast::error_code ec;
    http::response<http::empty_body> header{http::status::ok, 11};
    header.set(http::field::server, core::config::kProgramName);
    header.set(http::field::content_type, "text/event-stream");
    header.set(http::field::cache_control, "no-cache");
    header.keep_alive(false);
    http::response_serializer<http::empty_body> serializer{header};
    http::write_header(socket, serializer, ec);

    int idle_wakes = 0;
    while (!ec && running_.load()) {
        std::deque<std::string> pending;
        {
            std::unique_lock<std::mutex> lock(stream->mutex);
            stream->cv.wait_for(lock, kStreamWake,
                                [&stream] { return stream->closed || !stream->events.empty(); });
            if (stream->closed) {
                break;
            }
            pending.swap(stream->events);
        }

        if (pending.empty()) {
            if (++idle_wakes >= kKeepAliveEvery) {
                idle_wakes = 0;
                pending.push_back(": keep-alive\n\n");
            }
        } else {
            idle_wakes = 0;
        }
        for (const auto& event : pending) {
            net::write(socket, net::buffer(event), ec);
            if (ec) {
                break;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto it = streams_.begin(); it != streams_.end(); ++it) {
            if (*it == stream) {
                streams_.erase(it);
                break;
            }
        }
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
}

void HttpTransport::send_notification(const json& message) {
    const std::string event = "event: message\ndata: " + protocol::dump_safe(message) + "\n\n";
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto& stream : streams_) {
        std::lock_guard<std::mutex> stream_lock(stream->mutex);
        stream->events.push_back(event);
        stream->cv.notify_all();
    }
}

}  // namespace wrapmcp::app
