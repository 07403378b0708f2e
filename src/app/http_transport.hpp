#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "proxy/proxy_orchestrator.hpp"

namespace wrapmcp::app {

// Streamable HTTP endpoint:
//   POST /mcp  one JSON-RPC message in, its response out (202 for notifications)
//   GET  /mcp  server-sent events carrying outbound notifications
// One thread per connection; each POST is answered on its own thread, so calls overlap.
class HttpTransport : public proxy::NotificationSink {
public:
    HttpTransport(proxy::ProxyOrchestrator& orchestrator, std::string host, std::uint16_t port);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    core::errors::Status start();
    void stop();

    void send_notification(const nlohmann::json& message) override;

    std::uint16_t bound_port() const { return bound_port_.load(); }

private:
    struct EventStream {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> events;
        bool closed = false;
    };

    void accept_loop();
    void serve(boost::asio::ip::tcp::socket socket);
    void stream_events(boost::asio::ip::tcp::socket& socket);
    void reap_finished();

    proxy::ProxyOrchestrator& orchestrator_;
    const std::string host_;
    const std::uint16_t port_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::thread accept_thread_;

    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex connections_mutex_;
    std::vector<Connection> connections_;

    std::mutex streams_mutex_;
    std::vector<std::shared_ptr<EventStream>> streams_;
};

}  // namespace wrapmcp::app
