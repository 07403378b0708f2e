#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include "app/http_transport.hpp"
#include "support/test_support.hpp"

namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using wrapmcp::app::HttpTransport;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::is_error;
using wrapmcp::logstore::LogStore;
using wrapmcp::proxy::ProxyOrchestrator;
using wrapmcp::tools::BuiltinTools;
using wrapmcp::tools::ToolManager;
using wrapmcp::wrappee::ControllerOptions;
using wrapmcp::wrappee::WrappeeController;
using nlohmann::json;
using namespace std::chrono_literals;

class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ControllerOptions options;
        options.spawn = wrapmcp::testing::fake_wrappee();
        controller_ = std::make_unique<WrappeeController>(options, nullptr);
        manager_ = std::make_unique<ToolManager>(BuiltinTools(store_, nullptr), *controller_, 5s);
        orchestrator_ = std::make_unique<ProxyOrchestrator>(*manager_, store_, "2025-03-26");
        transport_ = std::make_unique<HttpTransport>(*orchestrator_, "127.0.0.1", 0);
        ASSERT_FALSE(is_error(transport_->start()));
        ASSERT_NE(transport_->bound_port(), 0);
    }

    void TearDown() override {
        transport_->stop();
    }

    http::response<http::string_body> send(http::verb verb, const std::string& target,
                                           const std::string& body = "") {
        net::io_context io;
        tcp::socket socket(io);
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), transport_->bound_port()));

        http::request<http::string_body> request{verb, target, 11};
        request.set(http::field::host, "127.0.0.1");
        request.set(http::field::content_type, "application/json");
        request.body() = body;
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    std::shared_ptr<LogStore> store_ = std::make_shared<LogStore>(100);
    std::unique_ptr<WrappeeController> controller_;
    std::unique_ptr<ToolManager> manager_;
    std::unique_ptr<ProxyOrchestrator> orchestrator_;
    std::unique_ptr<HttpTransport> transport_;
};

TEST_F(HttpTransportTest, PostReturnsResponse) {
    const auto response =
        send(http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})");
    EXPECT_EQ(response.result(), http::status::ok);
    const json body = json::parse(response.body());
    EXPECT_EQ(body["id"], 5);
    EXPECT_EQ(body["result"]["tools"].size(), 3u);
}

TEST_F(HttpTransportTest, NotificationIsAccepted) {
    const auto response = send(http::verb::post, "/mcp",
                               R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(response.result(), http::status::accepted);
}

TEST_F(HttpTransportTest, MalformedBodyIsBadRequest) {
    const auto response = send(http::verb::post, "/mcp", "{not json");
    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(response.body())["error"]["code"], -32700);
}

TEST_F(HttpTransportTest, OtherPathsAreNotFound) {
    EXPECT_EQ(send(http::verb::post, "/other", "{}").result(), http::status::not_found);
    EXPECT_EQ(send(http::verb::delete_, "/mcp").result(), http::status::method_not_allowed);
}

TEST_F(HttpTransportTest, InvalidHostIsRejected) {
    HttpTransport transport(*orchestrator_, "not-an-address", 0);
    const auto started = transport.start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "invalid_http_host");
}

}  // namespace
