#include <gtest/gtest.h>
#include "daemon/http_tool_executor.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <mutex>
#include <thread>

using namespace toolrelay;
using namespace toolrelay::daemon;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = net::ip::tcp;

namespace {

// Serves a fixed number of requests, one per connection, from a script
class FakeToolService {
public:
    struct Seen {
        std::string target;
        std::string authorization;
        std::string body;
    };

    FakeToolService(int requests, std::function<http::response<http::string_body>(const Seen&)> script)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , script_(std::move(script)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, requests]() { serve(requests); });
    }

    ~FakeToolService() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return port_; }

    std::vector<Seen> seen() {
        std::lock_guard lock(mutex_);
        return seen_;
    }

private:
    void serve(int requests) {
        for (int i = 0; i < requests; ++i) {
            boost::system::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) {
                return;
            }

            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec) {
                continue;
            }

            Seen seen{std::string(req.target()), std::string(req[http::field::authorization]), req.body()};
            {
                std::lock_guard lock(mutex_);
                seen_.push_back(seen);
            }

            auto res = script_(seen);
            res.version(req.version());
            res.keep_alive(false);
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::function<http::response<http::string_body>(const Seen&)> script_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<Seen> seen_;
};

http::response<http::string_body> reply(http::status status, std::string body) {
    http::response<http::string_body> res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
    return res;
}

HttpToolExecutor make_executor(uint16_t port, std::string token = {}) {
    HttpToolExecutorConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.auth_token = std::move(token);
    return HttpToolExecutor(config);
}

} // anonymous namespace

TEST(HttpToolExecutorTest, UrlEncode) {
    EXPECT_EQ(url_encode("read_file"), "read_file");
    EXPECT_EQ(url_encode("a b/c?d"), "a%20b%2Fc%3Fd");
    EXPECT_EQ(url_encode("~x.y-z"), "~x.y-z");
}

TEST(HttpToolExecutorTest, ExecuteSuccess) {
    FakeToolService service(1, [](const FakeToolService::Seen&) {
        return reply(http::status::ok, R"({"lines":3})");
    });
    auto executor = make_executor(service.port(), "tool-secret");

    auto result = executor.execute("read file", {{"path", "/tmp/x"}}, std::chrono::milliseconds(2000));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->as_object().at("lines").to_number<int>(), 3);

    auto seen = service.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].target, "/api/mcp/call?tool_name=read%20file");
    EXPECT_EQ(seen[0].authorization, "Bearer tool-secret");
    EXPECT_EQ(json::parse(seen[0].body).as_object().at("path").as_string(), "/tmp/x");
}

TEST(HttpToolExecutorTest, NonJsonOutputIsString) {
    FakeToolService service(1, [](const FakeToolService::Seen&) {
        return reply(http::status::ok, "plain text output");
    });
    auto executor = make_executor(service.port());

    auto result = executor.execute("cat", {}, std::chrono::milliseconds(2000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->as_string(), "plain text output");
    EXPECT_TRUE(service.seen()[0].authorization.empty());
}

TEST(HttpToolExecutorTest, StatusMapping) {
    FakeToolService service(3, [](const FakeToolService::Seen& seen) {
        if (seen.target.ends_with("=missing")) {
            return reply(http::status::not_found, R"({"detail":"Tool not found"})");
        }
        if (seen.target.ends_with("=invalid")) {
            return reply(http::status::unprocessable_entity, R"({"detail":"path is required"})");
        }
        return reply(http::status::internal_server_error, R"({"error":"disk full"})");
    });
    auto executor = make_executor(service.port());
    auto timeout = std::chrono::milliseconds(2000);

    auto missing = executor.execute("missing", {}, timeout);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::UNKNOWN_METHOD);

    auto invalid = executor.execute("invalid", {}, timeout);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().kind, ErrorKind::INVALID_PARAMS);
    EXPECT_EQ(invalid.error().message, "path is required");

    auto failed = executor.execute("broken", {}, timeout);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::TOOL_EXECUTION_FAILED);
    EXPECT_NE(failed.error().message.find("disk full"), std::string::npos);
}

TEST(HttpToolExecutorTest, UnreachableServiceFails) {
    uint16_t port;
    {
        // Grab a free port, then release it
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }
    auto executor = make_executor(port);

    auto result = executor.execute("anything", {}, std::chrono::milliseconds(1000));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::TOOL_EXECUTION_FAILED);
    EXPECT_TRUE(executor.list_tools().empty());
}

TEST(HttpToolExecutorTest, ListTools) {
    FakeToolService service(1, [](const FakeToolService::Seen&) {
        return reply(http::status::ok, R"({"tools":[{"name":"grep"},{"name":"ls"}]})");
    });
    auto executor = make_executor(service.port());

    auto tools = executor.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[1].as_object().at("name").as_string(), "ls");
    EXPECT_EQ(service.seen()[0].target, "/api/mcp/tools");
}
