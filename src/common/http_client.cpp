#include "common/http_client.hpp"
#include "common/url.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <optional>

namespace toolrelay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

http::request<http::string_body> build_request(http::verb method, const UrlComponents& url,
                                               const std::string& body,
                                               const HttpHeaders& headers,
                                               const HttpClientOptions& options) {
    http::request<http::string_body> req{method, url.path, 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, options.user_agent);
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!body.empty() || method == http::verb::post) {
        if (req[http::field::content_type].empty()) {
            req.set(http::field::content_type, "application/json");
        }
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

template<typename Stream>
net::awaitable<HttpResult> exchange(Stream& stream, http::request<http::string_body>& req) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    auto& res = parser.get();
    co_return HttpResult{res.result_int(), std::move(res.body())};
}

net::awaitable<HttpResult> run_request(UrlComponents url,
                                       http::request<http::string_body> req,
                                       HttpClientOptions options) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

    if (!url.use_ssl) {
        beast::tcp_stream stream(executor);
        stream.expires_after(options.timeout);
        co_await stream.async_connect(endpoints, net::use_awaitable);
        auto result = co_await exchange(stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return result;
    }

    ssl::context ctx(ssl::context::tlsv12_client);
    if (options.ssl_verify) {
        if (!options.ssl_ca_file.empty()) {
            ctx.load_verify_file(options.ssl_ca_file);
        } else {
            ctx.set_default_verify_paths();
        }
        ctx.set_verify_mode(ssl::verify_peer);
        ctx.set_verify_callback(ssl::host_name_verification(url.host));
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    beast::ssl_stream<beast::tcp_stream> stream(executor, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw boost::system::system_error(
            boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                      net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(stream).expires_after(options.timeout);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
    auto result = co_await exchange(stream, req);

    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return result;
}

} // anonymous namespace

std::expected<HttpResult, std::string> http_request(http::verb method,
                                                    const std::string& url,
                                                    const std::string& body,
                                                    const HttpHeaders& headers,
                                                    const HttpClientOptions& options) {
    auto parts = parse_url(url);
    if (!parts || parts->scheme == "ws" || parts->scheme == "wss") {
        return std::unexpected("invalid URL: " + url);
    }

    auto req = build_request(method, *parts, body, headers, options);

    net::io_context ioc;
    std::optional<HttpResult> result;
    std::string error;

    net::co_spawn(ioc, run_request(*parts, std::move(req), options),
        [&](std::exception_ptr ep, HttpResult r) {
            if (!ep) {
                result = std::move(r);
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const boost::system::system_error& e) {
                error = e.code() == beast::error::timeout ? "request timed out" : e.code().message();
            } catch (const std::exception& e) {
                error = e.what();
            }
        });
    ioc.run();

    if (!result) {
        return std::unexpected(error.empty() ? std::string("request failed") : error);
    }
    return *result;
}

} // namespace toolrelay
