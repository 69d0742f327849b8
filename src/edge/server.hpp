#pragma once

#include "common/config.hpp"
#include "edge/request_facade.hpp"
#include "edge/session_coordinator.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace toolrelay::edge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/**
 * Server - the edge's single listening socket.
 *
 * Each accepted connection runs as a coroutine on its own strand. Plain HTTP
 * requests go to the RequestFacade; a WebSocket upgrade on /ws (or
 * /projects/:id/ws) carrying a valid relay token in Sec-WebSocket-Protocol
 * becomes a RelaySession. A bad token is answered with 401 before the
 * upgrade, with no hint whether the project exists.
 */
class Server {
public:
    Server(net::io_context& ioc, const EdgeConfig& config,
           std::shared_ptr<SessionCoordinator> coordinator,
           std::shared_ptr<RequestFacade> facade);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Open, bind and listen. Returns the bound port (config port 0 picks one).
    uint16_t listen();

    // Accept loop. Calls listen() first if needed.
    net::awaitable<void> run();

    void stop();

    uint16_t local_port() const { return local_port_; }
    bool tls_enabled() const { return ssl_ctx_.has_value(); }

private:
    net::awaitable<void> accept_loop();

    net::awaitable<void> handle_connection(tcp::socket socket);
    net::awaitable<void> handle_tls_connection(tcp::socket socket);
    net::awaitable<void> handle_plain_connection(tcp::socket socket);

    // HTTP keep-alive loop shared by plain and TLS connections
    template <class Stream>
    net::awaitable<void> serve(Stream& stream);

    template <class Stream>
    net::awaitable<void> upgrade(Stream& stream, HttpRequest req);

    net::io_context& ioc_;
    EdgeConfig config_;
    std::shared_ptr<SessionCoordinator> coordinator_;
    std::shared_ptr<RequestFacade> facade_;

    std::optional<ssl::context> ssl_ctx_;
    tcp::acceptor acceptor_;
    uint16_t local_port_ = 0;
    std::atomic<bool> running_{false};
};

// ============================================================================
// SSL utilities
// ============================================================================

namespace ssl_util {

// Server context with certificate chain and key
ssl::context create_ssl_context(const std::string& cert_file,
                                const std::string& key_file);

// Server context with a freshly generated self-signed certificate
ssl::context create_self_signed_context(const std::string& common_name = "localhost");

} // namespace ssl_util

} // namespace toolrelay::edge
