#include "edge/server.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include "edge/relay_session.hpp"
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace toolrelay::edge {

using namespace boost::asio::experimental::awaitable_operators;
namespace websocket = beast::websocket;

namespace {

auto& log() { return Logger::get("edge.server"); }

constexpr auto kHttpTimeout = std::chrono::seconds(30);

// Completes when the peer closes its end while a request is in flight.
// Pipelined bytes (or a TLS record) cannot be told apart from a close
// without reading, so the watch then idles until cancelled.
net::awaitable<void> watch_disconnect(tcp::socket& socket) {
    co_await socket.async_wait(tcp::socket::wait_read, net::use_awaitable);

    char byte;
    boost::system::error_code ec;
    auto n = socket.receive(net::buffer(&byte, 1), tcp::socket::message_peek, ec);
    if (ec || n == 0) {
        co_return;
    }

    net::steady_timer idle(co_await net::this_coro::executor,
                           net::steady_timer::time_point::max());
    co_await idle.async_wait(net::use_awaitable);
}

net::awaitable<void> graceful_shutdown(beast::tcp_stream& stream) {
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    co_return;
}

net::awaitable<void> graceful_shutdown(beast::ssl_stream<beast::tcp_stream>& stream) {
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
    auto [ec] = co_await stream.async_shutdown(net::as_tuple(net::use_awaitable));
    if (ec && ec != net::ssl::error::stream_truncated) {
        log().debug("TLS shutdown: {}", ec.message());
    }
}

} // anonymous namespace

// ============================================================================
// Server implementation
// ============================================================================

Server::Server(net::io_context& ioc, const EdgeConfig& config,
               std::shared_ptr<SessionCoordinator> coordinator,
               std::shared_ptr<RequestFacade> facade)
    : ioc_(ioc)
    , config_(config)
    , coordinator_(std::move(coordinator))
    , facade_(std::move(facade))
    , acceptor_(ioc)
{
    if (!config_.tls) {
        return;
    }
    if (config_.cert_file.empty() && config_.self_signed) {
        log().warn("No certificate configured, using a self-signed one for {}", config_.bind_address);
        ssl_ctx_.emplace(ssl_util::create_self_signed_context(config_.bind_address));
    } else {
        ssl_ctx_.emplace(ssl_util::create_ssl_context(config_.cert_file, config_.key_file));
    }
}

uint16_t Server::listen() {
    if (acceptor_.is_open()) {
        return local_port_;
    }

    tcp::endpoint endpoint(net::ip::make_address(config_.bind_address), config_.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    local_port_ = acceptor_.local_endpoint().port();
    log().info("Server listening on {}:{} (TLS: {})", config_.bind_address, local_port_,
               tls_enabled() ? "enabled" : "disabled");
    return local_port_;
}

net::awaitable<void> Server::run() {
    listen();
    running_ = true;
    co_await accept_loop();
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    log().info("Server stopped");
}

net::awaitable<void> Server::accept_loop() {
    while (running_) {
        try {
            // One strand per connection: relay sessions read and write concurrently
            tcp::socket socket(net::make_strand(ioc_));
            co_await acceptor_.async_accept(socket, net::use_awaitable);

            auto executor = socket.get_executor();
            net::co_spawn(executor, handle_connection(std::move(socket)),
                [](std::exception_ptr ep) {
                    if (ep) {
                        try {
                            std::rethrow_exception(ep);
                        } catch (const std::exception& e) {
                            log().error("Connection handler exception: {}", e.what());
                        }
                    }
                });

        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                break;
            }
            log().error("Accept error: {}", e.what());
        }
    }
}

net::awaitable<void> Server::handle_connection(tcp::socket socket) {
    if (ssl_ctx_) {
        co_await handle_tls_connection(std::move(socket));
    } else {
        co_await handle_plain_connection(std::move(socket));
    }
}

net::awaitable<void> Server::handle_tls_connection(tcp::socket socket) {
    try {
        beast::ssl_stream<beast::tcp_stream> stream(std::move(socket), *ssl_ctx_);

        beast::get_lowest_layer(stream).expires_after(kHttpTimeout);
        co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);

        co_await serve(stream);

    } catch (const boost::system::system_error& e) {
        log().debug("TLS connection error: {}", e.what());
    }
}

net::awaitable<void> Server::handle_plain_connection(tcp::socket socket) {
    try {
        beast::tcp_stream stream(std::move(socket));
        co_await serve(stream);

    } catch (const boost::system::system_error& e) {
        log().debug("Plain connection error: {}", e.what());
    }
}

template <class Stream>
net::awaitable<void> Server::serve(Stream& stream) {
    beast::flat_buffer buffer;

    while (true) {
        beast::get_lowest_layer(stream).expires_after(kHttpTimeout);

        http::request_parser<http::string_body> parser;
        parser.body_limit(wire::MAX_FRAME_SIZE);

        auto [ec, bytes] = co_await http::async_read(stream, buffer, parser,
                                                     net::as_tuple(net::use_awaitable));
        if (ec == http::error::end_of_stream) {
            co_await graceful_shutdown(stream);
            co_return;
        }
        if (ec) {
            log().debug("HTTP read: {}", ec.message());
            co_return;
        }

        HttpRequest req = parser.release();

        if (websocket::is_upgrade(req)) {
            co_await upgrade(stream, std::move(req));
            co_return;
        }

        // The facade bounds its own wait; only the write is timed here
        beast::get_lowest_layer(stream).expires_never();

        auto result = co_await (facade_->handle(req) ||
                                watch_disconnect(beast::get_lowest_layer(stream).socket()));
        if (result.index() == 1) {
            log().debug("Client went away during {} {}", std::string(req.method_string()),
                        request_path(req));
            co_return;
        }

        HttpResponse res = std::get<0>(std::move(result));
        res.keep_alive(req.keep_alive());

        beast::get_lowest_layer(stream).expires_after(kHttpTimeout);
        co_await http::async_write(stream, res, net::use_awaitable);

        if (!res.keep_alive()) {
            co_await graceful_shutdown(stream);
            co_return;
        }
    }
}

template <class Stream>
net::awaitable<void> Server::upgrade(Stream& stream, HttpRequest req) {
    auto path = request_path(req);
    auto project = facade_->websocket_project(path);
    if (!project) {
        auto res = make_error_response(http::status::not_found, "not_found", "not_found",
                                       "no relay endpoint at " + path);
        res.keep_alive(false);
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return;
    }

    auto header = req[http::field::sec_websocket_protocol];
    std::string token(crypto::first_subprotocol(std::string_view(header.data(), header.size())));

    if (token.empty() || !coordinator_->authenticate_relay(*project, token)) {
        boost::system::error_code ec;
        auto peer = beast::get_lowest_layer(stream).socket().remote_endpoint(ec);
        log().warn("Rejected relay connection for project '{}' from {}", *project,
                   ec ? std::string("unknown") : peer.address().to_string());
        auto res = make_error_response(http::status::unauthorized, "unauthorized", "unauthorized",
                                       "relay authentication failed");
        res.keep_alive(false);
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return;
    }

    // The WebSocket layer keeps its own idle and handshake timeouts
    beast::get_lowest_layer(stream).expires_never();

    using WsStream = websocket::stream<Stream>;
    auto session = std::make_shared<RelaySession<WsStream>>(
        WsStream(std::move(stream)), coordinator_, *project, config_.server_name);
    co_await session->run(std::move(req), std::move(token));
}

// ============================================================================
// SSL utilities
// ============================================================================

namespace ssl_util {

ssl::context create_ssl_context(const std::string& cert_file,
                                const std::string& key_file) {
    ssl::context ctx(ssl::context::tlsv12_server);

    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::single_dh_use);

    ctx.use_certificate_chain_file(cert_file);
    ctx.use_private_key_file(key_file, ssl::context::pem);

    return ctx;
}

ssl::context create_self_signed_context(const std::string& common_name) {
    ssl::context ctx(ssl::context::tlsv12_server);

    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::single_dh_use);

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(nullptr, EVP_PKEY_free);
    {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pkey_ctx(
            EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
        EVP_PKEY* raw = nullptr;
        if (pkey_ctx &&
            EVP_PKEY_keygen_init(pkey_ctx.get()) > 0 &&
            EVP_PKEY_CTX_set_rsa_keygen_bits(pkey_ctx.get(), 2048) > 0 &&
            EVP_PKEY_keygen(pkey_ctx.get(), &raw) > 0) {
            pkey.reset(raw);
        }
    }
    if (!pkey) {
        throw std::runtime_error("Failed to generate RSA key");
    }

    std::unique_ptr<X509, decltype(&X509_free)> x509(X509_new(), X509_free);
    if (!x509) {
        throw std::runtime_error("Failed to create X509 certificate");
    }

    ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
    X509_gmtime_adj(X509_get_notBefore(x509.get()), 0);
    X509_gmtime_adj(X509_get_notAfter(x509.get()), 365 * 24 * 60 * 60);
    X509_set_pubkey(x509.get(), pkey.get());

    X509_NAME* name = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("toolrelay"), -1, -1, 0);
    X509_set_issuer_name(x509.get(), name);

    if (!X509_sign(x509.get(), pkey.get(), EVP_sha256())) {
        throw std::runtime_error("Failed to sign certificate");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), BIO_free);

    PEM_write_bio_X509(cert_bio.get(), x509.get());
    PEM_write_bio_PrivateKey(key_bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr);

    char* cert_data = nullptr;
    char* key_data = nullptr;
    long cert_len = BIO_get_mem_data(cert_bio.get(), &cert_data);
    long key_len = BIO_get_mem_data(key_bio.get(), &key_data);

    ctx.use_certificate_chain(net::buffer(cert_data, static_cast<size_t>(cert_len)));
    ctx.use_private_key(net::buffer(key_data, static_cast<size_t>(key_len)), ssl::context::pem);

    log().info("Generated self-signed certificate for {}", common_name);
    return ctx;
}

} // namespace ssl_util

} // namespace toolrelay::edge
