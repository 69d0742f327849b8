#pragma once

#include "common/config.hpp"
#include "common/frame.hpp"
#include "common/retry.hpp"
#include "common/url.hpp"
#include "daemon/connection_state.hpp"
#include "daemon/dispatcher.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolrelay::daemon {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct ConnectionOptions {
    std::string url;            // ws:// or wss:// relay endpoint
    std::string relay_token;    // presented as the WebSocket subprotocol
    RelayTimings timings;
    RetryPolicy backoff = RetryPolicy::reconnect();
    uint32_t max_auth_failures = 0;  // consecutive handshake rejections before giving up, 0 = never
    bool ssl_verify = true;
    std::string ssl_ca_file;
    std::string name = "relay";

    static ConnectionOptions from_config(const DaemonConfig& config);
};

/**
 * ConnectionManager - owns the daemon's single outbound relay connection.
 *
 * Lifecycle:
 *   start() -> CONNECTING -> AUTHENTICATING -> CONNECTED
 *   failure -> RECONNECTING -> backoff (1s, 2s, 4s ... 60s) -> CONNECTING
 *   stop()  -> DISCONNECTED, no further attempts until start()
 *
 * All connection state lives on one strand, so handshakes and transitions are
 * serialized. Inbound Call frames go to the LocalDispatcher; its replies are
 * queued for the writer. Replies produced for a connection that has since
 * been replaced are dropped.
 *
 * The relay token is sent in the Sec-WebSocket-Protocol header of the upgrade
 * request. A 401/403 upgrade response counts as an authentication failure.
 */
class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
public:
    using StateObserver = std::function<void(ConnectionState old_state, ConnectionState new_state)>;
    using GiveUpHandler = std::function<void(const std::string& reason)>;

    ConnectionManager(net::io_context& ioc, ConnectionOptions options,
                      std::shared_ptr<LocalDispatcher> dispatcher);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Begin connecting. No-op while already running.
    void start();

    // Close the connection and suppress reconnects until start().
    void stop();

    // Thread-safe. Dropped unless CONNECTED.
    void send_frame(const wire::Frame& frame);

    ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    bool is_connected() const { return state() == ConnectionState::CONNECTED; }
    ConnectionStatus status() const;
    const std::string& url() const { return options_.url; }

    // Observers run on the io_context, never on the frame path.
    void add_state_observer(StateObserver observer);

    // Called when retries stop because max_auth_failures was reached.
    void set_give_up_handler(GiveUpHandler handler);

private:
    using WssStream = websocket::stream<ssl::stream<tcp::socket>>;
    using WsStream = websocket::stream<tcp::socket>;

    // Main connection coroutine
    net::awaitable<void> run_connection();

    // Connection phases
    net::awaitable<void> do_connect();

    // Reader, writer and heartbeat run concurrently while CONNECTED
    net::awaitable<void> reader();
    net::awaitable<void> writer();
    net::awaitable<void> heartbeat();

    // Returns false when stop() interrupted the wait
    net::awaitable<bool> wait_for_reconnect(std::chrono::milliseconds delay);

    void handle_message(const std::string& text);
    void advertise_tools();
    void enqueue_send(std::string data, uint64_t epoch);
    void close_transport();
    void set_state(ConnectionState new_state);

    net::io_context& ioc_;
    net::strand<net::io_context::executor_type> strand_;
    ConnectionOptions options_;
    std::shared_ptr<LocalDispatcher> dispatcher_;

    std::optional<UrlComponents> url_parts_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};

    // WebSocket streams (one active at a time)
    std::unique_ptr<WssStream> wss_;
    std::unique_ptr<WsStream> ws_;

    // Strand-only state
    std::deque<std::string> write_queue_;
    net::steady_timer write_signal_;
    net::steady_timer backoff_timer_;
    RetryState retry_;
    bool running_ = false;
    bool stop_requested_ = false;
    uint64_t epoch_ = 0;  // bumped on every successful connect
    uint32_t auth_failures_ = 0;
    std::chrono::steady_clock::time_point last_rx_;

    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    mutable std::mutex status_mutex_;
    ConnectionStatus status_;

    std::mutex observers_mutex_;
    std::vector<StateObserver> observers_;
    GiveUpHandler give_up_handler_;

    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_received_{0};
};

} // namespace toolrelay::daemon
