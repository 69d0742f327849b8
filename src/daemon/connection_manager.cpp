#include "daemon/connection_manager.hpp"
#include "common/logger.hpp"
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/beast/http.hpp>
#include <stdexcept>

namespace toolrelay::daemon {

using namespace boost::asio::experimental::awaitable_operators;
namespace http = beast::http;

namespace {

auto& log() { return Logger::get("daemon.connection"); }

// Upgrade refused with 401/403: bad relay token or unknown project.
class HandshakeRejected : public std::runtime_error {
public:
    explicit HandshakeRejected(unsigned status)
        : std::runtime_error("handshake rejected with HTTP " + std::to_string(status))
        , status_(status) {}

    unsigned status() const { return status_; }

private:
    unsigned status_;
};

bool is_cancelled(const net::cancellation_state& state) {
    return state.cancelled() != net::cancellation_type::none;
}

} // anonymous namespace

ConnectionOptions ConnectionOptions::from_config(const DaemonConfig& config) {
    ConnectionOptions options;
    options.url = websocket_url(config.base_url).value_or(config.base_url);
    options.relay_token = config.credentials.relay_token;
    options.timings = config.timings;
    options.backoff = config.backoff;
    options.max_auth_failures = config.max_auth_failures;
    options.ssl_verify = config.ssl_verify;
    options.ssl_ca_file = config.ssl_ca_file;
    return options;
}

ConnectionManager::ConnectionManager(net::io_context& ioc, ConnectionOptions options,
                                     std::shared_ptr<LocalDispatcher> dispatcher)
    : ioc_(ioc)
    , strand_(net::make_strand(ioc))
    , options_(std::move(options))
    , dispatcher_(std::move(dispatcher))
    , url_parts_(parse_url(options_.url))
    , write_signal_(strand_)
    , backoff_timer_(strand_)
    , retry_(options_.backoff)
{
    if (!url_parts_) {
        log().error("{}: Invalid URL: {}", options_.name, options_.url);
    }

    if (options_.ssl_verify) {
        if (!options_.ssl_ca_file.empty()) {
            ssl_ctx_.load_verify_file(options_.ssl_ca_file);
        } else {
            ssl_ctx_.set_default_verify_paths();
        }
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }

    status_.url = options_.url;
}

// ============================================================================
// Public API
// ============================================================================

void ConnectionManager::start() {
    net::post(strand_, [self = shared_from_this()]() {
        self->stop_requested_ = false;
        if (self->running_) {
            return;
        }
        self->running_ = true;
        self->retry_.reset();
        self->auth_failures_ = 0;

        net::co_spawn(
            self->strand_,
            [self]() -> net::awaitable<void> {
                co_await self->run_connection();
            },
            [self](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        log().error("{}: Unhandled exception: {}", self->options_.name, e.what());
                    }
                    self->running_ = false;
                    self->set_state(ConnectionState::DISCONNECTED);
                }
            });
    });
}

void ConnectionManager::stop() {
    net::post(strand_, [self = shared_from_this()]() {
        if (!self->running_ || self->stop_requested_) {
            return;
        }
        log().info("{}: Disconnect requested", self->options_.name);
        auto s = self->state();
        self->stop_requested_ = true;
        self->write_queue_.clear();
        self->backoff_timer_.cancel();
        self->write_signal_.cancel();
        self->set_state(ConnectionState::DISCONNECTED);

        // A handshake in progress is aborted; an open session is closed by the writer
        if (s == ConnectionState::CONNECTING || s == ConnectionState::AUTHENTICATING) {
            self->close_transport();
        }
    });
}

void ConnectionManager::send_frame(const wire::Frame& frame) {
    enqueue_send(wire::FrameCodec::encode(frame), 0);
}

ConnectionStatus ConnectionManager::status() const {
    std::lock_guard lock(status_mutex_);
    ConnectionStatus s = status_;
    s.state = state();
    s.frames_sent = frames_sent_.load(std::memory_order_relaxed);
    s.frames_received = frames_received_.load(std::memory_order_relaxed);
    return s;
}

void ConnectionManager::add_state_observer(StateObserver observer) {
    std::lock_guard lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

void ConnectionManager::set_give_up_handler(GiveUpHandler handler) {
    std::lock_guard lock(observers_mutex_);
    give_up_handler_ = std::move(handler);
}

void ConnectionManager::set_state(ConnectionState new_state) {
    // After stop() only the final DISCONNECTED is reported
    if (stop_requested_ && new_state != ConnectionState::DISCONNECTED) {
        return;
    }
    ConnectionState old_state = state_.exchange(new_state, std::memory_order_acq_rel);
    if (old_state == new_state) {
        return;
    }
    if (!is_valid_transition(old_state, new_state)) {
        log().warn("{}: Unexpected transition {} -> {}", options_.name,
                   connection_state_name(old_state), connection_state_name(new_state));
    } else {
        log().debug("{}: State {} -> {}", options_.name,
                    connection_state_name(old_state), connection_state_name(new_state));
    }

    std::lock_guard lock(observers_mutex_);
    for (const auto& observer : observers_) {
        net::post(ioc_, [observer, old_state, new_state]() { observer(old_state, new_state); });
    }
}

void ConnectionManager::enqueue_send(std::string data, uint64_t epoch) {
    net::post(strand_, [self = shared_from_this(), data = std::move(data), epoch]() mutable {
        if (self->stop_requested_ || self->state() != ConnectionState::CONNECTED) {
            log().debug("{}: Dropping outbound frame, not connected", self->options_.name);
            return;
        }
        if (epoch != 0 && epoch != self->epoch_) {
            log().debug("{}: Dropping reply for a previous connection", self->options_.name);
            return;
        }
        self->write_queue_.push_back(std::move(data));
        self->write_signal_.cancel();
    });
}

void ConnectionManager::close_transport() {
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).close(ec);
    }
    if (ws_) {
        beast::get_lowest_layer(*ws_).close(ec);
    }
}

// ============================================================================
// Connection loop
// ============================================================================

net::awaitable<void> ConnectionManager::run_connection() {
    bool gave_up = false;
    std::string give_up_reason;

    while (!stop_requested_) {
        std::string disconnect_reason;

        try {
            if (!url_parts_) {
                throw std::runtime_error("invalid relay URL " + options_.url);
            }

            co_await do_connect();

            ++epoch_;
            last_rx_ = std::chrono::steady_clock::now();
            write_queue_.clear();
            retry_.reset();
            auth_failures_ = 0;
            {
                std::lock_guard lock(status_mutex_);
                status_.connected_at = std::chrono::system_clock::now();
                status_.last_heartbeat_at = status_.connected_at;
                status_.last_error.clear();
                status_.reconnect_attempts = 0;
                status_.auth_failures = 0;
                status_.next_retry_delay = std::chrono::milliseconds(0);
            }
            set_state(ConnectionState::CONNECTED);
            log().info("{}: Connected to {}", options_.name, options_.url);

            advertise_tools();

            co_await (reader() || writer() || heartbeat());

            disconnect_reason = stop_requested_ ? "stopped" : "session ended";

        } catch (const HandshakeRejected& e) {
            ++auth_failures_;
            disconnect_reason = e.what();
            log().warn("{}: Relay rejected credentials (HTTP {}), attempt {}",
                       options_.name, e.status(), auth_failures_);

            if (options_.max_auth_failures != 0 && auth_failures_ >= options_.max_auth_failures) {
                gave_up = true;
                give_up_reason = "authentication rejected " + std::to_string(auth_failures_) + " times";
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                disconnect_reason = "peer closed";
            } else if (e.code() == net::error::operation_aborted) {
                disconnect_reason = stop_requested_ ? "stopped" : "operation aborted";
            } else {
                disconnect_reason = e.code().message();
            }
            if (!stop_requested_) {
                log().warn("{}: Connection error: {}", options_.name, disconnect_reason);
            }
        } catch (const std::exception& e) {
            disconnect_reason = e.what();
            log().warn("{}: Connection lost: {}", options_.name, e.what());
        }

        // Cleanup current connection
        wss_.reset();
        ws_.reset();
        write_queue_.clear();
        {
            std::lock_guard lock(status_mutex_);
            status_.connected_at.reset();
            status_.auth_failures = auth_failures_;
            if (!stop_requested_) {
                status_.last_error = disconnect_reason;
            }
        }

        if (stop_requested_ || gave_up) {
            break;
        }

        set_state(ConnectionState::RECONNECTING);
        auto delay = retry_.next_delay();
        {
            std::lock_guard lock(status_mutex_);
            status_.reconnect_attempts = retry_.attempt();
            status_.next_retry_delay = delay;
        }
        log().info("{}: Reconnecting in {}ms (attempt {})", options_.name, delay.count(), retry_.attempt());

        if (!co_await wait_for_reconnect(delay)) {
            break;
        }
    }

    running_ = false;
    set_state(ConnectionState::DISCONNECTED);

    if (gave_up) {
        log().error("{}: Giving up: {}", options_.name, give_up_reason);
        {
            std::lock_guard lock(status_mutex_);
            status_.last_error = give_up_reason;
        }
        std::lock_guard lock(observers_mutex_);
        if (give_up_handler_) {
            net::post(ioc_, [handler = give_up_handler_, give_up_reason]() { handler(give_up_reason); });
        }
    } else {
        log().info("{}: Disconnected", options_.name);
    }
}

net::awaitable<void> ConnectionManager::do_connect() {
    set_state(ConnectionState::CONNECTING);

    const auto& url = *url_parts_;

    tcp::resolver resolver(strand_);
    auto endpoints = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

    auto decorate = [token = options_.relay_token](websocket::request_type& req) {
        req.set(http::field::user_agent, "toolrelay-daemon/1.0");
        req.set(http::field::sec_websocket_protocol, token);
    };

    websocket::response_type res;
    boost::system::error_code ec;

    if (url.use_ssl) {
        wss_ = std::make_unique<WssStream>(strand_, ssl_ctx_);

        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url.host.c_str())) {
            throw boost::system::system_error(
                boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category()));
        }
        if (options_.ssl_verify) {
            wss_->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
        }

        co_await net::async_connect(beast::get_lowest_layer(*wss_), endpoints, net::use_awaitable);
        co_await wss_->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);

        set_state(ConnectionState::AUTHENTICATING);
        wss_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        wss_->set_option(websocket::stream_base::decorator(decorate));
        wss_->read_message_max(wire::MAX_FRAME_SIZE);

        co_await wss_->async_handshake(res, url.host_header(), url.path,
                                       net::redirect_error(net::use_awaitable, ec));
        wss_->text(true);
    } else {
        ws_ = std::make_unique<WsStream>(strand_);

        co_await net::async_connect(beast::get_lowest_layer(*ws_), endpoints, net::use_awaitable);

        set_state(ConnectionState::AUTHENTICATING);
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator(decorate));
        ws_->read_message_max(wire::MAX_FRAME_SIZE);

        co_await ws_->async_handshake(res, url.host_header(), url.path,
                                      net::redirect_error(net::use_awaitable, ec));
        ws_->text(true);
    }

    if (ec) {
        auto status = res.result_int();
        if (status == 401 || status == 403) {
            throw HandshakeRejected(status);
        }
        throw boost::system::system_error(ec);
    }
}

net::awaitable<void> ConnectionManager::reader() {
    beast::flat_buffer buffer;

    while (true) {
        buffer.clear();
        if (wss_) {
            co_await wss_->async_read(buffer, net::use_awaitable);
        } else {
            co_await ws_->async_read(buffer, net::use_awaitable);
        }

        last_rx_ = std::chrono::steady_clock::now();
        frames_received_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(status_mutex_);
            status_.last_heartbeat_at = std::chrono::system_clock::now();
        }

        handle_message(beast::buffers_to_string(buffer.data()));
    }
}

net::awaitable<void> ConnectionManager::writer() {
    while (true) {
        while (write_queue_.empty() && !stop_requested_) {
            write_signal_.expires_at(net::steady_timer::time_point::max());

            boost::system::error_code ec;
            co_await write_signal_.async_wait(net::redirect_error(net::use_awaitable, ec));

            if (is_cancelled(co_await net::this_coro::cancellation_state)) {
                co_return;
            }
        }

        if (write_queue_.empty() && stop_requested_) {
            try {
                if (wss_) {
                    co_await wss_->async_close(websocket::close_code::normal, net::use_awaitable);
                } else {
                    co_await ws_->async_close(websocket::close_code::normal, net::use_awaitable);
                }
            } catch (const boost::system::system_error& e) {
                log().debug("{}: Close handshake failed: {}", options_.name, e.code().message());
            }
            co_return;
        }

        auto data = std::move(write_queue_.front());
        write_queue_.pop_front();

        if (wss_) {
            co_await wss_->async_write(net::buffer(data), net::use_awaitable);
        } else {
            co_await ws_->async_write(net::buffer(data), net::use_awaitable);
        }
        frames_sent_.fetch_add(1, std::memory_order_relaxed);
    }
}

net::awaitable<void> ConnectionManager::heartbeat() {
    net::steady_timer timer(strand_);
    const auto window = options_.timings.liveness_window();

    while (true) {
        timer.expires_after(options_.timings.heartbeat_interval);
        co_await timer.async_wait(net::use_awaitable);

        auto silent = std::chrono::steady_clock::now() - last_rx_;
        if (silent > window) {
            throw std::runtime_error("heartbeat timeout: nothing received for " +
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(silent).count()) + "ms");
        }

        if (!stop_requested_) {
            write_queue_.push_back(wire::FrameCodec::encode(wire::HeartbeatFrame{}));
            write_signal_.cancel();
        }
    }
}

net::awaitable<bool> ConnectionManager::wait_for_reconnect(std::chrono::milliseconds delay) {
    backoff_timer_.expires_after(delay);

    boost::system::error_code ec;
    co_await backoff_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));

    co_return !stop_requested_;
}

// ============================================================================
// Frame handling
// ============================================================================

void ConnectionManager::handle_message(const std::string& text) {
    auto frame = wire::FrameCodec::decode(text);
    if (!frame) {
        log().warn("{}: Dropping undecodable frame: {}", options_.name,
                   wire::frame_error_message(frame.error()));
        return;
    }

    std::visit([this](auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, wire::CallFrame>) {
            log().debug("{}: Call {} method={}", options_.name, f.id, f.method);
            std::weak_ptr<ConnectionManager> weak = shared_from_this();
            dispatcher_->dispatch(std::move(f), [weak, epoch = epoch_](wire::Frame reply) {
                if (auto self = weak.lock()) {
                    self->enqueue_send(wire::FrameCodec::encode(reply), epoch);
                }
            });
        } else if constexpr (std::is_same_v<T, wire::HeartbeatFrame>) {
            log().trace("{}: Heartbeat from relay", options_.name);
        } else if constexpr (std::is_same_v<T, wire::ErrorFrame>) {
            log().warn("{}: Relay reported {} for {}: {}", options_.name,
                       error_kind_name(f.kind), f.id, f.message);
        } else {
            log().warn("{}: Unexpected {} frame from relay", options_.name,
                       wire::frame_type_name(wire::frame_type(wire::Frame{f})));
        }
    }, *frame);
}

void ConnectionManager::advertise_tools() {
    std::weak_ptr<ConnectionManager> weak = shared_from_this();
    dispatcher_->list_tools([weak, epoch = epoch_](boost::json::array tools) {
        if (auto self = weak.lock()) {
            log().info("{}: Advertising {} tools", self->options_.name, tools.size());
            self->enqueue_send(wire::FrameCodec::encode(wire::ToolsFrame{std::move(tools)}), epoch);
        }
    });
}

} // namespace toolrelay::daemon
