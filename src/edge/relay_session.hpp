#pragma once

#include "common/frame.hpp"
#include "common/logger.hpp"
#include "edge/session_coordinator.hpp"
#include <boost/asio.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace toolrelay::edge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

/**
 * RelaySession - the edge end of one daemon WebSocket.
 *
 * Runs as two coroutines joined with operator||: a reader that feeds frames
 * to the SessionCoordinator and a writer that drains a concurrent_channel,
 * so outbound frames are written one at a time from any thread. The session
 * registers itself after the WebSocket accept and tells the coordinator
 * when its socket ends.
 *
 * WsStream is websocket::stream<beast::tcp_stream> or its TLS counterpart.
 */
template <class WsStream>
class RelaySession : public ISessionTransport,
                     public std::enable_shared_from_this<RelaySession<WsStream>> {
public:
    static constexpr size_t kWriteQueueCapacity = 1024;

    RelaySession(WsStream ws, std::shared_ptr<SessionCoordinator> coordinator,
                 std::string project_id, std::string server_name)
        : ws_(std::move(ws))
        , coordinator_(std::move(coordinator))
        , project_id_(std::move(project_id))
        , server_name_(std::move(server_name))
        , channel_(ws_.get_executor(), kWriteQueueCapacity)
    {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        remote_address_ = ec ? "unknown" : endpoint.address().to_string() + ":" +
                                               std::to_string(endpoint.port());
    }

    // Accept the upgrade, register and pump frames until the socket ends.
    // `relay_token` has already been checked against the project.
    net::awaitable<void> run(http::request<http::string_body> req, std::string relay_token) {
        auto self = this->shared_from_this();
        std::string reason = "normal";

        try {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator(
                [protocol = relay_token, server = server_name_](websocket::response_type& res) {
                    res.set(http::field::server, server);
                    res.set(http::field::sec_websocket_protocol, protocol);
                }));
            ws_.read_message_max(wire::MAX_FRAME_SIZE);

            co_await ws_.async_accept(req, net::use_awaitable);
            ws_.text(true);

            auto handle = coordinator_->register_session(project_id_, relay_token, self);
            if (!handle) {
                // Credentials rotated between the check and the accept
                log().warn("Project '{}': session from {} refused: {}", project_id_,
                           remote_address_, error_kind_name(handle.error().kind));
                co_await ws_.async_close(websocket::close_reason(
                    websocket::close_code::policy_error, "unauthorized"), net::use_awaitable);
                co_return;
            }
            generation_ = handle->generation;
            registered_.store(true, std::memory_order_release);

            log().info("Project '{}': relay session from {} (generation {})",
                       project_id_, remote_address_, generation_);

            using namespace boost::asio::experimental::awaitable_operators;
            co_await (reader() || writer());

            if (close_requested_.load(std::memory_order_acquire)) {
                reason = close_reason_;
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                reason = "peer closed";
            } else if (e.code() == net::error::operation_aborted) {
                reason = "operation aborted";
            } else {
                reason = e.code().message();
                log().warn("Project '{}': relay session error: {}", project_id_, reason);
            }
        } catch (const std::exception& e) {
            reason = e.what();
            log().error("Project '{}': relay session exception: {}", project_id_, e.what());
        }

        channel_.close();
        if (registered_.load(std::memory_order_acquire)) {
            coordinator_->close_session(project_id_, generation_, ErrorKind::DISCONNECTED,
                                        "daemon connection lost (" + reason + ")");
        }
        log().debug("Project '{}': relay session {} ended ({})", project_id_, generation_, reason);
    }

    bool send_frame(const wire::Frame& frame) override {
        if (!channel_.try_send(boost::system::error_code{}, wire::FrameCodec::encode(frame))) {
            log().warn("Project '{}': write queue full or closed, dropping {} frame",
                       project_id_, wire::frame_type_name(wire::frame_type(frame)));
            return false;
        }
        return true;
    }

    void close(const std::string& reason) override {
        if (close_requested_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        net::post(ws_.get_executor(), [self = this->shared_from_this(), reason]() {
            self->close_reason_ = reason;
            self->channel_.close();
        });
    }

    std::string remote_address() const override { return remote_address_; }

    uint64_t generation() const { return generation_; }

private:
    using Channel = net::experimental::concurrent_channel<
        void(boost::system::error_code, std::string)>;

    static Logger& log() { return Logger::get("edge.session"); }

    net::awaitable<void> reader() {
        beast::flat_buffer buffer;

        while (true) {
            buffer.clear();
            co_await ws_.async_read(buffer, net::use_awaitable);

            coordinator_->record_heartbeat(project_id_, generation_);

            auto frame = wire::FrameCodec::decode(beast::buffers_to_string(buffer.data()));
            if (!frame) {
                log().warn("Project '{}': dropping undecodable frame: {}", project_id_,
                           wire::frame_error_message(frame.error()));
                continue;
            }
            handle_frame(std::move(*frame));
        }
    }

    net::awaitable<void> writer() {
        while (true) {
            auto [ec, data] = co_await channel_.async_receive(net::as_tuple(net::use_awaitable));
            if (ec) {
                // Channel closed: by close() or because the session ended
                if (close_requested_.load(std::memory_order_acquire) && ws_.is_open()) {
                    auto [close_ec] = co_await ws_.async_close(
                        websocket::close_reason(websocket::close_code::going_away, close_reason_),
                        net::as_tuple(net::use_awaitable));
                    if (close_ec) {
                        log().debug("Project '{}': close handshake failed: {}",
                                    project_id_, close_ec.message());
                    }
                }
                co_return;
            }
            co_await ws_.async_write(net::buffer(data), net::use_awaitable);
        }
    }

    void handle_frame(wire::Frame frame) {
        switch (wire::frame_type(frame)) {
        case wire::FrameType::RESPONSE:
        case wire::FrameType::FRAME_ERROR:
            coordinator_->complete(project_id_, generation_, std::move(frame));
            break;
        case wire::FrameType::HEARTBEAT:
            send_frame(wire::HeartbeatFrame{});
            break;
        case wire::FrameType::TOOLS:
            coordinator_->update_tools(project_id_, generation_,
                                       std::move(std::get<wire::ToolsFrame>(frame).tools));
            break;
        case wire::FrameType::CALL: {
            const auto& call = std::get<wire::CallFrame>(frame);
            log().warn("Project '{}': daemon sent a call frame ({}), rejecting", project_id_, call.id);
            send_frame(wire::ErrorFrame{call.id, ErrorKind::PROTOCOL_ERROR,
                                        "call frames are not accepted from the daemon"});
            break;
        }
        }
    }

    WsStream ws_;
    std::shared_ptr<SessionCoordinator> coordinator_;
    std::string project_id_;
    std::string server_name_;
    std::string remote_address_;
    Channel channel_;

    uint64_t generation_ = 0;
    std::atomic<bool> registered_{false};
    std::atomic<bool> close_requested_{false};
    std::string close_reason_;  // executor-only
};

} // namespace toolrelay::edge
