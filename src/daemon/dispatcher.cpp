#include "daemon/dispatcher.hpp"
#include "common/logger.hpp"
#include <boost/asio/post.hpp>

namespace toolrelay::daemon {

namespace {
auto& log() { return Logger::get("daemon.dispatcher"); }
}

LocalDispatcher::LocalDispatcher(std::shared_ptr<ToolExecutor> executor, DispatcherOptions options)
    : executor_(std::move(executor))
    , options_(options)
    , pool_(options.threads == 0 ? 1 : options.threads) {}

LocalDispatcher::~LocalDispatcher() {
    shutdown();
}

void LocalDispatcher::shutdown() {
    pool_.join();
}

void LocalDispatcher::dispatch(wire::CallFrame call, ReplyHandler reply) {
    in_flight_.fetch_add(1, std::memory_order_relaxed);
    boost::asio::post(pool_, [this, call = std::move(call), reply = std::move(reply)]() {
        auto frame = handle_call(call);
        in_flight_.fetch_sub(1, std::memory_order_relaxed);
        reply(std::move(frame));
    });
}

void LocalDispatcher::list_tools(ToolsHandler handler) {
    boost::asio::post(pool_, [this, handler = std::move(handler)]() {
        boost::json::array tools;
        try {
            tools = executor_->list_tools();
        } catch (const std::exception& e) {
            log().warn("Listing tools failed: {}", e.what());
        }
        handler(std::move(tools));
    });
}

wire::Frame LocalDispatcher::handle_call(const wire::CallFrame& call) {
    auto timeout = call.timeout_ms ? std::chrono::milliseconds(*call.timeout_ms)
                                   : options_.default_timeout;
    auto started = std::chrono::steady_clock::now();

    std::expected<boost::json::value, ToolError> result;
    try {
        result = executor_->execute(call.method, call.params, timeout);
    } catch (const std::exception& e) {
        log().error("Tool '{}' (call {}) threw: {}", call.method, call.id, e.what());
        return wire::ErrorFrame{call.id, ErrorKind::TOOL_EXECUTION_FAILED, e.what()};
    } catch (...) {
        log().error("Tool '{}' (call {}) threw a non-standard exception", call.method, call.id);
        return wire::ErrorFrame{call.id, ErrorKind::TOOL_EXECUTION_FAILED, "tool raised an unknown exception"};
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        log().info("Tool '{}' (call {}) failed after {}ms: {}: {}", call.method, call.id,
                   elapsed.count(), error_kind_name(result.error().kind), result.error().message);
        return wire::ErrorFrame{call.id, result.error().kind, result.error().message};
    }

    wire::Frame reply = wire::ResponseFrame{call.id, std::move(*result)};
    auto size = wire::FrameCodec::encode(reply).size();
    if (size > options_.max_response_bytes) {
        log().warn("Tool '{}' (call {}) response too large: {} bytes", call.method, call.id, size);
        return wire::ErrorFrame{
            call.id, ErrorKind::RESPONSE_TOO_LARGE,
            "Response too large (" + std::to_string(size) + " bytes, max " +
                std::to_string(options_.max_response_bytes) + ")"};
    }

    log().debug("Tool '{}' (call {}) completed in {}ms, {} bytes", call.method, call.id,
                elapsed.count(), size);
    return reply;
}

} // namespace toolrelay::daemon
