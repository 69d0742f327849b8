#pragma once

#include "common/frame.hpp"
#include "daemon/tool_executor.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <functional>
#include <memory>

namespace toolrelay::daemon {

struct DispatcherOptions {
    size_t threads = 4;
    size_t max_response_bytes = 1024 * 1024;
    std::chrono::milliseconds default_timeout{35000};  // tool timeout + overhead
};

/**
 * LocalDispatcher - turns Call frames into exactly one Response or Error frame.
 *
 * Calls run on a private thread pool, so distinct ids execute concurrently and
 * a slow tool never holds up the connection's read loop. Every reply carries
 * the id of the call it answers.
 */
class LocalDispatcher {
public:
    using ReplyHandler = std::function<void(wire::Frame)>;
    using ToolsHandler = std::function<void(boost::json::array)>;

    LocalDispatcher(std::shared_ptr<ToolExecutor> executor, DispatcherOptions options = {});
    ~LocalDispatcher();

    LocalDispatcher(const LocalDispatcher&) = delete;
    LocalDispatcher& operator=(const LocalDispatcher&) = delete;

    // Queue a call; `reply` is invoked once from a worker thread.
    void dispatch(wire::CallFrame call, ReplyHandler reply);

    // Fetch the tool list on a worker thread.
    void list_tools(ToolsHandler handler);

    // Synchronous core of dispatch(). Never throws.
    wire::Frame handle_call(const wire::CallFrame& call);

    size_t in_flight() const { return in_flight_.load(std::memory_order_relaxed); }

    // Wait for queued calls to finish and stop the workers.
    void shutdown();

private:
    std::shared_ptr<ToolExecutor> executor_;
    DispatcherOptions options_;
    boost::asio::thread_pool pool_;
    std::atomic<size_t> in_flight_{0};
};

} // namespace toolrelay::daemon
