#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>

namespace toolrelay::edge {

namespace net = boost::asio;

// Response or Error frame from the daemon, or the reason none will arrive.
using CallOutcome = std::expected<wire::Frame, RelayError>;

/**
 * PendingRequest - one in-flight correlation entry.
 *
 * The result slot is filled at most once. Whichever of fulfil, fail or
 * expire gets there first wins; later attempts return false and change
 * nothing. The outcome is stored under a mutex and the waiting HTTP
 * coroutine is woken through a single-slot channel, so settling never
 * blocks and may happen on any thread.
 */
class PendingRequest {
public:
    using Clock = std::chrono::steady_clock;

    PendingRequest(net::any_io_executor executor, std::string id,
                   uint64_t generation, Clock::time_point deadline);

    PendingRequest(const PendingRequest&) = delete;
    PendingRequest& operator=(const PendingRequest&) = delete;

    const std::string& id() const { return id_; }
    uint64_t generation() const { return generation_; }
    Clock::time_point deadline() const { return deadline_; }
    Clock::time_point created_at() const { return created_at_; }

    bool fulfill(wire::Frame frame);
    bool fail(RelayError error);

    // Settles with TIMEOUT when the deadline has passed at `now`.
    bool expire(Clock::time_point now = Clock::now());

    bool settled() const { return settled_.load(std::memory_order_acquire); }

    // Suspends until settled or until the deadline, which settles with TIMEOUT.
    // Must be awaited at most once.
    net::awaitable<CallOutcome> wait();

private:
    using Channel = net::experimental::concurrent_channel<void(boost::system::error_code)>;

    bool settle(CallOutcome outcome);
    CallOutcome take_outcome();

    std::string id_;
    uint64_t generation_;
    Clock::time_point deadline_;
    Clock::time_point created_at_;

    std::mutex mutex_;
    std::optional<CallOutcome> outcome_;
    std::atomic<bool> settled_{false};
    Channel channel_;
};

} // namespace toolrelay::edge
