#include "edge/pending_request.hpp"
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

namespace toolrelay::edge {

using namespace boost::asio::experimental::awaitable_operators;

PendingRequest::PendingRequest(net::any_io_executor executor, std::string id,
                               uint64_t generation, Clock::time_point deadline)
    : id_(std::move(id))
    , generation_(generation)
    , deadline_(deadline)
    , created_at_(Clock::now())
    , channel_(std::move(executor), 1)
{}

bool PendingRequest::settle(CallOutcome outcome) {
    {
        std::lock_guard lock(mutex_);
        if (outcome_) {
            return false;
        }
        outcome_ = std::move(outcome);
        settled_.store(true, std::memory_order_release);
    }
    // Wake-up only; capacity 1 and a single winner, so this always has room
    channel_.try_send(boost::system::error_code{});
    return true;
}

CallOutcome PendingRequest::take_outcome() {
    std::lock_guard lock(mutex_);
    if (!outcome_) {
        return std::unexpected(RelayError::make(ErrorKind::CANCELLED, "request cancelled"));
    }
    return std::move(*outcome_);
}

bool PendingRequest::fulfill(wire::Frame frame) {
    return settle(CallOutcome(std::move(frame)));
}

bool PendingRequest::fail(RelayError error) {
    return settle(std::unexpected(std::move(error)));
}

bool PendingRequest::expire(Clock::time_point now) {
    if (now < deadline_) {
        return false;
    }
    return fail(RelayError::make(ErrorKind::TIMEOUT, "no response before deadline"));
}

net::awaitable<CallOutcome> PendingRequest::wait() {
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_at(deadline_);

    auto first = co_await (
        channel_.async_receive(net::as_tuple(net::use_awaitable)) ||
        timer.async_wait(net::as_tuple(net::use_awaitable)));

    if (first.index() == 0) {
        auto [ec] = std::get<0>(first);
        if (ec) {
            fail(RelayError::make(ErrorKind::CANCELLED, ec.message()));
        }
        co_return take_outcome();
    }

    // An aborted timer means the caller stopped waiting, not that time ran out.
    // A result that settled first is kept either way.
    auto [timer_ec] = std::get<1>(first);
    if (timer_ec) {
        fail(RelayError::make(ErrorKind::CANCELLED, "caller went away"));
    } else {
        fail(RelayError::make(ErrorKind::TIMEOUT, "no response before deadline"));
    }
    co_return take_outcome();
}

} // namespace toolrelay::edge
