#include "toolhub/backend/send_gate.hpp"

#include <algorithm>

#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolhub::backend {

namespace net = boost::asio;

SendGate::SendGate(net::io_context& ioc, std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)), slots_(ioc, capacity_) {}

auto SendGate::acquire_until(std::chrono::steady_clock::time_point deadline)
    -> awaitable<bool> {
    if (slots_.try_send(boost::system::error_code{})) {
        co_return true;
    }

    net::steady_timer timer(co_await net::this_coro::executor, deadline);
    // The group waits for both operations to settle. A send that completed
    // before the timer's cancellation reached it still holds a slot.
    auto [order, send_ec, timer_ec] = co_await net::experimental::make_parallel_group(
        slots_.async_send(boost::system::error_code{}, net::deferred),
        timer.async_wait(net::deferred))
        .async_wait(net::experimental::wait_for_one(), net::use_awaitable);
    (void)order;
    (void)timer_ec;
    co_return !send_ec;
}

void SendGate::release() {
    slots_.try_receive([](boost::system::error_code) {});
}

} // namespace toolhub::backend
