#pragma once

#include <chrono>
#include <cstddef>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>

namespace toolhub::backend {

using boost::asio::awaitable;

/// Coroutine counting semaphore with FIFO wakeup, built on a buffered
/// channel: a send takes a slot, a receive frees one.
class SendGate {
public:
    SendGate(boost::asio::io_context& ioc, std::size_t capacity);

    /// Waits for a slot until `deadline`. Returns false if the deadline
    /// passed first; no slot is held in that case.
    auto acquire_until(std::chrono::steady_clock::time_point deadline) -> awaitable<bool>;

    void release();

    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
    using channel_t = boost::asio::experimental::concurrent_channel<
        void(boost::system::error_code)>;

    std::size_t capacity_;
    channel_t slots_;
};

} // namespace toolhub::backend
