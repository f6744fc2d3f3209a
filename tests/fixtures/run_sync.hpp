#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace toolhub::testing {

/// Drives `ioc` until `op` completes and returns its value. Background work
/// left on the context (retry timers, detached coroutines) is not drained.
template <typename T>
auto run_sync(boost::asio::io_context& ioc, boost::asio::awaitable<T> op) -> T {
    std::optional<T> value;
    std::exception_ptr error;
    bool done = false;

    boost::asio::co_spawn(ioc, std::move(op),
        [&](std::exception_ptr ep, T result) {
            error = ep;
            if (!ep) value.emplace(std::move(result));
            done = true;
        });

    ioc.restart();
    while (!done && ioc.run_one() > 0) {
    }
    if (error) std::rethrow_exception(error);
    if (!done) throw std::runtime_error("io_context ran out of work before completion");
    return std::move(*value);
}

inline void run_sync(boost::asio::io_context& ioc, boost::asio::awaitable<void> op) {
    std::exception_ptr error;
    bool done = false;

    boost::asio::co_spawn(ioc, std::move(op),
        [&](std::exception_ptr ep) {
            error = ep;
            done = true;
        });

    ioc.restart();
    while (!done && ioc.run_one() > 0) {
    }
    if (error) std::rethrow_exception(error);
    if (!done) throw std::runtime_error("io_context ran out of work before completion");
}

/// Starts every op at once and drives `ioc` until all have completed.
/// Results keep the order of `ops`.
template <typename T>
auto run_all(boost::asio::io_context& ioc, std::vector<boost::asio::awaitable<T>> ops)
    -> std::vector<T> {
    std::vector<std::optional<T>> slots(ops.size());
    std::exception_ptr error;
    std::size_t remaining = ops.size();

    for (std::size_t i = 0; i < ops.size(); ++i) {
        boost::asio::co_spawn(ioc, std::move(ops[i]),
            [&, i](std::exception_ptr ep, T result) {
                if (ep) error = ep;
                else slots[i].emplace(std::move(result));
                --remaining;
            });
    }

    ioc.restart();
    while (remaining > 0 && ioc.run_one() > 0) {
    }
    if (error) std::rethrow_exception(error);
    if (remaining > 0) throw std::runtime_error("io_context ran out of work before completion");

    std::vector<T> results;
    results.reserve(slots.size());
    for (auto& slot : slots) results.push_back(std::move(*slot));
    return results;
}

/// Runs whatever is ready or becomes ready within `duration`.
inline void run_for(boost::asio::io_context& ioc, std::chrono::milliseconds duration) {
    ioc.restart();
    ioc.run_for(duration);
}

} // namespace toolhub::testing
