#include "toolhub/backend/stdio_connector.hpp"
#include "toolhub/backend/process.hpp"
#include "toolhub/core/logger.hpp"

#include <csignal>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace toolhub::backend {

namespace net = boost::asio;

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);
constexpr auto kReapPollInterval = std::chrono::milliseconds(50);
constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

} // anonymous namespace

struct StdioConnector::Session {
    ChildProcess process;
    net::posix::stream_descriptor in;
    net::posix::stream_descriptor out;

    Session(net::io_context& ioc, ChildProcess child)
        : process(std::move(child)),
          in(ioc, process.release_stdin()),
          out(ioc, process.release_stdout()) {}
};

StdioConnector::StdioConnector(net::io_context& ioc, BackendConfig config, HealthConfig health)
    : Connector(ioc, std::move(config), health) {}

StdioConnector::~StdioConnector() {
    // ChildProcess kills and reaps on destruction.
    session_.reset();
}

auto StdioConnector::open(std::uint64_t session) -> awaitable<VoidResult> {
    auto child = ChildProcess::spawn(launch_spec_from_config(config()));
    if (!child) {
        co_return make_fail(child.error());
    }

    session_ = std::make_shared<Session>(io_context(), std::move(*child));
    LOG_INFO("Backend {} launched (pid={})", id(), session_->process.pid());

    auto self = std::static_pointer_cast<StdioConnector>(shared_from_this());
    net::co_spawn(co_await net::this_coro::executor,
        [self, session]() -> awaitable<void> {
            co_await self->read_loop(session);
        }, net::detached);

    co_return ok_result();
}

auto StdioConnector::read_loop(std::uint64_t session) -> awaitable<void> {
    // Keep the pipes alive even if close() swaps the session out.
    auto current = session_;
    net::streambuf buffer(kMaxFrameBytes);
    std::string reason = "backend closed stdout";

    while (current->out.is_open()) {
        boost::system::error_code ec;
        auto n = co_await net::async_read_until(current->out, buffer, '\n',
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                reason = ec.message();
            }
            break;
        }

        std::string line(net::buffers_begin(buffer.data()),
                         net::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(n));
        buffer.consume(n);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        deliver(line);
    }

    connection_lost(session, reason);
}

auto StdioConnector::write_frame(std::string frame) -> awaitable<VoidResult> {
    auto current = session_;
    if (!current || !current->in.is_open()) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Backend process is not running", id()));
    }

    frame.push_back('\n');
    boost::system::error_code ec;
    co_await net::async_write(current->in, net::buffer(frame),
        net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Failed to write to backend process", ec.message()));
    }
    co_return ok_result();
}

auto StdioConnector::close() -> awaitable<void> {
    auto current = std::move(session_);
    if (!current) {
        co_return;
    }

    boost::system::error_code ec;
    current->in.close(ec);
    current->out.close(ec);

    // Ask politely, then force after the grace period.
    if (!current->process.try_reap()) {
        current->process.send_signal(SIGTERM);
        net::steady_timer timer(co_await net::this_coro::executor);
        auto waited = std::chrono::milliseconds{0};
        while (!current->process.try_reap() && waited < kTerminateGrace) {
            timer.expires_after(kReapPollInterval);
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            waited += kReapPollInterval;
        }
        if (!current->process.try_reap()) {
            LOG_WARN("Backend {} ignored SIGTERM, killing", id());
            current->process.kill_now();
        }
    }
    LOG_DEBUG("Backend {} process stopped", id());
}

} // namespace toolhub::backend
