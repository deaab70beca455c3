#include "server_impl.h"
#include "mediastream/util/use_awaitable.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mediastream::server {

http_server_impl::http_server_impl(const net::any_io_executor& ex)
    : ex_(ex)
    , acceptor_(net::make_strand(ex))
{
    auto console_sink                 = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    spdlog::sinks_init_list sink_list = {console_sink};
    default_logger_ = std::make_shared<spdlog::logger>("mediastream.server", sink_list);
    default_logger_->set_level(spdlog::level::info);
}

void http_server_impl::listen(std::string_view host, uint16_t port, int backlog)
{
    tcp::resolver resolver(ex_);
    auto results = resolver.resolve(host, std::to_string(port));

    tcp::endpoint endp(*results.begin());
    acceptor_.open(endp.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endp);
    acceptor_.listen(backlog);

    auto listen_endp = local_endpoint();
    get_logger()->info(
        "Http Server Listen on: [{}:{}]", listen_endp.address().to_string(), listen_endp.port());
}

net::any_io_executor http_server_impl::get_executor() noexcept
{
    return ex_;
}

void http_server_impl::async_run()
{
    net::co_spawn(
        acceptor_.get_executor(),
        [this]() -> net::awaitable<void> {
            auto ec = co_await co_run();
            if (ec && ec != net::error::operation_aborted)
                get_logger()->error("accept loop stopped: {}", ec.message());
        },
        [](std::exception_ptr ex) {
            // Normal failures are reported through `ec`; anything thrown here is fatal
            // and surfaces from `run()` of the execution context.
            if (ex)
                std::rethrow_exception(ex);
        });
}

void http_server_impl::stop()
{
    net::dispatch(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    std::lock_guard lck(mutex_);
    for (const auto& conn : sessions_)
        conn->abort();
}

router_impl& http_server_impl::router()
{
    return router_;
}

net::awaitable<boost::system::error_code> http_server_impl::co_run()
{
    boost::system::error_code ec;
    for (;;) {
        tcp::socket sock(net::make_strand(ex_));
        co_await acceptor_.async_accept(sock, util::net_awaitable[ec]);
        if (ec) {
            if (ec == boost::system::errc::too_many_files_open ||
                ec == boost::system::errc::too_many_files_open_in_system)
            {
                using namespace std::chrono_literals;
                get_logger()->warn("async_accept: {}, retrying", ec.message());
                ec = {};
                net::steady_timer retry_timer(ex_);
                retry_timer.expires_after(100ms);
                co_await retry_timer.async_wait(util::net_awaitable[ec]);
                if (!ec)
                    continue;
            }
            break;
        }
        auto executor = sock.get_executor();
        net::co_spawn(executor, handle_accept(std::move(sock)), net::detached);
    }
    get_logger()->trace("async_accept: {}", ec.message());
    co_return ec;
}

net::awaitable<void> http_server_impl::handle_accept(tcp::socket sock)
{
    boost::system::error_code ec;
    auto remote_endp = sock.remote_endpoint(ec);
    if (ec)
        co_return;

    get_logger()->trace(
        "accept new connection [{}:{}]", remote_endp.address().to_string(), remote_endp.port());

    auto conn = std::make_shared<session>(std::move(sock), *this, limits());
    {
        std::lock_guard lck(mutex_);
        sessions_.insert(conn);
    }
    try {
        co_await conn->run();
    }
    catch (const std::exception& e) {
        get_logger()->error("session::run() exception: {}", e.what());
    }
    {
        std::lock_guard lck(mutex_);
        sessions_.erase(conn);
    }
    get_logger()->trace(
        "close connection [{}:{}]", remote_endp.address().to_string(), remote_endp.port());
}

void http_server_impl::set_limits(const connection_limits& limits)
{
    std::lock_guard lck(mutex_);
    limits_ = limits;
}

connection_limits http_server_impl::limits() const
{
    std::lock_guard lck(mutex_);
    return limits_;
}

tcp::endpoint http_server_impl::local_endpoint() const
{
    boost::system::error_code ec;
    return acceptor_.local_endpoint(ec);
}

std::shared_ptr<spdlog::logger> http_server_impl::get_logger() const
{
    if (custom_logger_)
        return custom_logger_;
    return default_logger_;
}

void http_server_impl::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    custom_logger_ = std::move(logger);
}

} // namespace mediastream::server
