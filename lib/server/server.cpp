#include "mediastream/server/server.hpp"
#include "server_impl.h"

namespace mediastream::server {

http_server::http_server(net::io_context& ioc)
    : http_server(ioc.get_executor())
{
}

http_server::http_server(const net::any_io_executor& ex)
    : impl_(std::make_unique<http_server_impl>(ex))
{
}

http_server::~http_server() = default;

net::any_io_executor http_server::get_executor() noexcept
{
    return impl_->get_executor();
}

http_server& http_server::listen(std::string_view host, uint16_t port, int backlog)
{
    impl_->listen(host, port, backlog);
    return *this;
}

http_server& http_server::listen(uint16_t port, int backlog)
{
    return listen("0.0.0.0", port, backlog);
}

net::awaitable<boost::system::error_code> http_server::co_run()
{
    co_return co_await impl_->co_run();
}

void http_server::async_run()
{
    impl_->async_run();
}

void http_server::stop()
{
    impl_->stop();
}

router& http_server::router()
{
    return impl_->router();
}

tcp::endpoint http_server::local_endpoint() const
{
    return impl_->local_endpoint();
}

void http_server::set_limits(const connection_limits& limits)
{
    impl_->set_limits(limits);
}

connection_limits http_server::limits() const
{
    return impl_->limits();
}

std::shared_ptr<spdlog::logger> http_server::get_logger() const
{
    return impl_->get_logger();
}

void http_server::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    impl_->set_logger(std::move(logger));
}

} // namespace mediastream::server
