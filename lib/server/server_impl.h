#pragma once
#include "mediastream/server/server.hpp"
#include "router_impl.h"
#include "session.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace mediastream::server {

class http_server_impl
{
public:
    explicit http_server_impl(const net::any_io_executor& ex);

    net::any_io_executor get_executor() noexcept;

    void listen(std::string_view host, uint16_t port, int backlog);

    void async_run();
    net::awaitable<boost::system::error_code> co_run();

    void stop();
    router_impl& router();

    void set_limits(const connection_limits& limits);
    connection_limits limits() const;

    tcp::endpoint local_endpoint() const;

    std::shared_ptr<spdlog::logger> get_logger() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    net::awaitable<void> handle_accept(tcp::socket sock);

    net::any_io_executor ex_;

    router_impl router_;
    tcp::acceptor acceptor_;

    mutable std::mutex mutex_;
    std::unordered_set<std::shared_ptr<session>> sessions_;
    connection_limits limits_;

    std::shared_ptr<spdlog::logger> default_logger_;
    std::shared_ptr<spdlog::logger> custom_logger_;
};

} // namespace mediastream::server
