#pragma once
#include "mediastream/config.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace mediastream::server {

class router;
class http_server_impl;

/// Applied to every connection accepted after the limits were set.
struct connection_limits
{
    std::chrono::steady_clock::duration read_timeout  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout = std::chrono::seconds(30);

    /// Largest accepted request body. Bigger requests get 413.
    std::uint64_t body_limit = 500 * 1024 * 1024;

    std::uint32_t header_limit = 64 * 1024;
};

class http_server
{
public:
    explicit http_server(net::io_context& ioc);
    explicit http_server(const net::any_io_executor& ex);
    ~http_server();

    net::any_io_executor get_executor() noexcept;

    /// Throws `boost::system::system_error` when the address cannot be bound.
    http_server& listen(std::string_view host,
                        uint16_t port,
                        int backlog = net::socket_base::max_listen_connections);
    http_server& listen(uint16_t port, int backlog = net::socket_base::max_listen_connections);

    net::awaitable<boost::system::error_code> co_run();
    void async_run();
    void stop();

    server::router& router();

    tcp::endpoint local_endpoint() const;

    void set_limits(const connection_limits& limits);
    connection_limits limits() const;

    std::shared_ptr<spdlog::logger> get_logger() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    std::unique_ptr<http_server_impl> impl_;
};

} // namespace mediastream::server
