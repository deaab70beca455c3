#pragma once
#include "mediastream/config.hpp"
#include "mediastream/server/request.hpp"
#include "mediastream/server/response.hpp"
#include "mediastream/server/server.hpp"
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <memory>

namespace mediastream::server {

class http_server_impl;

/// One client connection: reads requests, routes them and writes the responses in order.
class session : public std::enable_shared_from_this<session>
{
public:
    session(tcp::socket&& sock, http_server_impl& serv, const connection_limits& limits);

    void abort();
    net::awaitable<void> run();

private:
    net::awaitable<bool> async_write(const request& req, response& resp);
    net::awaitable<void> reject(const http::request_header<>& header, http::status status);

    http_server_impl& serv_;
    const connection_limits limits_;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;

    tcp::endpoint local_endpoint_;
    tcp::endpoint remote_endpoint_;

    std::atomic_bool abort_ = false;
};

} // namespace mediastream::server
