#include "session.hpp"
#include "mediastream/util/use_awaitable.hpp"
#include "server_impl.h"
#include <boost/asio/dispatch.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

namespace mediastream::server {

session::session(tcp::socket&& sock, http_server_impl& serv, const connection_limits& limits)
    : serv_(serv)
    , limits_(limits)
    , stream_(std::move(sock))
{
    boost::system::error_code ec;
    local_endpoint_  = stream_.socket().local_endpoint(ec);
    remote_endpoint_ = stream_.socket().remote_endpoint(ec);
}

void session::abort()
{
    if (abort_.exchange(true))
        return;

    net::dispatch(stream_.get_executor(), [self = shared_from_this()]() { self->stream_.close(); });
}

net::awaitable<void> session::run()
{
    boost::system::error_code ec;
    auto& router = serv_.router();

    while (!abort_) {
        http::request_parser<http::empty_body> header_parser;
        header_parser.header_limit(limits_.header_limit);
        header_parser.body_limit(limits_.body_limit);

        stream_.expires_after(limits_.read_timeout);
        co_await http::async_read_header(stream_, buffer_, header_parser, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec == http::error::body_limit) {
            co_await reject(header_parser.get(), http::status::payload_too_large);
            co_return;
        }
        if (ec) {
            serv_.get_logger()->trace("read http header failed: {}", ec.message());
            co_return;
        }

        const auto& header = header_parser.get();

        response resp(header.version(), header.keep_alive());
        request req(local_endpoint_, remote_endpoint_, header);

        auto start_time = std::chrono::steady_clock::now();

        try {
            if (co_await router.pre_routing(req, resp)) {
                if (beast::iequals(header[http::field::expect], "100-continue")) {
                    response continue_resp(header.version(), true);
                    continue_resp.set_empty_content(http::status::continue_);
                    if (!co_await async_write(req, continue_resp))
                        co_return;
                }

                http::request_parser<body::any_body> body_parser(std::move(header_parser));
                body_parser.body_limit(limits_.body_limit);
                while (!body_parser.is_done()) {
                    stream_.expires_after(limits_.read_timeout);
                    co_await http::async_read_some(
                        stream_, buffer_, body_parser, util::net_awaitable[ec]);
                    stream_.expires_never();
                    if (ec == http::error::body_limit) {
                        co_await reject(req.base(), http::status::payload_too_large);
                        co_return;
                    }
                    if (ec) {
                        serv_.get_logger()->trace("read http body failed: {}", ec.message());
                        co_return;
                    }
                }
                req.body() = std::move(body_parser.release().body());
                start_time = std::chrono::steady_clock::now();

                co_await router.proc_routing(req, resp);
            }
        }
        catch (const std::exception& e) {
            serv_.get_logger()->warn("exception in business function, reason: {}", e.what());
            resp.set_string_content(
                std::string(e.what()), "text/plain", http::status::internal_server_error);
        }

        auto span_time = std::chrono::steady_clock::now() - start_time;

        serv_.get_logger()->debug(
            "{} {} ({}:{} -> {}:{}) {} {}ms",
            std::string_view(req.method_string().data(), req.method_string().size()),
            std::string_view(req.target().data(), req.target().size()),
            remote_endpoint_.address().to_string(),
            remote_endpoint_.port(),
            local_endpoint_.address().to_string(),
            local_endpoint_.port(),
            resp.result_int(),
            std::chrono::duration_cast<std::chrono::milliseconds>(span_time).count());

        if (!co_await async_write(req, resp))
            co_return;

        if (resp.need_eof()) {
            // The response announced "Connection: close" or has no length framing.
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}

net::awaitable<bool> session::async_write(const request& req, response& resp)
{
    if (!resp.has_content_length() && !resp.chunked())
        resp.prepare_payload();

    boost::system::error_code ec;
    http::response_serializer<body::any_body> serializer(resp);

    stream_.expires_after(limits_.write_timeout);
    co_await http::async_write_header(stream_, serializer, util::net_awaitable[ec]);
    stream_.expires_never();
    if (ec) {
        serv_.get_logger()->trace("write http header failed: {}", ec.message());
        co_return false;
    }

    if (req.method() == http::verb::head)
        co_return true;

    while (!serializer.is_done()) {
        stream_.expires_after(limits_.write_timeout);
        co_await http::async_write_some(stream_, serializer, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            serv_.get_logger()->trace("write http body failed: {}", ec.message());
            co_return false;
        }
    }
    co_return true;
}

net::awaitable<void> session::reject(const http::request_header<>& header, http::status status)
{
    serv_.get_logger()->warn("{} {} rejected: {}",
                             std::string_view(header.method_string().data(),
                                              header.method_string().size()),
                             std::string_view(header.target().data(), header.target().size()),
                             static_cast<int>(status));

    response resp(header.version(), false);
    resp.set_error_content(status);

    request req(local_endpoint_, remote_endpoint_, http::request<http::empty_body>(header));
    if (co_await async_write(req, resp)) {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
}

} // namespace mediastream::server
