#pragma once
#include "mediastream/body/any_body.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mediastream::server {

class request : public http::request<body::any_body>
{
public:
    request(const tcp::endpoint& local_endpoint,
            const tcp::endpoint& remote_endpoint,
            http::request<body::any_body>&& other);

    request(const tcp::endpoint& local_endpoint,
            const tcp::endpoint& remote_endpoint,
            const http::request<http::empty_body>& header);

    /// Percent-decoded target without the query string.
    std::string_view path() const;

    /// The value of `field`, or empty when the header is absent.
    std::optional<std::string_view> header_value(http::field field) const;

    const tcp::endpoint& local_endpoint() const;
    const tcp::endpoint& remote_endpoint() const;

    /// Throws `std::out_of_range` for a parameter the matched route does not declare.
    std::string_view path_param(const std::string& key) const;
    void set_path_param(std::unordered_map<std::string, std::string>&& params);

private:
    void decode_target();

    std::string decoded_path_;

    tcp::endpoint local_endpoint_;
    tcp::endpoint remote_endpoint_;

    std::unordered_map<std::string, std::string> path_params_;
};

} // namespace mediastream::server
