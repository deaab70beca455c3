#include "mediastream/server/request.hpp"
#include "mediastream/util/misc.hpp"

namespace mediastream::server {

request::request(const tcp::endpoint& local_endpoint,
                 const tcp::endpoint& remote_endpoint,
                 http::request<body::any_body>&& other)
    : http::request<body::any_body>(std::move(other))
    , local_endpoint_(local_endpoint)
    , remote_endpoint_(remote_endpoint)
{
    decode_target();
}

request::request(const tcp::endpoint& local_endpoint,
                 const tcp::endpoint& remote_endpoint,
                 const http::request<http::empty_body>& header)
    : http::request<body::any_body>(header.base())
    , local_endpoint_(local_endpoint)
    , remote_endpoint_(remote_endpoint)
{
    decode_target();
}

void request::decode_target()
{
    auto target = util::to_std_view(this->target());
    if (auto pos = target.find('?'); pos != std::string_view::npos)
        target = target.substr(0, pos);

    decoded_path_ = util::url_decode(target);
}

std::string_view request::path() const
{
    return decoded_path_;
}

std::optional<std::string_view> request::header_value(http::field field) const
{
    auto iter = this->find(field);
    if (iter == this->end())
        return std::nullopt;
    return util::to_std_view(iter->value());
}

const tcp::endpoint& request::local_endpoint() const
{
    return local_endpoint_;
}

const tcp::endpoint& request::remote_endpoint() const
{
    return remote_endpoint_;
}

std::string_view request::path_param(const std::string& key) const
{
    return path_params_.at(key);
}

void request::set_path_param(std::unordered_map<std::string, std::string>&& params)
{
    path_params_ = std::move(params);
}

} // namespace mediastream::server
