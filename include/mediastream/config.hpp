#pragma once
#include <filesystem>

namespace boost
{
namespace asio
{
namespace ip
{
class tcp;
}
} // namespace asio

namespace beast
{
namespace http
{
}
} // namespace beast

namespace json
{
}

} // namespace boost

namespace spdlog
{
class logger;
}

namespace mediastream
{
namespace net   = boost::asio;
using tcp       = net::ip::tcp;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace json  = boost::json;
namespace fs    = std::filesystem;

} // namespace mediastream
