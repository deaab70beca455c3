#include "mediastream/server/response.hpp"
#include "mediastream/util/http_date.hpp"
#include "mediastream/util/misc.hpp"
#include <boost/beast/version.hpp>
#include <fmt/format.h>

namespace mediastream::server {

response::response(unsigned int version, bool keep_alive)
{
    this->result(http::status::not_found);
    this->version(version);
    this->set(http::field::server, BOOST_BEAST_VERSION_STRING);
    this->set(http::field::date, util::format_http_current_gmt_date());
    this->keep_alive(keep_alive);
}

void response::set_empty_content(http::status status)
{
    this->result(status);
    this->body() = body::empty_body::value_type {};
    this->content_length(0);
}

void response::set_error_content(http::status status)
{
    auto reason  = http::obsolete_reason(status);
    auto content = fmt::format(
        R"(<html>
<head><title>{0} {1}</title></head>
<body bgcolor="white">
<center><h1>{0} {1}</h1></center>
<hr><center>{2}</center>
</body>
</html>)",
        static_cast<int>(status),
        std::string_view(reason.data(), reason.size()),
        BOOST_BEAST_VERSION_STRING);

    this->set_string_content(std::move(content), "text/html; charset=utf-8", status);
}

void response::set_string_content(std::string&& data,
                                  std::string_view content_type,
                                  http::status status /*= http::status::ok*/)
{
    this->content_length(data.size());
    this->set(http::field::content_type, std::string(content_type));
    this->result(status);
    this->body() = std::move(data);
}

void response::set_json_content(json::value&& data, http::status status /*= http::status::ok*/)
{
    this->result(status);
    this->set(http::field::content_type, "application/json; charset=utf-8");
    this->set(http::field::cache_control, "no-store");
    this->body() = std::move(data);
}

void response::set_stream_content(range::stream_response&& stream)
{
    this->result(stream.status == range::stream_status::partial ? http::status::partial_content
                                                                : http::status::ok);
    this->set(http::field::content_type, stream.media_type);
    this->set(http::field::accept_ranges, "bytes");
    if (stream.range)
        this->set(http::field::content_range, stream.range->to_string());
    else
        this->erase(http::field::content_range);
    this->content_length(stream.content_length);

    std::visit([this](auto&& payload) { this->body() = std::move(payload); },
               std::move(stream.payload));
}

void response::set_range_not_satisfiable(std::uint64_t total_length)
{
    this->set(http::field::content_range, range::content_range::unsatisfied(total_length));
    this->set(http::field::accept_ranges, "bytes");
    set_empty_content(http::status::range_not_satisfiable);
}

} // namespace mediastream::server
