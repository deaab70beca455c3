#include "mediastream/body/string_body.hpp"
#include <boost/beast/core/detail/clamp.hpp>
#include <boost/beast/http/error.hpp>

namespace mediastream::body {

string_body::reader::reader(const http::fields&, value_type& b)
    : body_(b)
{
}

void string_body::reader::init(boost::optional<std::uint64_t> const& length,
                               beast::error_code& ec)
{
    if (length) {
        if (*length > body_.max_size()) {
            ec = http::error::buffer_overflow;
            return;
        }
        body_.reserve(beast::detail::clamp(*length));
    }
    ec = {};
}

std::size_t string_body::reader::put(net::const_buffer const& buffer, beast::error_code& ec)
{
    const auto extra = buffer.size();
    if (extra > body_.max_size() - body_.size()) {
        ec = http::error::buffer_overflow;
        return 0;
    }
    body_.append(static_cast<const char*>(buffer.data()), extra);
    ec = {};
    return extra;
}

void string_body::reader::finish(beast::error_code& ec)
{
    ec = {};
}

string_body::writer::writer(const http::fields&, value_type const& b)
    : body_(b)
{
}

boost::optional<std::pair<string_body::writer::const_buffers_type, bool>>
string_body::writer::get(beast::error_code& ec)
{
    ec = {};
    return {{const_buffers_type {body_.data(), body_.size()}, false}};
}

} // namespace mediastream::body
