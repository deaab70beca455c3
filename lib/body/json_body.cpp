#include "mediastream/body/json_body.hpp"

namespace mediastream::body {

json_body::writer::writer(const http::fields&, value_type const& body)
{
    serializer_.reset(&body);
}

void json_body::writer::init(beast::error_code& ec)
{
    ec = {};
}

boost::optional<std::pair<json_body::writer::const_buffers_type, bool>>
json_body::writer::get(beast::error_code& ec)
{
    ec = {};
    if (serializer_.done())
        return boost::none;

    const auto chunk = serializer_.read(buffer_, sizeof(buffer_));
    return std::make_pair(net::const_buffer(chunk.data(), chunk.size()), !serializer_.done());
}

} // namespace mediastream::body
