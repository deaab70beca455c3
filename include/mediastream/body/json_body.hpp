#pragma once
#include "mediastream/config.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/json/serializer.hpp>
#include <boost/json/value.hpp>
#include <boost/optional.hpp>

namespace mediastream::body {

/// Serializes a JSON document incrementally. Only used for responses.
struct json_body
{
    using value_type = json::value;

    class writer
    {
    public:
        using const_buffers_type = net::const_buffer;

        writer(const http::fields&, value_type const& body);

        void init(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);

    private:
        json::serializer serializer_;
        char buffer_[16384];
    };
};

} // namespace mediastream::body
