#pragma once
#include "mediastream/config.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/optional.hpp>
#include <cstdint>

namespace mediastream::body {

/// A message without payload. Any received body byte is an error.
struct empty_body
{
    struct value_type
    {
    };

    struct reader
    {
        explicit reader(const http::fields&, value_type&);

        void init(boost::optional<std::uint64_t> const&, beast::error_code& ec);
        std::size_t put(net::const_buffer const&, beast::error_code& ec);
        void finish(beast::error_code& ec);
    };

    struct writer
    {
        using const_buffers_type = net::const_buffer;

        explicit writer(const http::fields&, value_type const&);

        void init(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);
    };
};

} // namespace mediastream::body
