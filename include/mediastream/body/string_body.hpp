#pragma once
#include "mediastream/config.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace mediastream::body {

/// In-memory payload, used for small responses and non-multipart request bodies.
struct string_body
{
    using value_type = std::string;

    class reader
    {
        value_type& body_;

    public:
        explicit reader(const http::fields&, value_type& b);

        void init(boost::optional<std::uint64_t> const& length, beast::error_code& ec);
        std::size_t put(net::const_buffer const& buffer, beast::error_code& ec);
        void finish(beast::error_code& ec);
    };

    class writer
    {
        value_type const& body_;

    public:
        using const_buffers_type = net::const_buffer;

        explicit writer(const http::fields&, value_type const& b);

        void init(beast::error_code& ec) { ec = {}; }
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);
    };
};

} // namespace mediastream::body
