#pragma once
#include "mediastream/config.hpp"
#include "mediastream/range/content_responder.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <vector>

namespace mediastream::body {

/**
 * Streams a window of a stored blob.
 *
 * The blob is read in chunks with positioned reads while the message is serialized,
 * so the payload is never held in memory as a whole.
 */
struct blob_body
{
    using value_type = range::blob_source;

    class writer
    {
    public:
        using const_buffers_type = net::const_buffer;

        writer(const http::fields&, value_type const& body);

        void init(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);

    private:
        value_type const& body_;
        std::uint64_t position_  = 0;
        std::uint64_t remaining_ = 0;
        std::vector<char> buffer_;
    };
};

} // namespace mediastream::body
