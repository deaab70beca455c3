#include "mediastream/range/content_responder.hpp"
#include "mediastream/error.hpp"
#include <boost/beast/core/detail/clamp.hpp>

namespace mediastream::range {

stream_response respond(const content_descriptor& content,
                        const resolution& resolved,
                        std::shared_ptr<storage::seekable_readable> reader,
                        boost::system::error_code& ec)
{
    ec = {};

    stream_response resp;
    resp.media_type = content.media_type;

    if (!resolved) {
        resp.status         = stream_status::full;
        resp.content_length = content.total_length;
        resp.payload        = blob_source {std::move(reader), 0, content.total_length};
        return resp;
    }

    const auto& range = *resolved;
    if (range.end < range.start || range.end >= content.total_length) {
        ec = error::range_not_satisfiable;
        return resp;
    }

    const auto length = range.length();
    if (length > boost::beast::detail::clamp(length)) {
        ec = error::storage_failure;
        return resp;
    }

    std::string data(static_cast<std::size_t>(length), '\0');
    auto nread = reader->read_at(range.start, data.data(), data.size(), ec);
    if (ec) {
        ec = error::storage_failure;
        return resp;
    }
    if (nread != data.size()) {
        ec = error::incomplete_read;
        return resp;
    }

    resp.status         = stream_status::partial;
    resp.range          = content_range {range.start, range.end, content.total_length};
    resp.content_length = length;
    resp.payload        = std::move(data);
    return resp;
}

} // namespace mediastream::range
