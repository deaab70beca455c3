#include "mediastream/body/blob_body.hpp"
#include "mediastream/error.hpp"
#include <boost/beast/http/error.hpp>
#include <algorithm>

namespace mediastream::body {

namespace {
constexpr std::size_t chunk_size = 64 * 1024;
}

blob_body::writer::writer(const http::fields&, value_type const& body)
    : body_(body)
{
}

void blob_body::writer::init(beast::error_code& ec)
{
    if (!body_.reader) {
        ec = error::storage_failure;
        return;
    }
    position_  = body_.offset;
    remaining_ = body_.length;
    buffer_.resize(static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, remaining_)));
    ec = {};
}

boost::optional<std::pair<blob_body::writer::const_buffers_type, bool>>
blob_body::writer::get(beast::error_code& ec)
{
    ec = {};
    if (remaining_ == 0)
        return boost::none;

    const auto want =
        static_cast<std::size_t>(std::min<std::uint64_t>(buffer_.size(), remaining_));
    const auto n = body_.reader->read_at(position_, buffer_.data(), want, ec);
    if (ec)
        return boost::none;

    // The blob shrank below the advertised Content-Length.
    if (n == 0) {
        ec = http::error::short_read;
        return boost::none;
    }
    position_ += n;
    remaining_ -= n;
    return std::make_pair(net::const_buffer(buffer_.data(), n), remaining_ > 0);
}

} // namespace mediastream::body
