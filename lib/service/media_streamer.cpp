#include "mediastream/service/media_streamer.hpp"
#include "mediastream/error.hpp"
#include "mediastream/range/range_parser.hpp"
#include "mediastream/range/range_resolver.hpp"
#include <spdlog/spdlog.h>

namespace mediastream::service {

std::string_view to_string(stream_state state)
{
    switch (state) {
        case stream_state::received: return "received";
        case stream_state::parsed: return "parsed";
        case stream_state::resolved: return "resolved";
        case stream_state::served: return "served";
        case stream_state::failed: return "failed";
    }
    return "unknown";
}

media_streamer::media_streamer(const catalog::catalog& catalog,
                               const storage::blob_store& store,
                               std::uint64_t window_size,
                               std::shared_ptr<spdlog::logger> logger)
    : catalog_(catalog)
    , store_(store)
    , window_size_(window_size)
    , logger_(std::move(logger))
{
}

stream_result media_streamer::serve(std::uint64_t id,
                                    std::optional<std::string_view> range_header) const
{
    stream_result result;
    boost::system::error_code ec;

    auto entry = catalog_.lookup(id, ec);
    if (ec) {
        fail(id, result, ec);
        return result;
    }

    std::shared_ptr<storage::seekable_readable> reader = store_.open(entry.stored_file_name, ec);
    if (ec) {
        fail(id, result, ec);
        return result;
    }
    result.total_length = store_.size(entry.stored_file_name, ec);
    if (ec) {
        fail(id, result, ec);
        return result;
    }

    auto requested = range::parse_range(range_header, ec);
    if (ec) {
        fail(id, result, ec);
        return result;
    }
    transition(id, result, stream_state::parsed);

    auto resolved = range::resolve_range(requested, result.total_length, ec, window_size_);
    if (ec) {
        fail(id, result, ec);
        return result;
    }
    transition(id, result, stream_state::resolved);

    range::content_descriptor content {result.total_length, entry.media_type};
    auto response = range::respond(content, resolved, std::move(reader), ec);
    if (ec) {
        fail(id, result, ec);
        return result;
    }
    result.response = std::move(response);
    transition(id, result, stream_state::served);
    return result;
}

void media_streamer::transition(std::uint64_t id, stream_result& result, stream_state next) const
{
    logger_->trace("stream {}: {} -> {}", id, to_string(result.state), to_string(next));
    result.state = next;
}

void media_streamer::fail(std::uint64_t id, stream_result& result, boost::system::error_code ec) const
{
    logger_->trace(
        "stream {}: {} -> failed ({})", id, to_string(result.state), ec.message());
    result.state = stream_state::failed;
    result.ec    = ec;
}

} // namespace mediastream::service
