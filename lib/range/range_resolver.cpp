#include "mediastream/range/range_resolver.hpp"
#include "mediastream/error.hpp"
#include <algorithm>

namespace mediastream::range {

resolution resolve_range(const std::optional<range_request>& req,
                         std::uint64_t total_length,
                         boost::system::error_code& ec,
                         std::uint64_t window_size /*= default_window_size*/)
{
    ec = {};
    if (!req)
        return std::nullopt;

    if (req->start >= total_length) {
        ec = error::range_not_satisfiable;
        return std::nullopt;
    }

    // bytes after start, without overflowing near the top of the u64 range
    const std::uint64_t remaining = total_length - 1 - req->start;

    std::uint64_t end = 0;
    if (req->end) {
        end = std::min(*req->end, total_length - 1);
    }
    else {
        window_size = std::max<std::uint64_t>(window_size, 1);
        end         = req->start + std::min(window_size - 1, remaining);
    }

    if (end < req->start) {
        ec = error::range_not_satisfiable;
        return std::nullopt;
    }
    return byte_range {req->start, end};
}

} // namespace mediastream::range
