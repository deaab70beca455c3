#pragma once
#include "mediastream/range/byte_range.hpp"
#include <boost/system/error_code.hpp>
#include <optional>

namespace mediastream::range {

/**
 * Validate a parsed range against the real length of the resource.
 *
 * A closed range is clamped to the last byte. An open-ended range is limited to
 * `window_size` bytes. A start at or past `total_length`, or an end before the start,
 * sets `ec` to `error::range_not_satisfiable`.
 *
 * @return Empty for the whole resource, otherwise the interval to send.
 */
resolution resolve_range(const std::optional<range_request>& req,
                         std::uint64_t total_length,
                         boost::system::error_code& ec,
                         std::uint64_t window_size = default_window_size);

} // namespace mediastream::range
