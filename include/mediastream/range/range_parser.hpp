#pragma once
#include "mediastream/range/byte_range.hpp"
#include <boost/system/error_code.hpp>
#include <optional>
#include <string_view>

namespace mediastream::range {

/**
 * Parse the value of a Range header.
 *
 * Only a single `bytes=<start>-<end>` or `bytes=<start>-` is accepted. Every other form,
 * including suffix ranges and range lists, sets `ec` to `error::invalid_range_syntax`.
 *
 * @param header The header value, or empty when the request has no Range header.
 * @return The parsed request, or empty when no range was requested or parsing failed.
 */
std::optional<range_request> parse_range(std::optional<std::string_view> header,
                                         boost::system::error_code& ec);

} // namespace mediastream::range
