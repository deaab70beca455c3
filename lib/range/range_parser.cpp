#include "mediastream/range/range_parser.hpp"
#include "mediastream/error.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <charconv>

namespace mediastream::range {

namespace detail {

static bool parse_offset(std::string_view str, std::uint64_t& value)
{
    if (str.empty())
        return false;

    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    return ec == std::errc {} && ptr == str.data() + str.size();
}

} // namespace detail

std::optional<range_request> parse_range(std::optional<std::string_view> header,
                                         boost::system::error_code& ec)
{
    ec = {};
    if (!header)
        return std::nullopt;

    auto range_str = boost::trim_copy(*header);
    if (!range_str.starts_with("bytes=")) {
        ec = error::invalid_range_syntax;
        return std::nullopt;
    }
    range_str.remove_prefix(6);

    // single range only
    if (range_str.find(',') != std::string_view::npos) {
        ec = error::invalid_range_syntax;
        return std::nullopt;
    }

    auto pos = range_str.find('-');
    if (pos == std::string_view::npos) {
        ec = error::invalid_range_syntax;
        return std::nullopt;
    }
    auto first_str = boost::trim_copy(range_str.substr(0, pos));
    auto last_str  = boost::trim_copy(range_str.substr(pos + 1));

    range_request req;
    if (!detail::parse_offset(first_str, req.start)) {
        ec = error::invalid_range_syntax;
        return std::nullopt;
    }
    if (!last_str.empty()) {
        std::uint64_t end = 0;
        if (!detail::parse_offset(last_str, end)) {
            ec = error::invalid_range_syntax;
            return std::nullopt;
        }
        req.end = end;
    }
    return req;
}

} // namespace mediastream::range
