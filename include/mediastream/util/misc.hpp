#pragma once
#include "mediastream/config.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/buffer.hpp>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mediastream::util {

namespace detail {

static inline int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace detail

/**
 * Decode `%XX` escapes.
 *
 * An escape that is truncated or not followed by two hex digits is kept verbatim.
 */
static inline std::string url_decode(std::string_view str)
{
    std::string result;
    result.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            auto high = detail::hex_value(str[i + 1]);
            auto low  = detail::hex_value(str[i + 2]);
            if (high >= 0 && low >= 0) {
                result.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        result.push_back(str[i]);
    }
    return result;
}

/// Split on `delimiter`, trimming every part. Empty parts are dropped.
static inline std::vector<std::string_view> split(std::string_view str, std::string_view delimiter)
{
    std::vector<std::string_view> parts;
    if (delimiter.empty()) {
        if (!str.empty())
            parts.push_back(str);
        return parts;
    }

    for (;;) {
        auto pos  = str.find(delimiter);
        auto part = boost::trim_copy(str.substr(0, pos));
        if (!part.empty())
            parts.push_back(part);

        if (pos == std::string_view::npos)
            break;
        str.remove_prefix(pos + delimiter.size());
    }
    return parts;
}

/// Header values are `beast::string_view`, which is not a `std::string_view` on every Boost.
template<class StringView>
static inline std::string_view to_std_view(const StringView& value)
{
    return std::string_view(value.data(), value.size());
}

static inline std::string_view buffer_to_string_view(const boost::asio::const_buffer& buffer)
{
    return std::string_view(static_cast<const char*>(buffer.data()), buffer.size());
}

} // namespace mediastream::util
