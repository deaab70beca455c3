#include "mediastream/range/byte_range.hpp"
#include <fmt/format.h>

namespace mediastream::range {

std::string content_range::to_string() const
{
    return fmt::format("bytes {}-{}/{}", start, end, total);
}

std::string content_range::unsatisfied(std::uint64_t total)
{
    return fmt::format("bytes */{}", total);
}

} // namespace mediastream::range
