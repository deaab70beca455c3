#pragma once
#include <ctime>
#include <string>

namespace mediastream::util {

/// IMF-fixdate, e.g. `Sun, 06 Nov 1994 08:49:37 GMT`.
std::string format_http_gmt_date(const std::time_t& time);

std::string format_http_current_gmt_date();

} // namespace mediastream::util
