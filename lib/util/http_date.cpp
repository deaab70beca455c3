#include "mediastream/util/http_date.hpp"
#include <array>
#include <cstdio>

namespace mediastream::util {

namespace detail {

static void _gmtime(struct tm* _Tm, const time_t* _Time)
{
#ifdef _WIN32
    gmtime_s(_Tm, _Time);
#else
    gmtime_r(_Time, _Tm);
#endif
}

} // namespace detail

std::string format_http_gmt_date(const std::time_t& time)
{
    std::tm tm {};
    detail::_gmtime(&tm, &time);

    static const std::array<const char*, 7> WEEKDAY = {
        "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const std::array<const char*, 12> MONTH = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    char buf[64] = {0};
    std::snprintf(buf,
                  sizeof(buf),
                  "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  WEEKDAY[tm.tm_wday],
                  tm.tm_mday,
                  MONTH[tm.tm_mon],
                  tm.tm_year + 1900,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec);
    return buf;
}

std::string format_http_current_gmt_date()
{
    return format_http_gmt_date(std::time(nullptr));
}

} // namespace mediastream::util
