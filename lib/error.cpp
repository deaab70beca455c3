#include "mediastream/error.hpp"
#include <string>

namespace mediastream {

namespace detail {

class error_category_impl : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "mediastream"; }

    std::string message(int ev) const override
    {
        switch (static_cast<error>(ev)) {
            case error::resource_not_found: return "resource not found";
            case error::invalid_range_syntax: return "invalid range syntax";
            case error::range_not_satisfiable: return "range not satisfiable";
            case error::incomplete_read: return "incomplete read";
            case error::storage_failure: return "storage failure";
            case error::unsupported_media_type: return "unsupported media type";
            case error::missing_field: return "missing form field";
            case error::invalid_setting: return "invalid setting";
            default: return "mediastream error";
        }
    }
};

} // namespace detail

const boost::system::error_category& error_category() noexcept
{
    static const detail::error_category_impl category;
    return category;
}

} // namespace mediastream
