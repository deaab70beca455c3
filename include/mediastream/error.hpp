#pragma once
#include <boost/system/error_code.hpp>
#include <type_traits>

namespace mediastream {

enum class error
{
    /// The identifier does not resolve in the catalog or the blob store.
    resource_not_found = 1,

    /// The Range header value is not `bytes=<start>-[<end>]`.
    invalid_range_syntax,

    /// The range is well formed but lies outside the resource.
    range_not_satisfiable,

    /// Storage returned fewer bytes than the resolved range requires.
    incomplete_read,

    /// Any other storage I/O failure.
    storage_failure,

    /// The uploaded part's media type is not in the allow-list.
    unsupported_media_type,

    /// A required form field is absent or empty.
    missing_field,

    /// A setting has the wrong type or an unusable value.
    invalid_setting,
};

const boost::system::error_category& error_category() noexcept;

inline boost::system::error_code make_error_code(error e) noexcept
{
    return {static_cast<int>(e), error_category()};
}

} // namespace mediastream

namespace boost::system {
template<>
struct is_error_code_enum<mediastream::error> : std::true_type
{
};
} // namespace boost::system
