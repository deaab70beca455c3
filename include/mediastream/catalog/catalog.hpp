#pragma once
#include "mediastream/catalog/media_record.hpp"
#include <boost/system/error_code.hpp>
#include <vector>

namespace mediastream::catalog {

/// What the streaming path needs to know about a record.
struct catalog_entry
{
    std::string stored_file_name;
    std::string media_type;
};

class catalog
{
public:
    virtual ~catalog() = default;

    /// Unknown ids set `ec` to `error::resource_not_found`.
    virtual catalog_entry lookup(std::uint64_t id, boost::system::error_code& ec) const = 0;

    virtual media_record get(std::uint64_t id, boost::system::error_code& ec) const = 0;

    /// All records, newest first.
    virtual std::vector<media_record> list() const = 0;

    /// Store a new record. `id` and `created_at` of `draft` are assigned here.
    virtual media_record create(media_record draft, boost::system::error_code& ec) = 0;
};

} // namespace mediastream::catalog
