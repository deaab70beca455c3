#pragma once
#include "mediastream/catalog/catalog.hpp"
#include <filesystem>
#include <map>
#include <shared_mutex>

namespace mediastream::catalog {

/**
 * Catalog kept in memory.
 *
 * With a snapshot file, the catalog is written to it as JSON after each `create` and can be
 * restored with `load`. An empty path disables persistence.
 */
class memory_catalog : public catalog
{
public:
    explicit memory_catalog(fs::path snapshot_file = {});

    /// Restore from the snapshot file. A missing file leaves the catalog empty.
    void load(boost::system::error_code& ec);

    catalog_entry lookup(std::uint64_t id, boost::system::error_code& ec) const override;
    media_record get(std::uint64_t id, boost::system::error_code& ec) const override;
    std::vector<media_record> list() const override;
    media_record create(media_record draft, boost::system::error_code& ec) override;

    std::size_t size() const;

private:
    void save(boost::system::error_code& ec) const;

private:
    fs::path snapshot_file_;

    mutable std::shared_mutex mutex_;
    std::map<std::uint64_t, media_record> records_;
    std::uint64_t next_id_ = 1;
};

} // namespace mediastream::catalog
