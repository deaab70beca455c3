#pragma once
#include "mediastream/config.hpp"
#include "mediastream/storage/blob_store.hpp"
#include <filesystem>
#include <optional>

namespace mediastream::storage {

/**
 * Blob store backed by a directory.
 *
 * Every blob id is resolved relative to the root. A resolved path that leaves the root,
 * lexically or through a symbolic link, is reported as not found.
 */
class fs_blob_store : public blob_store
{
public:
    /// Creates `root` when it does not exist. Throws `fs::filesystem_error` on failure.
    explicit fs_blob_store(const fs::path& root);

    const fs::path& root() const;

    std::unique_ptr<seekable_readable> open(std::string_view blob_id,
                                            boost::system::error_code& ec) const override;

    std::uint64_t size(std::string_view blob_id, boost::system::error_code& ec) const override;

    void store(std::string_view blob_id,
               std::string_view content,
               boost::system::error_code& ec) override;

private:
    std::optional<fs::path> resolve(std::string_view blob_id) const;
    bool is_inside_root(const fs::path& path) const;

private:
    fs::path root_;
};

} // namespace mediastream::storage
