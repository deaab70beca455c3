#include "mediastream/storage/fs_blob_store.hpp"
#include "mediastream/error.hpp"
#include <algorithm>
#include <boost/beast/core/file.hpp>

namespace mediastream::storage {

namespace detail {

class file_readable : public seekable_readable
{
public:
    explicit file_readable(beast::file&& file)
        : file_(std::move(file))
    {
    }

    std::uint64_t size(boost::system::error_code& ec) const override { return file_.size(ec); }

    std::size_t read_at(std::uint64_t offset,
                        void* buffer,
                        std::size_t n,
                        boost::system::error_code& ec) override
    {
        file_.seek(offset, ec);
        if (ec)
            return 0;
        return file_.read(buffer, n, ec);
    }

private:
    beast::file file_;
};

} // namespace detail

fs_blob_store::fs_blob_store(const fs::path& root)
{
    fs::create_directories(root);
    root_ = fs::canonical(root);
}

const fs::path& fs_blob_store::root() const
{
    return root_;
}

bool fs_blob_store::is_inside_root(const fs::path& path) const
{
    auto [root_iter, path_iter] =
        std::mismatch(root_.begin(), root_.end(), path.begin(), path.end());
    return root_iter == root_.end() && path_iter != path.end() && !path_iter->empty();
}

std::optional<fs::path> fs_blob_store::resolve(std::string_view blob_id) const
{
    if (blob_id.empty() || blob_id.find('\0') != std::string_view::npos)
        return std::nullopt;

    fs::path relative(std::u8string_view((const char8_t*)blob_id.data(), blob_id.size()));
    if (relative.has_root_path())
        return std::nullopt;

    auto path = (root_ / relative).lexically_normal();
    if (!is_inside_root(path))
        return std::nullopt;

    // a symbolic link inside the root may still point outside of it
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto real_path = fs::canonical(path, ec);
        if (ec || !is_inside_root(real_path))
            return std::nullopt;
        return real_path;
    }
    return path;
}

std::unique_ptr<seekable_readable> fs_blob_store::open(std::string_view blob_id,
                                                       boost::system::error_code& ec) const
{
    ec        = {};
    auto path = resolve(blob_id);

    std::error_code fs_ec;
    if (!path || !fs::is_regular_file(*path, fs_ec)) {
        ec = error::resource_not_found;
        return nullptr;
    }

    beast::file file;
    file.open(path->string().c_str(), beast::file_mode::read, ec);
    if (ec) {
        ec = (ec == boost::system::errc::no_such_file_or_directory) ? error::resource_not_found
                                                                      : error::storage_failure;
        return nullptr;
    }
    return std::make_unique<detail::file_readable>(std::move(file));
}

std::uint64_t fs_blob_store::size(std::string_view blob_id, boost::system::error_code& ec) const
{
    ec        = {};
    auto path = resolve(blob_id);

    std::error_code fs_ec;
    if (!path || !fs::is_regular_file(*path, fs_ec)) {
        ec = error::resource_not_found;
        return 0;
    }
    auto file_size = fs::file_size(*path, fs_ec);
    if (fs_ec) {
        ec = error::storage_failure;
        return 0;
    }
    return file_size;
}

void fs_blob_store::store(std::string_view blob_id,
                          std::string_view content,
                          boost::system::error_code& ec)
{
    ec        = {};
    auto path = resolve(blob_id);
    if (!path) {
        ec = error::resource_not_found;
        return;
    }

    auto temp_path = *path;
    temp_path += ".part";

    std::error_code fs_ec;
    {
        beast::file file;
        file.open(temp_path.string().c_str(), beast::file_mode::write, ec);
        if (!ec)
            file.write(content.data(), content.size(), ec);
        if (!ec)
            file.close(ec);
    }
    if (!ec) {
        fs::rename(temp_path, *path, fs_ec);
        if (!fs_ec)
            return;
    }
    fs::remove(temp_path, fs_ec);
    ec = error::storage_failure;
}

} // namespace mediastream::storage
