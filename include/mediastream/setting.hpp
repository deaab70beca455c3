#pragma once
#include "mediastream/config.hpp"
#include "mediastream/range/byte_range.hpp"
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mediastream {

struct setting
{
    std::string host   = "0.0.0.0";
    std::uint16_t port = 8080;

    fs::path upload_dir = "./uploads";

    /// Unset: `<upload_dir>/catalog.json`. Empty: the catalog is not persisted.
    std::optional<fs::path> catalog_file;

    std::uint64_t window_size = range::default_window_size;

    /// 0 selects the number of hardware threads.
    std::size_t threads = 0;

    std::uint64_t max_upload_size = 500 * 1024 * 1024;

    std::chrono::steady_clock::duration read_timeout  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout = std::chrono::seconds(30);

    std::string log_level = "info";

    std::vector<std::string> allowed_media_types = {"video/mp4", "video/webm", "video/quicktime"};

public:
    fs::path catalog_path() const;
    std::size_t thread_count() const;

    /// Overlay the keys present in `doc` on the defaults. Unknown keys are ignored.
    static setting from_json(const json::value& doc, boost::system::error_code& ec);
    static setting load(const fs::path& file, boost::system::error_code& ec);
};

} // namespace mediastream
