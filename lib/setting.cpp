#include "mediastream/setting.hpp"
#include "mediastream/error.hpp"
#include <boost/json/parse.hpp>
#include <fstream>
#include <iterator>
#include <spdlog/common.h>
#include <thread>

namespace mediastream {

namespace detail {

static bool read_uint(const json::value& value, std::uint64_t& out)
{
    if (value.is_uint64()) {
        out = value.get_uint64();
        return true;
    }
    if (value.is_int64() && value.get_int64() >= 0) {
        out = static_cast<std::uint64_t>(value.get_int64());
        return true;
    }
    return false;
}

static bool read_string(const json::value& value, std::string& out)
{
    if (!value.is_string())
        return false;
    out = value.get_string().c_str();
    return true;
}

static bool is_valid_log_level(const std::string& name)
{
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace detail

fs::path setting::catalog_path() const
{
    if (catalog_file)
        return *catalog_file;
    return upload_dir / "catalog.json";
}

std::size_t setting::thread_count() const
{
    if (threads != 0)
        return threads;
    return std::max(1u, std::thread::hardware_concurrency());
}

setting setting::from_json(const json::value& doc, boost::system::error_code& ec)
{
    ec = {};
    setting conf;

    auto obj = doc.if_object();
    if (!obj) {
        ec = error::invalid_setting;
        return conf;
    }

    bool ok = true;
    std::uint64_t number = 0;
    std::string text;

    for (const auto& item : *obj) {
        auto key          = std::string_view(item.key());
        const auto& value = item.value();

        if (key == "host") {
            ok = detail::read_string(value, conf.host) && !conf.host.empty();
        }
        else if (key == "port") {
            ok = detail::read_uint(value, number) && number <= 65535;
            conf.port = static_cast<std::uint16_t>(number);
        }
        else if (key == "upload_dir") {
            ok              = detail::read_string(value, text) && !text.empty();
            conf.upload_dir = text;
        }
        else if (key == "catalog_file") {
            ok                = detail::read_string(value, text);
            conf.catalog_file = fs::path(text);
        }
        else if (key == "window_size") {
            ok               = detail::read_uint(value, number) && number > 0;
            conf.window_size = number;
        }
        else if (key == "threads") {
            ok           = detail::read_uint(value, number);
            conf.threads = static_cast<std::size_t>(number);
        }
        else if (key == "max_upload_size") {
            ok                   = detail::read_uint(value, number) && number > 0;
            conf.max_upload_size = number;
        }
        else if (key == "read_timeout") {
            ok                = detail::read_uint(value, number) && number > 0;
            conf.read_timeout = std::chrono::seconds(number);
        }
        else if (key == "write_timeout") {
            ok                 = detail::read_uint(value, number) && number > 0;
            conf.write_timeout = std::chrono::seconds(number);
        }
        else if (key == "log_level") {
            ok = detail::read_string(value, conf.log_level) &&
                 detail::is_valid_log_level(conf.log_level);
        }
        else if (key == "allowed_media_types") {
            auto list = value.if_array();
            ok        = list && !list->empty();
            if (ok) {
                conf.allowed_media_types.clear();
                for (const auto& v : *list) {
                    if (!detail::read_string(v, text)) {
                        ok = false;
                        break;
                    }
                    conf.allowed_media_types.push_back(text);
                }
            }
        }
        if (!ok) {
            ec = error::invalid_setting;
            return conf;
        }
    }
    return conf;
}

setting setting::load(const fs::path& file, boost::system::error_code& ec)
{
    std::ifstream stream(file, std::ios::binary);
    if (!stream) {
        ec = boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
        return {};
    }
    std::string content((std::istreambuf_iterator<char>(stream)),
                        std::istreambuf_iterator<char>());

    auto doc = json::parse(content, ec);
    if (ec)
        return {};
    return from_json(doc, ec);
}

} // namespace mediastream
