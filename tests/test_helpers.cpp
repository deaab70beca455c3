#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mediastream::test {

temp_dir::temp_dir()
{
    static std::atomic_int counter {0};
    auto name = fmt::format("mediastream-test-{}-{}",
                            std::chrono::steady_clock::now().time_since_epoch().count(),
                            counter++);
    path_ = fs::temp_directory_path() / name;
    fs::create_directories(path_);
}

temp_dir::~temp_dir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

char pattern_byte(std::uint64_t offset)
{
    return static_cast<char>((offset * 131 + 7) % 251);
}

std::string pattern(std::uint64_t offset, std::size_t length)
{
    std::string data(length, '\0');
    for (std::size_t i = 0; i < length; ++i)
        data[i] = pattern_byte(offset + i);
    return data;
}

void write_file(const fs::path& path, std::string_view content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file)
        throw std::runtime_error("cannot write " + path.string());
}

std::string read_file(const fs::path& path, std::uint64_t offset, std::size_t length)
{
    std::ifstream file(path, std::ios::binary);
    file.seekg(static_cast<std::streamoff>(offset));
    std::string data(length, '\0');
    file.read(data.data(), static_cast<std::streamsize>(length));
    data.resize(static_cast<std::size_t>(file.gcount()));
    return data;
}

void make_large_file(const fs::path& path, std::uint64_t total)
{
    constexpr std::uint64_t mib = 1024 * 1024;

    write_file(path, {});
    fs::resize_file(path, total);

    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    for (std::uint64_t offset : {std::uint64_t(0), total / 2}) {
        auto length = static_cast<std::size_t>(std::min(mib, total - offset));
        auto data   = pattern(offset, length);
        file.seekp(static_cast<std::streamoff>(offset));
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    if (!file)
        throw std::runtime_error("cannot write " + path.string());
}

std::shared_ptr<spdlog::logger> null_logger()
{
    auto logger = std::make_shared<spdlog::logger>(
        "mediastream.test", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::trace);
    return logger;
}

std::uint64_t string_readable::size(boost::system::error_code& ec) const
{
    ec = {};
    return content_.size();
}

std::size_t string_readable::read_at(std::uint64_t offset,
                                     void* buffer,
                                     std::size_t n,
                                     boost::system::error_code& ec)
{
    ec = {};
    ++reads;
    if (offset >= content_.size())
        return 0;
    auto count = std::min<std::size_t>(n, content_.size() - static_cast<std::size_t>(offset));
    std::memcpy(buffer, content_.data() + offset, count);
    return count;
}

std::size_t truncated_readable::read_at(std::uint64_t offset,
                                        void* buffer,
                                        std::size_t n,
                                        boost::system::error_code& ec)
{
    return string_readable::read_at(offset, buffer, std::min(n, limit_), ec);
}

} // namespace mediastream::test
