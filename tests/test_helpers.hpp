#pragma once
#include "mediastream/config.hpp"
#include "mediastream/storage/blob_store.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mediastream::test {

/// A fresh directory removed again on destruction.
class temp_dir
{
public:
    temp_dir();
    ~temp_dir();

    temp_dir(const temp_dir&)            = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

/// Deterministic content: byte `i` of a pattern blob.
char pattern_byte(std::uint64_t offset);
std::string pattern(std::uint64_t offset, std::size_t length);

void write_file(const fs::path& path, std::string_view content);
std::string read_file(const fs::path& path, std::uint64_t offset, std::size_t length);

/**
 * A sparse file of `total` bytes with pattern content in the first and in the middle
 * MiB, zeros elsewhere.
 */
void make_large_file(const fs::path& path, std::uint64_t total);

/// A logger that drops everything, with every level enabled.
std::shared_ptr<spdlog::logger> null_logger();

/// In-memory blob content.
class string_readable : public storage::seekable_readable
{
public:
    explicit string_readable(std::string content)
        : content_(std::move(content))
    {
    }

    std::uint64_t size(boost::system::error_code& ec) const override;
    std::size_t read_at(std::uint64_t offset,
                        void* buffer,
                        std::size_t n,
                        boost::system::error_code& ec) override;

    int reads = 0;

protected:
    std::string content_;
};

/// Claims a length but returns at most `limit` bytes per read.
class truncated_readable : public string_readable
{
public:
    truncated_readable(std::string content, std::size_t limit)
        : string_readable(std::move(content))
        , limit_(limit)
    {
    }

    std::size_t read_at(std::uint64_t offset,
                        void* buffer,
                        std::size_t n,
                        boost::system::error_code& ec) override;

private:
    std::size_t limit_;
};

} // namespace mediastream::test
