#pragma once
#include "mediastream/config.hpp"
#include <boost/json/object.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mediastream::catalog {

struct media_record
{
    std::uint64_t id = 0;
    std::string title;
    std::optional<std::string> description;

    /// Name of the file as uploaded by the client.
    std::string file_name;

    /// Blob id under which the content is kept in the blob store.
    std::string stored_file_name;

    std::string content_type;
    std::uint64_t file_size = 0;
    std::chrono::system_clock::time_point created_at;
};

/// Public representation, without the blob id.
json::object to_json(const media_record& record);

/// `YYYY-MM-DDTHH:MM:SS` in local time.
std::string format_created_at(const std::chrono::system_clock::time_point& tp);

} // namespace mediastream::catalog
