#include "mediastream/catalog/media_record.hpp"
#include <boost/json/value.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace mediastream::catalog {

std::string format_created_at(const std::chrono::system_clock::time_point& tp)
{
    auto tm = fmt::localtime(std::chrono::system_clock::to_time_t(tp));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", tm);
}

json::object to_json(const media_record& record)
{
    json::object obj;
    obj["id"]    = record.id;
    obj["title"] = record.title;
    if (record.description)
        obj["description"] = *record.description;
    else
        obj["description"] = nullptr;
    obj["fileName"]    = record.file_name;
    obj["fileSize"]    = record.file_size;
    obj["contentType"] = record.content_type;
    obj["createdAt"]   = format_created_at(record.created_at);
    return obj;
}

} // namespace mediastream::catalog
