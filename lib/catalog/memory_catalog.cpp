#include "mediastream/catalog/memory_catalog.hpp"
#include "mediastream/error.hpp"
#include <algorithm>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <fstream>
#include <iterator>
#include <mutex>

namespace mediastream::catalog {

namespace detail {

static json::object to_snapshot(const media_record& record)
{
    using namespace std::chrono;

    json::object obj;
    obj["id"]    = record.id;
    obj["title"] = record.title;
    if (record.description)
        obj["description"] = *record.description;
    obj["fileName"]       = record.file_name;
    obj["storedFileName"] = record.stored_file_name;
    obj["contentType"]    = record.content_type;
    obj["fileSize"]       = record.file_size;
    obj["createdAt"] =
        duration_cast<milliseconds>(record.created_at.time_since_epoch()).count();
    return obj;
}

static bool read_string(const json::object& obj, std::string_view key, std::string& out)
{
    auto value = obj.if_contains(key);
    if (!value || !value->is_string())
        return false;
    out = value->get_string().c_str();
    return true;
}

static bool read_uint(const json::object& obj, std::string_view key, std::uint64_t& out)
{
    auto value = obj.if_contains(key);
    if (!value)
        return false;
    if (value->is_uint64()) {
        out = value->get_uint64();
        return true;
    }
    if (value->is_int64() && value->get_int64() >= 0) {
        out = static_cast<std::uint64_t>(value->get_int64());
        return true;
    }
    return false;
}

static std::optional<media_record> from_snapshot(const json::value& value)
{
    auto obj = value.if_object();
    if (!obj)
        return std::nullopt;

    media_record record;
    std::uint64_t created_at = 0;
    if (!read_uint(*obj, "id", record.id) || !read_string(*obj, "title", record.title) ||
        !read_string(*obj, "fileName", record.file_name) ||
        !read_string(*obj, "storedFileName", record.stored_file_name) ||
        !read_string(*obj, "contentType", record.content_type) ||
        !read_uint(*obj, "fileSize", record.file_size) ||
        !read_uint(*obj, "createdAt", created_at))
        return std::nullopt;

    std::string description;
    if (read_string(*obj, "description", description))
        record.description = std::move(description);

    record.created_at =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(created_at));
    return record;
}

} // namespace detail

memory_catalog::memory_catalog(fs::path snapshot_file /*= {}*/)
    : snapshot_file_(std::move(snapshot_file))
{
}

void memory_catalog::load(boost::system::error_code& ec)
{
    ec = {};
    if (snapshot_file_.empty())
        return;

    std::error_code fs_ec;
    if (!fs::exists(snapshot_file_, fs_ec))
        return;

    std::ifstream file(snapshot_file_, std::ios::binary);
    if (!file) {
        ec = error::storage_failure;
        return;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto doc = json::parse(content, ec);
    if (ec)
        return;

    auto root = doc.if_object();
    if (!root) {
        ec = error::storage_failure;
        return;
    }

    std::map<std::uint64_t, media_record> records;
    std::uint64_t next_id = 1;

    if (auto list = root->if_contains("records"); list && list->is_array()) {
        for (const auto& item : list->get_array()) {
            auto record = detail::from_snapshot(item);
            if (!record) {
                ec = error::storage_failure;
                return;
            }
            next_id = std::max(next_id, record->id + 1);
            records.emplace(record->id, std::move(*record));
        }
    }
    std::uint64_t saved_next_id = 0;
    if (detail::read_uint(*root, "nextId", saved_next_id))
        next_id = std::max(next_id, saved_next_id);

    std::unique_lock lck(mutex_);
    records_ = std::move(records);
    next_id_ = next_id;
}

catalog_entry memory_catalog::lookup(std::uint64_t id, boost::system::error_code& ec) const
{
    auto record = get(id, ec);
    if (ec)
        return {};
    return {std::move(record.stored_file_name), std::move(record.content_type)};
}

media_record memory_catalog::get(std::uint64_t id, boost::system::error_code& ec) const
{
    ec = {};

    std::shared_lock lck(mutex_);
    auto iter = records_.find(id);
    if (iter == records_.end()) {
        ec = error::resource_not_found;
        return {};
    }
    return iter->second;
}

std::vector<media_record> memory_catalog::list() const
{
    std::vector<media_record> result;
    {
        std::shared_lock lck(mutex_);
        result.reserve(records_.size());
        for (const auto& [id, record] : records_)
            result.push_back(record);
    }
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.created_at != rhs.created_at)
            return lhs.created_at > rhs.created_at;
        return lhs.id > rhs.id;
    });
    return result;
}

media_record memory_catalog::create(media_record draft, boost::system::error_code& ec)
{
    ec = {};

    std::unique_lock lck(mutex_);
    draft.id         = next_id_;
    draft.created_at = std::chrono::system_clock::now();

    auto [iter, inserted] = records_.emplace(draft.id, draft);
    ++next_id_;

    save(ec);
    if (ec) {
        records_.erase(iter);
        --next_id_;
        return {};
    }
    return draft;
}

std::size_t memory_catalog::size() const
{
    std::shared_lock lck(mutex_);
    return records_.size();
}

void memory_catalog::save(boost::system::error_code& ec) const
{
    ec = {};
    if (snapshot_file_.empty())
        return;

    json::array list;
    for (const auto& [id, record] : records_)
        list.push_back(detail::to_snapshot(record));

    json::object root;
    root["nextId"]  = next_id_;
    root["records"] = std::move(list);

    auto temp_file = snapshot_file_;
    temp_file += ".tmp";

    std::error_code fs_ec;
    {
        std::ofstream file(temp_file, std::ios::binary | std::ios::trunc);
        file << json::serialize(root);
        if (!file) {
            fs::remove(temp_file, fs_ec);
            ec = error::storage_failure;
            return;
        }
    }
    fs::rename(temp_file, snapshot_file_, fs_ec);
    if (fs_ec) {
        fs::remove(temp_file, fs_ec);
        ec = error::storage_failure;
    }
}

} // namespace mediastream::catalog
