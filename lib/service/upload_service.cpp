#include "mediastream/service/upload_service.hpp"
#include "mediastream/error.hpp"
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

namespace mediastream::service {

namespace detail {

// "video/quicktime" is listed as "mov", other types by their subtype.
static std::string short_type_name(std::string_view media_type)
{
    auto slash   = media_type.find('/');
    auto subtype = slash == std::string_view::npos ? media_type : media_type.substr(slash + 1);
    if (subtype == "quicktime")
        return "mov";
    return std::string(subtype);
}

} // namespace detail

upload_service::upload_service(storage::blob_store& store,
                               catalog::catalog& catalog,
                               std::vector<std::string> allowed_media_types,
                               std::shared_ptr<spdlog::logger> logger)
    : store_(store)
    , catalog_(catalog)
    , allowed_media_types_(std::move(allowed_media_types))
    , logger_(std::move(logger))
{
    std::vector<std::string> names;
    for (const auto& type : allowed_media_types_)
        names.push_back(detail::short_type_name(type));

    unsupported_type_message_ =
        "Invalid file type. Allowed types: " + boost::algorithm::join(names, ", ");
}

bool upload_service::is_allowed(std::string_view media_type) const
{
    return std::ranges::find(allowed_media_types_, media_type) != allowed_media_types_.end();
}

std::string upload_service::make_stored_name(std::string_view original_name)
{
    std::string_view extension;
    if (auto dot = original_name.rfind('.'); dot != std::string_view::npos)
        extension = original_name.substr(dot);

    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator()) + std::string(extension);
}

catalog::media_record upload_service::upload(const form_data& form, boost::system::error_code& ec)
{
    ec = {};

    const auto* file = form.file_by_name("file");
    auto title       = form.content("title");
    if (!file || !title) {
        ec = error::missing_field;
        return {};
    }
    if (!is_allowed(file->content_type)) {
        logger_->warn("upload of '{}' refused, type '{}'", file->filename, file->content_type);
        ec = error::unsupported_media_type;
        return {};
    }

    catalog::media_record draft;
    draft.title            = std::move(*title);
    draft.description      = form.content("description");
    draft.file_name        = file->filename;
    draft.stored_file_name = make_stored_name(file->filename);
    draft.content_type     = file->content_type;
    draft.file_size        = file->content.size();

    store_.store(draft.stored_file_name, file->content, ec);
    if (ec) {
        logger_->error("storing '{}' failed: {}", draft.stored_file_name, ec.message());
        ec = error::storage_failure;
        return {};
    }

    auto stored_name = draft.stored_file_name;
    auto record      = catalog_.create(std::move(draft), ec);
    if (ec) {
        logger_->error("recording upload '{}' failed: {}", stored_name, ec.message());
        return {};
    }
    logger_->info("stored '{}' as {} ({} bytes)", record.file_name, record.id, record.file_size);
    return record;
}

} // namespace mediastream::service
