#pragma once
#include "mediastream/catalog/catalog.hpp"
#include "mediastream/config.hpp"
#include "mediastream/form_data.hpp"
#include "mediastream/storage/blob_store.hpp"
#include <boost/system/error_code.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mediastream::service {

/// Stores uploaded media in the blob store and records it in the catalog.
class upload_service
{
public:
    upload_service(storage::blob_store& store,
                   catalog::catalog& catalog,
                   std::vector<std::string> allowed_media_types,
                   std::shared_ptr<spdlog::logger> logger);

    /**
     * Ingest a `multipart/form-data` upload with the parts `file`, `title` and optionally
     * `description`.
     *
     * Sets `ec` to `error::missing_field` without a file part or title,
     * `error::unsupported_media_type` when the file's type is not allowed and
     * `error::storage_failure` when the blob or the record cannot be written.
     */
    catalog::media_record upload(const form_data& form, boost::system::error_code& ec);

    /// The text reported for `error::unsupported_media_type`.
    const std::string& unsupported_type_message() const { return unsupported_type_message_; }

    bool is_allowed(std::string_view media_type) const;

    /// A fresh random blob name keeping the extension of `original_name`.
    static std::string make_stored_name(std::string_view original_name);

private:
    storage::blob_store& store_;
    catalog::catalog& catalog_;
    std::vector<std::string> allowed_media_types_;
    std::string unsupported_type_message_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mediastream::service
