#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediastream {

/// Parts of a parsed `multipart/form-data` body, in the order they were sent.
class form_data
{
public:
    struct field
    {
        std::string name;

        /// Set only for file parts.
        std::string filename;
        std::string content_type;
        std::string content;

        bool has_data() const { return !content.empty(); }
        bool is_file() const { return !filename.empty(); }
    };

    std::vector<field> fields;
    std::string boundary;

    /// The first part named `field_name`, or null.
    const field* field_by_name(std::string_view field_name) const;

    /// The first file part named `field_name`. Plain parts with that name are skipped.
    const field* file_by_name(std::string_view field_name) const;

    /// Content of the first part named `field_name`; empty when that part has no data.
    std::optional<std::string> content(std::string_view field_name) const;
};

} // namespace mediastream
