#include "mediastream/form_data.hpp"
#include <algorithm>

namespace mediastream {

const form_data::field* form_data::field_by_name(std::string_view field_name) const
{
    auto iter =
        std::ranges::find_if(fields, [&](const field& f) { return f.name == field_name; });
    return iter == fields.end() ? nullptr : &*iter;
}

const form_data::field* form_data::file_by_name(std::string_view field_name) const
{
    auto iter = std::ranges::find_if(
        fields, [&](const field& f) { return f.is_file() && f.name == field_name; });
    return iter == fields.end() ? nullptr : &*iter;
}

std::optional<std::string> form_data::content(std::string_view field_name) const
{
    const auto* part = field_by_name(field_name);
    if (!part || !part->has_data())
        return std::nullopt;
    return part->content;
}

} // namespace mediastream
