#include "mediastream/body/form_data_body.hpp"
#include "mediastream/util/misc.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/beast/http/error.hpp>
#include <cctype>
#include <string_view>
#include <utility>
#include <vector>

namespace mediastream::body {
using namespace std::string_view_literals;

namespace detail {
using header_pairs = std::vector<std::pair<std::string_view, std::string_view>>;

// `name="file"; filename="a.mp4"` into key/value pairs, honouring quoted values.
static header_pairs parse_content_disposition(std::string_view header)
{
    header_pairs results;

    size_t pos = 0;
    while (pos < header.size()) {
        size_t eq = header.find('=', pos);
        if (eq == std::string_view::npos)
            break;

        std::string_view key = boost::trim_copy(header.substr(pos, eq - pos));
        pos                  = eq + 1;

        std::string_view value;
        if (pos < header.size() && header[pos] == '"') {
            pos++;
            size_t end  = pos;
            bool escape = false;
            while (end < header.size()) {
                if (header[end] == '\\' && !escape)
                    escape = true;
                else if (header[end] == '"' && !escape)
                    break;
                else
                    escape = false;
                end++;
            }
            value = header.substr(pos, end - pos);
            pos   = (end < header.size()) ? end + 1 : end;
        }
        else {
            size_t end = header.find(';', pos);
            if (end == std::string_view::npos)
                end = header.size();
            value = boost::trim_copy(header.substr(pos, end - pos));
            pos   = end;
        }

        results.emplace_back(key, value);

        if (pos < header.size() && header[pos] == ';')
            pos++;
        while (pos < header.size() && std::isspace(static_cast<unsigned char>(header[pos])))
            pos++;
    }
    return results;
}

static header_pairs split_part_header(std::string_view header, beast::error_code& ec)
{
    header_pairs results;
    for (const auto& line : util::split(header, "\r\n"sv)) {
        if (line.empty())
            continue;

        auto pos = line.find(':');
        if (pos == std::string_view::npos) {
            ec = http::error::unexpected_body;
            return {};
        }
        results.emplace_back(boost::trim_copy(line.substr(0, pos)),
                             boost::trim_copy(line.substr(pos + 1)));
    }
    return results;
}

} // namespace detail

form_data_body::reader::reader(http::fields const& h, value_type& b)
    : body_(b)
    , content_type_(util::to_std_view(h[http::field::content_type]))
{
}

void form_data_body::reader::init(boost::optional<std::uint64_t> const&, beast::error_code& ec)
{
    ec = {};

    for (const auto& part : util::split(content_type_, ";"sv)) {
        if (!boost::istarts_with(part, "boundary"))
            continue;

        auto eq = part.find('=');
        if (eq == std::string_view::npos)
            continue;

        auto boundary = boost::trim_copy(part.substr(eq + 1));
        if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"')
            boundary = boundary.substr(1, boundary.size() - 2);
        body_.boundary = std::string(boundary);
    }
    if (body_.boundary.empty()) {
        ec = http::error::bad_field;
        return;
    }
    delimiter_ = "--" + body_.boundary;
}

std::size_t form_data_body::reader::put(const_buffers_type const& buffer, beast::error_code& ec)
{
    ec        = {};
    auto data = util::buffer_to_string_view(buffer);

    switch (step_) {
        case step::boundary_line: return parse_boundary_line(data, ec);
        case step::part_header: return parse_part_header(data, ec);
        case step::part_content: return parse_part_content(data, ec);
        case step::closing_crlf:
            if (data == "\r"sv) {
                ec = http::error::need_more;
                return 0;
            }
            step_ = step::eof;
            return data.starts_with("\r\n"sv) ? 2 : data.size();
        case step::eof:
            // Epilogue is ignored.
            return data.size();
    }
    ec = http::error::unexpected_body;
    return 0;
}

std::size_t form_data_body::reader::parse_boundary_line(std::string_view data,
                                                        beast::error_code& ec)
{
    if (data.size() < delimiter_.size() + 2) {
        ec = http::error::need_more;
        return 0;
    }
    if (!data.starts_with(delimiter_)) {
        ec = http::error::unexpected_body;
        return 0;
    }
    auto tail = data.substr(delimiter_.size(), 2);
    if (tail == "\r\n"sv) {
        step_ = step::part_header;
        return delimiter_.size() + 2;
    }
    if (tail == "--"sv) {
        step_ = step::closing_crlf;
        return delimiter_.size() + 2;
    }
    ec = http::error::unexpected_body;
    return 0;
}

std::size_t form_data_body::reader::parse_part_header(std::string_view data, beast::error_code& ec)
{
    auto pos = data.find("\r\n\r\n"sv);
    if (pos == std::string_view::npos) {
        ec = http::error::need_more;
        return 0;
    }
    auto header = data.substr(0, pos + 4);
    auto pairs  = detail::split_part_header(header, ec);
    if (ec)
        return 0;

    form_data::field field;
    for (const auto& [name, value] : pairs) {
        if (boost::iequals(name, "Content-Disposition"sv)) {
            auto semi = value.find(';');
            if (semi == std::string_view::npos ||
                boost::trim_copy(value.substr(0, semi)) != "form-data"sv)
            {
                ec = http::error::unexpected_body;
                return 0;
            }
            for (const auto& [key, item] : detail::parse_content_disposition(value.substr(semi + 1))) {
                if (key == "name"sv)
                    field.name = item;
                else if (key == "filename"sv)
                    field.filename = item;
            }
        }
        else if (boost::iequals(name, "Content-Type"sv)) {
            field.content_type = value;
        }
    }

    field_ = std::move(field);
    step_  = step::part_content;
    return header.size();
}

std::size_t form_data_body::reader::parse_part_content(std::string_view data,
                                                       beast::error_code& ec)
{
    // Content ends at CRLF followed by the delimiter.
    const auto marker_size = delimiter_.size() + 2;

    auto pos = data.find(delimiter_);
    while (pos != std::string_view::npos && (pos < 2 || data.substr(pos - 2, 2) != "\r\n"sv))
        pos = data.find(delimiter_, pos + 1);

    if (pos != std::string_view::npos) {
        field_.content.append(data.substr(0, pos - 2));
        body_.fields.push_back(std::move(field_));
        field_ = {};
        step_  = step::boundary_line;
        return pos;
    }

    // Keep back enough bytes to recognise a marker split across reads.
    if (data.size() < marker_size) {
        ec = http::error::need_more;
        return 0;
    }
    const auto consumable = data.size() - (marker_size - 1);
    field_.content.append(data.substr(0, consumable));
    return consumable;
}

void form_data_body::reader::finish(beast::error_code& ec)
{
    ec = {};
    if (step_ != step::eof && step_ != step::closing_crlf)
        ec = http::error::partial_message;
}

} // namespace mediastream::body
