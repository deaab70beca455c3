#pragma once
#include "mediastream/config.hpp"
#include "mediastream/form_data.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <string>

namespace mediastream::body {

/// Parses a `multipart/form-data` request body. There is no writer.
class form_data_body
{
public:
    using value_type = form_data;

    class reader
    {
    public:
        using const_buffers_type = net::const_buffer;

        reader(http::fields const& h, value_type& b);

        void init(boost::optional<std::uint64_t> const& content_length,
                  beast::error_code& ec);
        std::size_t put(const_buffers_type const& buffer, beast::error_code& ec);
        void finish(beast::error_code& ec);

    private:
        std::size_t parse_boundary_line(std::string_view data, beast::error_code& ec);
        std::size_t parse_part_header(std::string_view data, beast::error_code& ec);
        std::size_t parse_part_content(std::string_view data, beast::error_code& ec);

        value_type& body_;
        std::string content_type_;
        std::string delimiter_;

        enum class step
        {
            boundary_line,
            part_header,
            part_content,
            closing_crlf,
            eof
        };
        step step_ = step::boundary_line;
        form_data::field field_;
    };
};

} // namespace mediastream::body
