#pragma once
#include "mediastream/body/any_body.hpp"
#include "mediastream/config.hpp"
#include "mediastream/range/content_responder.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/json/value.hpp>
#include <string>
#include <string_view>

namespace mediastream::server {

class response : public http::response<body::any_body>
{
public:
    response(unsigned int version, bool keep_alive);

    void set_empty_content(http::status status);

    /// A small HTML page naming the status.
    void set_error_content(http::status status);

    void set_string_content(std::string_view data,
                            std::string_view content_type,
                            http::status status = http::status::ok)
    {
        set_string_content(std::string(data), content_type, status);
    }
    void set_string_content(std::string&& data,
                            std::string_view content_type,
                            http::status status = http::status::ok);

    void set_json_content(const json::value& data, http::status status = http::status::ok)
    {
        set_json_content(json::value(data), status);
    }
    void set_json_content(json::value&& data, http::status status = http::status::ok);

    /// 200 or 206 with the framing headers of `stream`; the payload becomes the body.
    void set_stream_content(range::stream_response&& stream);

    /// 416 without a body and with `Content-Range: bytes */<total_length>`.
    void set_range_not_satisfiable(std::uint64_t total_length);
};

} // namespace mediastream::server
