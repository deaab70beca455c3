#include "mediastream/body/form_data_body.hpp"
#include <boost/beast/http/error.hpp>
#include <catch2/catch.hpp>

using namespace mediastream;

namespace {

const std::string boundary = "----mediastreamBoundary7MA4YWxk";

// Binary file content with a CRLF and a dash line that must not end the part.
const std::string file_content("\x00\x01\r\n--not-the-boundary\r\n\xff", 25);

std::string make_body()
{
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"title\"\r\n\r\n";
    body += "My clip\r\n";
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"clip.mp4\"\r\n";
    body += "Content-Type: video/mp4\r\n\r\n";
    body += file_content;
    body += "\r\n--" + boundary + "--\r\n";
    return body;
}

// Feeds `body` in pieces of `chunk` bytes, keeping unconsumed bytes the way the parser does.
beast::error_code parse(std::string_view content_type,
                        std::string_view body,
                        std::size_t chunk,
                        form_data& out)
{
    http::fields fields;
    fields.set(http::field::content_type, std::string(content_type));

    body::form_data_body::reader reader(fields, out);

    beast::error_code ec;
    reader.init(boost::optional<std::uint64_t>(body.size()), ec);
    if (ec)
        return ec;

    std::string pending;
    std::size_t offset = 0;
    while (offset < body.size()) {
        auto n = std::min(chunk, body.size() - offset);
        pending.append(body.substr(offset, n));
        offset += n;

        while (!pending.empty()) {
            auto used = reader.put(net::buffer(pending), ec);
            pending.erase(0, used);
            if (ec == http::error::need_more) {
                ec = {};
                break;
            }
            if (ec)
                return ec;
        }
    }
    if (!pending.empty())
        return http::error::partial_message;

    reader.finish(ec);
    return ec;
}

} // namespace

TEST_CASE("Multipart form data body", "[body][form_data]")
{
    const auto body = make_body();
    form_data form;

    SECTION("parts are parsed for any read size")
    {
        auto chunk = GENERATE(std::size_t(1), std::size_t(7), std::size_t(64), std::size_t(4096));
        INFO("chunk size " << chunk);

        auto ec = parse("multipart/form-data; boundary=" + boundary, body, chunk, form);
        REQUIRE_FALSE(ec);
        CHECK(form.boundary == boundary);
        REQUIRE(form.fields.size() == 2);

        CHECK(form.content("title") == std::optional<std::string>("My clip"));

        const auto* file = form.field_by_name("file");
        REQUIRE(file != nullptr);
        CHECK(file->is_file());
        CHECK(file->filename == "clip.mp4");
        CHECK(file->content_type == "video/mp4");
        CHECK(file->content == file_content);
    }

    SECTION("quoted boundary")
    {
        auto ec = parse("multipart/form-data; boundary=\"" + boundary + "\"", body, 4096, form);
        REQUIRE_FALSE(ec);
        CHECK(form.fields.size() == 2);
    }

    SECTION("missing boundary")
    {
        auto ec = parse("multipart/form-data", body, 4096, form);
        CHECK(ec == http::error::bad_field);
    }

    SECTION("wrong boundary")
    {
        auto ec = parse("multipart/form-data; boundary=other", body, 4096, form);
        CHECK(ec == http::error::unexpected_body);
    }

    SECTION("truncated body")
    {
        auto ec = parse("multipart/form-data; boundary=" + boundary,
                        std::string_view(body).substr(0, body.size() / 2),
                        4096,
                        form);
        CHECK(ec);
    }

    SECTION("empty field has no data")
    {
        std::string empty_part = "--" + boundary + "\r\n" +
                                 "Content-Disposition: form-data; name=\"description\"\r\n\r\n" +
                                 "\r\n--" + boundary + "--\r\n";
        auto ec = parse("multipart/form-data; boundary=" + boundary, empty_part, 3, form);
        REQUIRE_FALSE(ec);
        REQUIRE(form.fields.size() == 1);
        CHECK_FALSE(form.fields[0].has_data());
        CHECK_FALSE(form.content("description").has_value());
    }
}
