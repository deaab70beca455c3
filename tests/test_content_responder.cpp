#include "mediastream/error.hpp"
#include "mediastream/range/content_responder.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace mediastream;
using namespace mediastream::range;

TEST_CASE("Responding to a resolved range", "[range][responder]")
{
    const auto content = test::pattern(0, 10000);
    auto reader        = std::make_shared<test::string_readable>(content);
    const content_descriptor desc {content.size(), "video/mp4"};

    boost::system::error_code ec;

    SECTION("partial response carries exactly the requested bytes")
    {
        auto resp = respond(desc, byte_range {100, 1099}, reader, ec);
        REQUIRE_FALSE(ec);
        CHECK(resp.status == stream_status::partial);
        CHECK(resp.media_type == "video/mp4");
        CHECK(resp.content_length == 1000);
        REQUIRE(resp.range.has_value());
        CHECK(*resp.range == content_range {100, 1099, 10000});

        const auto* data = std::get_if<std::string>(&resp.payload);
        REQUIRE(data != nullptr);
        CHECK(*data == content.substr(100, 1000));
        CHECK(reader->reads == 1);
    }

    SECTION("single byte at the end")
    {
        auto resp = respond(desc, byte_range {9999, 9999}, reader, ec);
        REQUIRE_FALSE(ec);
        CHECK(std::get<std::string>(resp.payload) == content.substr(9999));
    }

    SECTION("full response defers reading to the body writer")
    {
        auto resp = respond(desc, std::nullopt, reader, ec);
        REQUIRE_FALSE(ec);
        CHECK(resp.status == stream_status::full);
        CHECK(resp.content_length == 10000);
        CHECK_FALSE(resp.range.has_value());
        CHECK(reader->reads == 0);

        const auto* source = std::get_if<blob_source>(&resp.payload);
        REQUIRE(source != nullptr);
        CHECK(source->offset == 0);
        CHECK(source->length == 10000);
        CHECK(source->reader == reader);
    }

    SECTION("storage returning fewer bytes is an incomplete read")
    {
        auto short_reader = std::make_shared<test::truncated_readable>(content, 64);
        respond(desc, byte_range {0, 999}, short_reader, ec);
        CHECK(ec == error::incomplete_read);
    }

    SECTION("range beyond the descriptor length is rejected")
    {
        respond(desc, byte_range {0, 10000}, reader, ec);
        CHECK(ec == error::range_not_satisfiable);
        CHECK(reader->reads == 0);
    }
}
