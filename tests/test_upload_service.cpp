#include "mediastream/catalog/memory_catalog.hpp"
#include "mediastream/error.hpp"
#include "mediastream/service/upload_service.hpp"
#include "mediastream/storage/fs_blob_store.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace mediastream;

namespace {

form_data make_form(std::string filename, std::string content_type, std::string content)
{
    form_data form;
    form.fields.push_back({"title", "", "", "Holiday"});
    form.fields.push_back({"description", "", "", "Beach footage"});
    form.fields.push_back(
        {"file", std::move(filename), std::move(content_type), std::move(content)});
    return form;
}

} // namespace

TEST_CASE("Uploading media", "[service][upload]")
{
    test::temp_dir dir;
    storage::fs_blob_store store(dir.path());
    catalog::memory_catalog catalog;

    service::upload_service uploader(store,
                                     catalog,
                                     {"video/mp4", "video/webm", "video/quicktime"},
                                     test::null_logger());
    boost::system::error_code ec;

    SECTION("an accepted upload is stored and recorded")
    {
        const auto content = test::pattern(0, 5000);
        auto record        = uploader.upload(make_form("holiday.mp4", "video/mp4", content), ec);
        REQUIRE_FALSE(ec);

        CHECK(record.id == 1);
        CHECK(record.title == "Holiday");
        CHECK(record.description == std::optional<std::string>("Beach footage"));
        CHECK(record.file_name == "holiday.mp4");
        CHECK(record.content_type == "video/mp4");
        CHECK(record.file_size == 5000);
        CHECK(record.stored_file_name != "holiday.mp4");
        CHECK(record.stored_file_name.ends_with(".mp4"));

        CHECK(test::read_file(store.root() / record.stored_file_name, 0, 10000) == content);
        CHECK(catalog.size() == 1);
    }

    SECTION("the client file name never reaches the file system")
    {
        auto record = uploader.upload(make_form("../../escape.mp4", "video/mp4", "data"), ec);
        REQUIRE_FALSE(ec);
        CHECK(record.file_name == "../../escape.mp4");
        CHECK(fs::exists(store.root() / record.stored_file_name));
        CHECK_FALSE(fs::exists(dir.path().parent_path().parent_path() / "escape.mp4"));
    }

    SECTION("a type outside the allow-list is refused")
    {
        uploader.upload(make_form("notes.txt", "text/plain", "hello"), ec);
        CHECK(ec == error::unsupported_media_type);
        CHECK(catalog.size() == 0);
        CHECK(fs::is_empty(store.root()));
        CHECK(uploader.unsupported_type_message() ==
              "Invalid file type. Allowed types: mp4, webm, mov");
    }

    SECTION("a missing title is refused")
    {
        auto form = make_form("clip.mp4", "video/mp4", "data");
        form.fields[0].content.clear();
        uploader.upload(form, ec);
        CHECK(ec == error::missing_field);
    }

    SECTION("a missing file part is refused")
    {
        auto form = make_form("clip.mp4", "video/mp4", "data");
        form.fields.pop_back();
        uploader.upload(form, ec);
        CHECK(ec == error::missing_field);

        // a plain field named "file" is not a file
        form.fields.push_back({"file", "", "", "text"});
        uploader.upload(form, ec);
        CHECK(ec == error::missing_field);
    }

    SECTION("the description is optional")
    {
        auto form = make_form("clip.webm", "video/webm", "data");
        form.fields.erase(form.fields.begin() + 1);
        auto record = uploader.upload(form, ec);
        REQUIRE_FALSE(ec);
        CHECK_FALSE(record.description.has_value());
    }
}

TEST_CASE("Stored blob names", "[service][upload]")
{
    auto first  = service::upload_service::make_stored_name("movie.final.mov");
    auto second = service::upload_service::make_stored_name("movie.final.mov");
    CHECK(first != second);
    CHECK(first.ends_with(".mov"));
    CHECK(first.size() == 36 + 4);

    CHECK(service::upload_service::make_stored_name("noext").size() == 36);
}
