#include "mediastream/catalog/memory_catalog.hpp"
#include "mediastream/server/router.hpp"
#include "mediastream/server/server.hpp"
#include "mediastream/service/media_service.hpp"
#include "mediastream/storage/fs_blob_store.hpp"
#include "test_helpers.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/json/parse.hpp>
#include <catch2/catch.hpp>
#include <thread>

using namespace mediastream;

namespace {

constexpr std::uint64_t sample_size = 300000;
constexpr std::uint64_t window_size = 64 * 1024;

const std::string boundary = "mediastreamTestBoundary";

setting make_setting(const fs::path& upload_dir)
{
    setting conf;
    conf.upload_dir      = upload_dir;
    conf.window_size     = window_size;
    conf.max_upload_size = 1024 * 1024;
    return conf;
}

std::string multipart_part(std::string_view name,
                           std::string_view content,
                           std::string_view filename     = {},
                           std::string_view content_type = {})
{
    std::string part = "--" + boundary + "\r\n";
    part += "Content-Disposition: form-data; name=\"" + std::string(name) + "\"";
    if (!filename.empty())
        part += "; filename=\"" + std::string(filename) + "\"";
    part += "\r\n";
    if (!content_type.empty())
        part += "Content-Type: " + std::string(content_type) + "\r\n";
    part += "\r\n";
    part += content;
    part += "\r\n";
    return part;
}

// A server on an ephemeral loopback port with one stored sample video.
class server_fixture
{
public:
    server_fixture()
        : store_(dir_.path() / "uploads")
        , conf_(make_setting(store_.root()))
        , server_(ioc_)
        , api_(catalog_, store_, conf_, test::null_logger())
    {
        sample_ = test::pattern(0, sample_size);

        boost::system::error_code ec;
        store_.store("sample.mp4", sample_, ec);
        REQUIRE_FALSE(ec);

        catalog::media_record draft;
        draft.title            = "sample";
        draft.file_name        = "sample.mp4";
        draft.stored_file_name = "sample.mp4";
        draft.content_type     = "video/mp4";
        draft.file_size        = sample_size;
        sample_id_             = catalog_.create(draft, ec).id;
        REQUIRE_FALSE(ec);

        server_.set_logger(test::null_logger());
        server::connection_limits limits;
        limits.body_limit = conf_.max_upload_size;
        server_.set_limits(limits);
        api_.register_routes(server_.router());
        server_.listen("127.0.0.1", 0);
        server_.async_run();

        endpoint_ = server_.local_endpoint();
        thread_   = std::thread([this]() { ioc_.run(); });
    }

    ~server_fixture()
    {
        // closing the acceptor and the sessions leaves the context without work
        server_.stop();
        thread_.join();
    }

    http::response<http::string_body> send(http::request<http::string_body> req)
    {
        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(endpoint_);

        req.version(11);
        req.set(http::field::host, "127.0.0.1");
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(64 * 1024 * 1024);
        if (req.method() == http::verb::head)
            parser.skip(true);
        http::read(stream, buffer, parser);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return parser.release();
    }

    http::response<http::string_body> get(std::string target,
                                          std::optional<std::string> range = std::nullopt,
                                          http::verb method                = http::verb::get)
    {
        http::request<http::string_body> req(method, target, 11);
        if (range)
            req.set(http::field::range, *range);
        return send(std::move(req));
    }

    http::response<http::string_body> upload(std::string body)
    {
        http::request<http::string_body> req(http::verb::post, "/api/videos", 11);
        req.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
        req.body() = std::move(body);
        return send(std::move(req));
    }

    std::string stream_target(std::uint64_t id) const
    {
        return "/api/videos/" + std::to_string(id) + "/stream";
    }

protected:
    test::temp_dir dir_;
    storage::fs_blob_store store_;
    catalog::memory_catalog catalog_;
    setting conf_;

    net::io_context ioc_;
    server::http_server server_;
    service::media_service api_;
    std::thread thread_;

    tcp::endpoint endpoint_;
    std::string sample_;
    std::uint64_t sample_id_ = 0;
};

} // namespace

TEST_CASE_METHOD(server_fixture, "Streaming over HTTP", "[http]")
{
    SECTION("whole video without a Range header")
    {
        auto resp = get(stream_target(sample_id_));
        CHECK(resp.result() == http::status::ok);
        CHECK(resp[http::field::content_type] == "video/mp4");
        CHECK(resp[http::field::accept_ranges] == "bytes");
        CHECK(resp[http::field::content_length] == std::to_string(sample_size));
        CHECK(resp.find(http::field::content_range) == resp.end());
        CHECK(resp.body() == sample_);
    }

    SECTION("closed range")
    {
        auto resp = get(stream_target(sample_id_), "bytes=0-1023");
        CHECK(resp.result() == http::status::partial_content);
        CHECK(resp[http::field::content_range] == "bytes 0-1023/300000");
        CHECK(resp[http::field::content_length] == "1024");
        CHECK(resp[http::field::accept_ranges] == "bytes");
        CHECK(resp.body() == sample_.substr(0, 1024));
    }

    SECTION("open-ended range is cut to the window")
    {
        auto resp = get(stream_target(sample_id_), "bytes=100000-");
        CHECK(resp.result() == http::status::partial_content);
        CHECK(resp[http::field::content_range] == "bytes 100000-165535/300000");
        CHECK(resp.body() == sample_.substr(100000, window_size));
    }

    SECTION("range at the end is clamped")
    {
        auto resp = get(stream_target(sample_id_), "bytes=299990-400000");
        CHECK(resp.result() == http::status::partial_content);
        CHECK(resp[http::field::content_range] == "bytes 299990-299999/300000");
        CHECK(resp.body() == sample_.substr(299990));
    }

    SECTION("unsatisfiable range")
    {
        auto resp = get(stream_target(sample_id_), "bytes=400000-");
        CHECK(resp.result() == http::status::range_not_satisfiable);
        CHECK(resp[http::field::content_range] == "bytes */300000");
        CHECK(resp.body().empty());
    }

    SECTION("malformed range")
    {
        auto resp = get(stream_target(sample_id_), "bytes=abc");
        CHECK(resp.result() == http::status::bad_request);

        auto doc = json::parse(resp.body());
        CHECK(doc.at("status").to_number<int>() == 400);
        CHECK(doc.at("message").as_string() == "Invalid Range header");
    }

    SECTION("unknown video")
    {
        auto resp = get(stream_target(sample_id_ + 1000), "bytes=0-10");
        CHECK(resp.result() == http::status::not_found);
        CHECK(json::parse(resp.body()).at("message").as_string() == "Video not found");
    }

    SECTION("HEAD reports the framing without a body")
    {
        auto resp = get(stream_target(sample_id_), std::nullopt, http::verb::head);
        CHECK(resp.result() == http::status::ok);
        CHECK(resp[http::field::content_length] == std::to_string(sample_size));
        CHECK(resp.body().empty());
    }

    SECTION("unsupported method on a stream lists the allowed ones")
    {
        auto resp = get(stream_target(sample_id_), std::nullopt, http::verb::delete_);
        CHECK(resp.result() == http::status::method_not_allowed);
        CHECK(resp[http::field::allow] == "GET, HEAD");
    }

    SECTION("unknown path")
    {
        auto resp = get("/does/not/exist");
        CHECK(resp.result() == http::status::not_found);
    }

    SECTION("two requests on one connection")
    {
        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(endpoint_);
        beast::flat_buffer buffer;

        for (auto range : {"bytes=0-9", "bytes=10-19"}) {
            http::request<http::empty_body> req(http::verb::get, stream_target(sample_id_), 11);
            req.set(http::field::host, "127.0.0.1");
            req.set(http::field::range, range);
            http::write(stream, req);

            http::response<http::string_body> resp;
            http::read(stream, buffer, resp);
            CHECK(resp.result() == http::status::partial_content);
            CHECK(resp.keep_alive());
        }
    }
}

TEST_CASE_METHOD(server_fixture, "Catalog over HTTP", "[http]")
{
    SECTION("upload, then list, describe and stream it")
    {
        const auto content = test::pattern(7, 5000);

        auto body = multipart_part("title", "Uploaded") +
                    multipart_part("description", "from the test") +
                    multipart_part("file", content, "clip.webm", "video/webm") + "--" + boundary +
                    "--\r\n";
        auto created = upload(std::move(body));
        REQUIRE(created.result() == http::status::created);

        auto record = json::parse(created.body()).as_object();
        CHECK(record.at("title").as_string() == "Uploaded");
        CHECK(record.at("description").as_string() == "from the test");
        CHECK(record.at("fileName").as_string() == "clip.webm");
        CHECK(record.at("fileSize").to_number<std::uint64_t>() == 5000);
        CHECK_FALSE(record.contains("storedFileName"));
        auto id = record.at("id").to_number<std::uint64_t>();

        auto list = get("/api/videos");
        REQUIRE(list.result() == http::status::ok);
        auto records = json::parse(list.body()).as_array();
        REQUIRE(records.size() == 2);
        CHECK(records[0].at("id").to_number<std::uint64_t>() == id);

        auto one = get("/api/videos/" + std::to_string(id));
        REQUIRE(one.result() == http::status::ok);
        CHECK(json::parse(one.body()).at("title").as_string() == "Uploaded");

        auto streamed = get(stream_target(id), "bytes=0-99");
        CHECK(streamed.result() == http::status::partial_content);
        CHECK(streamed[http::field::content_type] == "video/webm");
        CHECK(streamed.body() == content.substr(0, 100));
    }

    SECTION("unsupported file type")
    {
        auto body = multipart_part("title", "Notes") +
                    multipart_part("file", "hello", "notes.txt", "text/plain") + "--" + boundary +
                    "--\r\n";
        auto resp = upload(std::move(body));
        CHECK(resp.result() == http::status::bad_request);
        CHECK(json::parse(resp.body()).at("message").as_string() ==
              "Invalid file type. Allowed types: mp4, webm, mov");
    }

    SECTION("missing title")
    {
        auto body = multipart_part("file", "data", "clip.mp4", "video/mp4") + "--" + boundary +
                    "--\r\n";
        auto resp = upload(std::move(body));
        CHECK(resp.result() == http::status::bad_request);
    }

    SECTION("a body that is not form data")
    {
        http::request<http::string_body> req(http::verb::post, "/api/videos", 11);
        req.set(http::field::content_type, "application/json");
        req.body() = "{}";
        auto resp  = send(std::move(req));
        CHECK(resp.result() == http::status::bad_request);
    }

    SECTION("a body over the limit is refused from its header")
    {
        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(endpoint_);

        std::string header = "POST /api/videos HTTP/1.1\r\n"
                             "Host: 127.0.0.1\r\n"
                             "Content-Type: multipart/form-data; boundary=" +
                             boundary +
                             "\r\n"
                             "Content-Length: 999999999\r\n\r\n";
        net::write(stream, net::buffer(header));

        beast::flat_buffer buffer;
        http::response<http::string_body> resp;
        http::read(stream, buffer, resp);
        CHECK(resp.result() == http::status::payload_too_large);
    }

    SECTION("unknown record")
    {
        auto resp = get("/api/videos/999");
        CHECK(resp.result() == http::status::not_found);
    }

    SECTION("a non-numeric id matches no route")
    {
        auto resp = get("/api/videos/abc");
        CHECK(resp.result() == http::status::not_found);
    }
}
