#include "mediastream/service/media_service.hpp"
#include "mediastream/error.hpp"
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <charconv>
#include <spdlog/spdlog.h>

namespace mediastream::service {

namespace detail {

// Rejects upload requests whose body was not parsed as multipart form data.
struct multipart_form
{
    bool before(server::request& req, server::response& resp)
    {
        if (req.body().is_body_type<body::form_data_body>())
            return true;

        media_service::set_api_error(
            resp, http::status::bad_request, "Expected a multipart/form-data body");
        return false;
    }
};

static std::optional<std::uint64_t> record_id(const server::request& req)
{
    auto text = req.path_param("id");

    std::uint64_t id = 0;
    auto [ptr, ec]   = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return id;
}

} // namespace detail

media_service::media_service(catalog::catalog& catalog,
                             storage::blob_store& store,
                             const setting& conf,
                             std::shared_ptr<spdlog::logger> logger)
    : catalog_(catalog)
    , streamer_(catalog, store, conf.window_size, logger)
    , uploader_(store, catalog, conf.allowed_media_types, logger)
    , logger_(std::move(logger))
{
}

void media_service::register_routes(server::router& router)
{
    router.set_http_handler<http::verb::post>(
        "/api/videos", &media_service::upload, *this, detail::multipart_form {});
    router.set_http_handler<http::verb::get>("/api/videos", &media_service::list, *this);
    router.set_http_handler<http::verb::get>(R"(/api/videos/{id:^\d+$})", &media_service::get, *this);
    router.set_http_handler<http::verb::get, http::verb::head>(
        R"(/api/videos/{id:^\d+$}/stream)", &media_service::stream, *this);
}

void media_service::upload(server::request& req, server::response& resp)
{
    boost::system::error_code ec;
    auto record = uploader_.upload(req.body().as<body::form_data_body>(), ec);
    if (ec) {
        set_api_error(resp, ec);
        return;
    }
    resp.set_json_content(catalog::to_json(record), http::status::created);
}

void media_service::list(server::request&, server::response& resp)
{
    json::array records;
    for (const auto& record : catalog_.list())
        records.push_back(catalog::to_json(record));

    resp.set_json_content(std::move(records));
}

void media_service::get(server::request& req, server::response& resp)
{
    boost::system::error_code ec = error::resource_not_found;

    catalog::media_record record;
    if (auto id = detail::record_id(req))
        record = catalog_.get(*id, ec);

    if (ec) {
        set_api_error(resp, ec);
        return;
    }
    resp.set_json_content(catalog::to_json(record));
}

void media_service::stream(server::request& req, server::response& resp)
{
    auto id = detail::record_id(req);
    if (!id) {
        set_api_error(resp, error::resource_not_found);
        return;
    }

    auto result = streamer_.serve(*id, req.header_value(http::field::range));
    if (result.state == stream_state::served) {
        resp.set_stream_content(std::move(*result.response));
        return;
    }

    if (result.ec == error::range_not_satisfiable) {
        resp.set_range_not_satisfiable(result.total_length);
        return;
    }
    if (result.ec == error::incomplete_read || result.ec == error::storage_failure)
        logger_->error("stream {} failed: {}", *id, result.ec.message());

    set_api_error(resp, result.ec);
}

void media_service::set_api_error(server::response& resp,
                                  http::status status,
                                  std::string_view message)
{
    auto reason = http::obsolete_reason(status);

    json::object body;
    body["status"]  = static_cast<int>(status);
    body["error"]   = json::string_view(reason.data(), reason.size());
    body["message"] = json::string_view(message.data(), message.size());
    resp.set_json_content(std::move(body), status);
}

void media_service::set_api_error(server::response& resp,
                                  const boost::system::error_code& ec) const
{
    if (ec == error::resource_not_found)
        set_api_error(resp, http::status::not_found, "Video not found");
    else if (ec == error::invalid_range_syntax)
        set_api_error(resp, http::status::bad_request, "Invalid Range header");
    else if (ec == error::unsupported_media_type)
        set_api_error(resp, http::status::bad_request, uploader_.unsupported_type_message());
    else if (ec == error::missing_field)
        set_api_error(resp, http::status::bad_request, "Fields 'file' and 'title' are required");
    else
        set_api_error(resp, http::status::internal_server_error, ec.message());
}

} // namespace mediastream::service
