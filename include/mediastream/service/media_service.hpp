#pragma once
#include "mediastream/config.hpp"
#include "mediastream/server/request.hpp"
#include "mediastream/server/response.hpp"
#include "mediastream/server/router.hpp"
#include "mediastream/service/media_streamer.hpp"
#include "mediastream/service/upload_service.hpp"
#include "mediastream/setting.hpp"
#include <boost/system/error_code.hpp>
#include <memory>

namespace mediastream::service {

/**
 * The `/api/videos` HTTP API.
 *
 * | Method     | Path                     | Result                          |
 * |------------|--------------------------|---------------------------------|
 * | POST       | /api/videos              | 201, the new record             |
 * | GET        | /api/videos              | records, newest first           |
 * | GET        | /api/videos/{id}         | one record                      |
 * | GET, HEAD  | /api/videos/{id}/stream  | 200 or 206 media bytes, or 416  |
 */
class media_service
{
public:
    media_service(catalog::catalog& catalog,
                  storage::blob_store& store,
                  const setting& conf,
                  std::shared_ptr<spdlog::logger> logger);

    void register_routes(server::router& router);

    void upload(server::request& req, server::response& resp);
    void list(server::request& req, server::response& resp);
    void get(server::request& req, server::response& resp);
    void stream(server::request& req, server::response& resp);

    /// JSON error body `{"status", "error", "message"}`.
    static void set_api_error(server::response& resp, http::status status, std::string_view message);

private:
    void set_api_error(server::response& resp, const boost::system::error_code& ec) const;

    catalog::catalog& catalog_;
    media_streamer streamer_;
    upload_service uploader_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mediastream::service
