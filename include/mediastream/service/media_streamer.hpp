#pragma once
#include "mediastream/catalog/catalog.hpp"
#include "mediastream/config.hpp"
#include "mediastream/range/content_responder.hpp"
#include "mediastream/storage/blob_store.hpp"
#include <boost/system/error_code.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace mediastream::service {

enum class stream_state
{
    received,
    parsed,
    resolved,
    served,
    failed
};

std::string_view to_string(stream_state state);

struct stream_result
{
    /// `served` on success, otherwise `failed` with `ec` set.
    stream_state state = stream_state::received;
    boost::system::error_code ec;

    /// Length of the blob, known once it was opened. Needed for a 416 response.
    std::uint64_t total_length = 0;

    std::optional<range::stream_response> response;
};

/**
 * Serves one stream request: catalog lookup, blob open, then parse, resolve and respond.
 *
 * Nothing is cached between requests, so the same request always produces the same result
 * for an unchanged blob.
 */
class media_streamer
{
public:
    media_streamer(const catalog::catalog& catalog,
                   const storage::blob_store& store,
                   std::uint64_t window_size,
                   std::shared_ptr<spdlog::logger> logger);

    stream_result serve(std::uint64_t id, std::optional<std::string_view> range_header) const;

private:
    void transition(std::uint64_t id, stream_result& result, stream_state next) const;
    void fail(std::uint64_t id, stream_result& result, boost::system::error_code ec) const;

    const catalog::catalog& catalog_;
    const storage::blob_store& store_;
    std::uint64_t window_size_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mediastream::service
