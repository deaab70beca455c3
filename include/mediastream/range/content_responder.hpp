#pragma once
#include "mediastream/range/byte_range.hpp"
#include "mediastream/storage/blob_store.hpp"
#include <boost/system/error_code.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace mediastream::range {

enum class stream_status
{
    full,
    partial
};

/// Bytes that are read from storage while the response body is written.
struct blob_source
{
    std::shared_ptr<storage::seekable_readable> reader;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

struct stream_response
{
    stream_status status = stream_status::full;
    std::optional<content_range> range;
    std::uint64_t content_length = 0;
    std::string media_type;

    /// Partial responses carry the bytes already read, full responses a streaming source.
    std::variant<std::string, blob_source> payload;
};

/**
 * Build the response for a resolved request.
 *
 * A partial resolution performs one positioned read of exactly `range.length()` bytes;
 * fewer bytes set `ec` to `error::incomplete_read`. A full resolution does no I/O here and
 * hands the reader over as the payload.
 */
stream_response respond(const content_descriptor& content,
                        const resolution& resolved,
                        std::shared_ptr<storage::seekable_readable> reader,
                        boost::system::error_code& ec);

} // namespace mediastream::range
