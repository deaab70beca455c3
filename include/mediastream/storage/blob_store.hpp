#pragma once
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <memory>
#include <string_view>

namespace mediastream::storage {

/// A read-only byte sequence that supports reads at arbitrary offsets.
class seekable_readable
{
public:
    virtual ~seekable_readable() = default;

    virtual std::uint64_t size(boost::system::error_code& ec) const = 0;

    /**
     * Read up to `n` bytes starting at `offset`.
     *
     * @return The number of bytes read. Less than `n` only when the end of the sequence is
     * reached.
     */
    virtual std::size_t read_at(std::uint64_t offset,
                                void* buffer,
                                std::size_t n,
                                boost::system::error_code& ec) = 0;
};

class blob_store
{
public:
    virtual ~blob_store() = default;

    /// Open a stored blob. Unknown or out-of-root ids yield `error::resource_not_found`.
    virtual std::unique_ptr<seekable_readable> open(std::string_view blob_id,
                                                    boost::system::error_code& ec) const = 0;

    virtual std::uint64_t size(std::string_view blob_id, boost::system::error_code& ec) const = 0;

    /// Write `content` under `blob_id`, replacing any previous blob with that id.
    virtual void store(std::string_view blob_id,
                       std::string_view content,
                       boost::system::error_code& ec) = 0;
};

} // namespace mediastream::storage
