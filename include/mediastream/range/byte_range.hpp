#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mediastream::range {

/// Upper bound of a partial response served for an open-ended request (`bytes=N-`).
inline constexpr std::uint64_t default_window_size = 1024 * 1024;

/// Inclusive interval `[start, end]` of byte offsets.
struct byte_range
{
    std::uint64_t start = 0;
    std::uint64_t end   = 0;

    std::uint64_t length() const { return end - start + 1; }

    bool operator==(const byte_range&) const = default;
};

/// Parsed but unvalidated form of a Range header.
struct range_request
{
    std::uint64_t start = 0;
    std::optional<std::uint64_t> end;

    bool open_ended() const { return !end.has_value(); }

    bool operator==(const range_request&) const = default;
};

struct content_descriptor
{
    std::uint64_t total_length = 0;
    std::string media_type;
};

/// Outcome of range resolution. Empty means the whole resource.
using resolution = std::optional<byte_range>;

/// `Content-Range` value: `bytes <start>-<end>/<total>`.
struct content_range
{
    std::uint64_t start = 0;
    std::uint64_t end   = 0;
    std::uint64_t total = 0;

    std::string to_string() const;

    /// `bytes */<total>`, sent with 416 responses.
    static std::string unsatisfied(std::uint64_t total);

    bool operator==(const content_range&) const = default;
};

} // namespace mediastream::range
