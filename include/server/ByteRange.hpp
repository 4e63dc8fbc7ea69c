#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lorchestre::server {

/**
 * Single-range "Range: bytes=..." handling for seekable audio.
 *
 *   bytes=a-b   bytes a..b inclusive, b clamped to the last byte
 *   bytes=a-    from a to the end
 *   bytes=-n    the last n bytes
 *
 * Multiple ranges, other units and malformed values are ignored (whole file),
 * as RFC 9110 allows.
 */
struct ByteRange {
    enum class Kind { Full, Partial, Unsatisfiable };

    Kind kind = Kind::Full;
    uint64_t first = 0;  // Inclusive
    uint64_t last = 0;   // Inclusive, meaningless for an empty Full response

    [[nodiscard]] uint64_t length() const { return kind == Kind::Unsatisfiable ? 0 : last - first + 1; }

    [[nodiscard]] static ByteRange parse(std::optional<std::string_view> header, uint64_t file_size);
};

}  // namespace lorchestre::server
