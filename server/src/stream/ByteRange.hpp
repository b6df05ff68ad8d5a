#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Stream
{

/**
 * What a request's Range header asks for, checked against the size of the representation.
 *
 * Offsets are zero-based and inclusive, as in Content-Range.
 */
struct ByteRange final
{
    enum class Kind
    {
        /**
         * No usable range: send everything with 200.
         */
        full,

        /**
         * Send [start, end] with 206.
         */
        partial,

        /**
         * The range lies (partly) outside the representation: 416.
         */
        unsatisfiable
    };

    Kind kind = Kind::full;
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t total = 0;

    /**
     * Get the number of bytes the response body carries.
     */
    uint64_t getLength() const;

    bool operator==(const ByteRange &) const = default;
};

/**
 * Interpret a Range header.
 *
 * Only `bytes=N-M` and `bytes=N-` are understood. Anything else (no header, another unit, suffix ranges, several
 * ranges, junk or numbers that don't fit in 64 bits) gives Kind::full. If N or M is at or past the end of the
 * representation, the result is Kind::unsatisfiable. Otherwise N > M gives Kind::full.
 *
 * @param header The value of the Range header, if the request had one.
 * @param total The size of the representation in bytes.
 */
ByteRange parseRange(std::optional<std::string_view> header, uint64_t total);

} // namespace Stream
