#include "ByteRange.hpp"

#include "util/util.hpp"

#include <stdexcept>

uint64_t Stream::ByteRange::getLength() const
{
    switch (kind) {
        case Kind::full: return total;
        case Kind::partial: return end - start + 1;
        case Kind::unsatisfiable: return 0;
    }
    return 0;
}

Stream::ByteRange Stream::parseRange(std::optional<std::string_view> header, uint64_t total)
{
    ByteRange full{ .kind = ByteRange::Kind::full, .total = total };
    if (!header) {
        return full;
    }

    /* Strip the unit. */
    constexpr std::string_view prefix = "bytes=";
    std::string_view value = Util::trim(*header);
    if (!value.starts_with(prefix)) {
        return full;
    }
    value.remove_prefix(prefix.size());

    /* Split into the first and last byte positions. */
    std::string_view first;
    std::string_view last;
    try {
        Util::split(value, { first, last }, '-');
    }
    catch (const std::invalid_argument &) {
        return full;
    }

    /* Parse the positions. The last one is optional. Suffix ranges (empty first position) aren't supported. */
    uint64_t start = 0;
    uint64_t end = 0;
    try {
        start = Util::parseUint64(first);
        end = last.empty() ? ((total == 0) ? 0 : total - 1) : Util::parseUint64(last);
    }
    catch (const std::invalid_argument &) {
        return full;
    }
    catch (const std::out_of_range &) {
        return full;
    }

    /* Check against the size, then the order. */
    if (start >= total || end >= total) {
        return { .kind = ByteRange::Kind::unsatisfiable, .total = total };
    }
    if (start > end) {
        return full;
    }
    return { .kind = ByteRange::Kind::partial, .start = start, .end = end, .total = total };
}
