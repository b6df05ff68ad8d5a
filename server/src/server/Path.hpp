#pragma once

#include <cassert>
#include <compare>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Server
{

/**
 * The path part of a request target, split into its parts.
 *
 * Resources see the path relative to themselves: the server drops the outer parts as it finds its way to the
 * resource.
 */
class Path final
{
public:
    /**
     * Thrown if a request target can't be turned into a safe path.
     */
    class Exception final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    ~Path();
    Path(const Path &);
    Path(Path &&) noexcept;
    Path &operator=(const Path &);
    Path &operator=(Path &&) noexcept;

    /**
     * Parse a request target, e.g: "/videos/42/stream/720p?t=3".
     *
     * The query and fragment are ignored. Each part is percent-decoded. Empty and "." parts are dropped.
     *
     * @throws Exception if a decoded part contains '/', '\', ':' or a character that isn't printable ASCII, if a part
     *         consists only of dots, or if a percent escape is malformed.
     */
    Path(std::string_view target);
    Path(const char *target) : Path(std::string_view(target)) {}
    Path(const std::string &target) : Path(std::string_view(target)) {}

    std::strong_ordering operator<=>(const Path &) const;
    bool operator==(const Path &) const;

    /**
     * The remaining parts, joined with '/'.
     */
    operator std::string() const;

    /**
     * Get a part. Index 0 is the outer-most remaining part.
     */
    const std::string &operator[](size_t index) const
    {
        assert(first + index < parts.size());
        return parts[first + index];
    }

    bool empty() const
    {
        return first == parts.size();
    }

    size_t size() const
    {
        return parts.size() - first;
    }

    const std::string &front() const
    {
        return (*this)[0];
    }

    /**
     * Drop the outer-most part.
     */
    void pop_front()
    {
        assert(!empty());
        first++;
    }

private:
    std::vector<std::string> parts;

    /**
     * Parts before this index have been popped.
     */
    size_t first = 0;
};

} // namespace Server
