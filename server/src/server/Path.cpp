#include "Path.hpp"

#include <algorithm>

namespace
{

int hexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percentDecode(std::string_view part)
{
    std::string result;
    result.reserve(part.size());
    for (size_t i = 0; i < part.size(); i++) {
        if (part[i] != '%') {
            result += part[i];
            continue;
        }
        if (i + 2 >= part.size()) {
            throw Server::Path::Exception("Truncated percent escape in path.");
        }
        int high = hexValue(part[i + 1]);
        int low = hexValue(part[i + 2]);
        if (high < 0 || low < 0) {
            throw Server::Path::Exception("Malformed percent escape in path.");
        }
        result += (char)(high * 16 + low);
        i += 2;
    }
    return result;
}

/**
 * Check a decoded part can't be used to reach outside the resource tree, or outside a directory.
 */
void checkPart(const std::string &part)
{
    for (char c: part) {
        // Non-ASCII is refused outright, which also stops overlong UTF-8 encodings of the characters below.
        if (c < 0x20 || c > 0x7E) {
            throw Server::Path::Exception("Path contains a character that is not printable ASCII.");
        }
        switch (c) {
            case '/':
            case '\\':
            case ':':
                throw Server::Path::Exception("Path contains bad character.");
        }
    }
    if (part.find_first_not_of('.') == std::string::npos) {
        throw Server::Path::Exception("Path not allowed to contain parent dots.");
    }
}

} // namespace

Server::Path::~Path() = default;
Server::Path::Path(const Path &) = default;
Server::Path::Path(Path &&) noexcept = default;
Server::Path &Server::Path::operator=(const Path &) = default;
Server::Path &Server::Path::operator=(Path &&) noexcept = default;

Server::Path::Path(std::string_view target)
{
    target = target.substr(0, target.find_first_of("?#"));

    while (!target.empty()) {
        size_t separator = target.find('/');
        std::string_view raw = target.substr(0, separator);
        target.remove_prefix(std::min(target.size(), raw.size() + 1));

        std::string part = percentDecode(raw);
        if (part.empty() || part == ".") {
            continue;
        }
        checkPart(part);
        parts.emplace_back(std::move(part));
    }
}

std::strong_ordering Server::Path::operator<=>(const Path &other) const
{
    return std::lexicographical_compare_three_way(parts.begin() + first, parts.end(),
                                                  other.parts.begin() + other.first, other.parts.end());
}

bool Server::Path::operator==(const Path &other) const
{
    return std::equal(parts.begin() + first, parts.end(), other.parts.begin() + other.first, other.parts.end());
}

Server::Path::operator std::string() const
{
    std::string result;
    for (size_t i = first; i < parts.size(); i++) {
        if (i != first) {
            result += '/';
        }
        result += parts[i];
    }
    return result;
}
