#include "mime.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace
{

/**
 * Container formats we know about.
 */
constexpr std::pair<std::string_view, std::string_view> mimeTypes[] = {
    { "avi", "video/x-msvideo" },
    { "m4v", "video/mp4" },
    { "mkv", "video/x-matroska" },
    { "mp4", "video/mp4" },
    { "ts", "video/MP2T" },
    { "webm", "video/webm" }
};

constexpr std::string_view defaultMimeType = "video/mp4";

} // namespace

std::string_view Stream::getMimeTypeForVideo(const std::filesystem::path &path)
{
    std::string extension = path.extension().string();
    if (extension.empty()) {
        return defaultMimeType;
    }
    extension = extension.substr(1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    for (auto [candidateExtension, candidateMimeType]: mimeTypes) {
        if (candidateExtension == extension) {
            return candidateMimeType;
        }
    }
    return defaultMimeType;
}
