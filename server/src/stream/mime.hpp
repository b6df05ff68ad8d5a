#pragma once

#include <filesystem>
#include <string_view>

namespace Stream
{

/**
 * Get the MIME type to serve a stored video file with, by its extension.
 *
 * Unknown extensions are served as video/mp4.
 */
std::string_view getMimeTypeForVideo(const std::filesystem::path &path);

} // namespace Stream
