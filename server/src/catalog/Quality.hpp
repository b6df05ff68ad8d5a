#pragma once

#include <span>
#include <string_view>

namespace Catalog
{

/**
 * The quality labels that can be chosen as a video's default quality, best first.
 *
 * Other labels (e.g: "original", "480p") can be requested by name but are never picked as a default.
 */
std::span<const std::string_view> getDefaultQualityPriority();

/**
 * Determine whether a stored location names a remote resource rather than a local file.
 *
 * @return True for strings starting with "http://" or "https://".
 */
bool isRemoteLocation(std::string_view location);

} // namespace Catalog
