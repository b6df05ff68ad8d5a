#pragma once

#include "catalog/Catalog.hpp"

#include <string_view>

namespace Stream
{

/**
 * Find the variant to serve for a requested quality.
 *
 * If the video doesn't have the requested quality, its default quality is served instead. Check the returned
 * variant's quality to see which one it is.
 *
 * @return The variant, or nullptr if the video doesn't exist or has nothing to serve.
 */
const Catalog::Variant *resolveVariant(const Catalog::Catalog &catalog, Catalog::VideoId id,
                                       std::string_view quality);

} // namespace Stream
