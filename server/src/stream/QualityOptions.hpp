#pragma once

#include "catalog/Catalog.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string_view>

namespace Stream
{

/**
 * Suggest a quality for a client from its User-Agent.
 *
 * Mobile devices get 360p. Everything else gets 720p.
 */
std::string_view getRecommendedQuality(std::optional<std::string_view> userAgent);

/**
 * Describe the qualities a video can be streamed in.
 *
 * The result is an object with "available_qualities" (processed variants in catalog order, each with "quality" and
 * "file_size"), "recommended_quality" and "default_quality" (null if there is none).
 *
 * @param video A video that exists in catalog.
 */
nlohmann::json getQualityOptions(const Catalog::Catalog &catalog, Catalog::VideoId video,
                                 std::optional<std::string_view> userAgent);

} // namespace Stream
