#include "Quality.hpp"

namespace
{

constexpr std::string_view defaultQualityPriority[] = { "1080p", "720p", "360p", "120p" };

} // namespace

std::span<const std::string_view> Catalog::getDefaultQualityPriority()
{
    return defaultQualityPriority;
}

bool Catalog::isRemoteLocation(std::string_view location)
{
    return location.starts_with("http://") || location.starts_with("https://");
}
