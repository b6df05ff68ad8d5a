#include "Catalog.hpp"

#include "Quality.hpp"

Catalog::Catalog::~Catalog() = default;

const Catalog::Variant *Catalog::Catalog::findVariant(VideoId id, std::string_view quality) const
{
    const Video *video = findVideo(id);
    if (!video) {
        return nullptr;
    }
    for (const Variant &variant: video->variants) {
        if (variant.processed && variant.quality == quality) {
            return &variant;
        }
    }
    return nullptr;
}

std::optional<std::string> Catalog::Catalog::defaultQuality(VideoId id) const
{
    for (std::string_view quality: getDefaultQualityPriority()) {
        if (findVariant(id, quality)) {
            return std::string(quality);
        }
    }
    return std::nullopt;
}

std::vector<const Catalog::Variant *> Catalog::Catalog::getProcessedVariants(VideoId id) const
{
    std::vector<const Variant *> result;
    const Video *video = findVideo(id);
    if (!video) {
        return result;
    }
    for (const Variant &variant: video->variants) {
        if (variant.processed) {
            result.push_back(&variant);
        }
    }
    return result;
}
