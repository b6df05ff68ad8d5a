#include "QualityOptions.hpp"

#include <nlohmann/json.hpp>

std::string_view Stream::getRecommendedQuality(std::optional<std::string_view> userAgent)
{
    if (userAgent) {
        if (userAgent->find("Mobile") != std::string_view::npos) {
            return "360p";
        }
        if (userAgent->find("Tablet") != std::string_view::npos) {
            return "720p";
        }
    }
    return "720p";
}

nlohmann::json Stream::getQualityOptions(const Catalog::Catalog &catalog, Catalog::VideoId video,
                                         std::optional<std::string_view> userAgent)
{
    nlohmann::json available = nlohmann::json::array();
    for (const Catalog::Variant *variant: catalog.getProcessedVariants(video)) {
        available.push_back({
            { "quality", variant->quality },
            { "file_size", variant->size }
        });
    }

    std::optional<std::string> defaultQuality = catalog.defaultQuality(video);
    return {
        { "available_qualities", std::move(available) },
        { "recommended_quality", std::string(getRecommendedQuality(userAgent)) },
        { "default_quality", defaultQuality ? nlohmann::json(*defaultQuality) : nlohmann::json(nullptr) }
    };
}
