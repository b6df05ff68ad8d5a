#include "JsonCatalog.hpp"

#include "Quality.hpp"

#include "util/json.hpp"
#include "util/util.hpp"

#include <ios>
#include <limits>
#include <set>

using namespace std::string_literals;

namespace
{

/**
 * Turn a stored location string into a VariantLocation.
 */
Catalog::VariantLocation parseLocation(const std::string &location, const std::filesystem::path &mediaRoot)
{
    if (Catalog::isRemoteLocation(location)) {
        return Catalog::RemoteUrl{ location };
    }
    std::filesystem::path path(location);
    if (path.is_relative()) {
        path = mediaRoot / path;
    }
    return Catalog::LocalFile{ std::move(path) };
}

Catalog::Variant parseVariant(const nlohmann::json &j, const std::filesystem::path &mediaRoot)
{
    Catalog::Variant variant;
    std::string location;

    Json::ObjectReader reader(j, "videos.variants");
    reader.required(variant.quality, "quality");
    reader.required(location, "location");
    reader.optional(variant.size, "size");
    reader.optional(variant.processed, "processed");
    reader.finish();

    if (variant.quality.empty()) {
        throw Catalog::LoadException("Variant has an empty quality.");
    }
    if (location.empty()) {
        throw Catalog::LoadException("Variant \"" + variant.quality + "\" has an empty location.");
    }
    variant.location = parseLocation(location, mediaRoot);
    return variant;
}

Catalog::Video parseVideo(const nlohmann::json &j, const std::filesystem::path &mediaRoot)
{
    Catalog::Video video;
    nlohmann::json id;
    std::vector<nlohmann::json> variants;

    Json::ObjectReader reader(j, "videos");
    reader.required(id, "id");
    reader.optional(video.duration, "duration");
    reader.optional(variants, "variants");
    reader.finish();

    /* The ID gets matched against decimal path components, so only non-negative integers make sense. */
    if (!id.is_number_unsigned()) {
        throw Catalog::LoadException("Video ID " + id.dump() + " is not a non-negative integer.");
    }
    video.id = id.get<Catalog::VideoId>();

    // Playlists give the duration as a whole number of seconds, rounded up, in an unsigned int.
    if (video.duration &&
        (*video.duration < 0 || *video.duration > (double)std::numeric_limits<unsigned int>::max())) {
        throw Catalog::LoadException("Video " + std::to_string(video.id) + " has an out of range duration.");
    }

    /* Parse the variants, and make sure each quality only appears once. */
    std::set<std::string> qualities;
    for (const nlohmann::json &variantJson: variants) {
        Catalog::Variant variant = parseVariant(variantJson, mediaRoot);
        if (!qualities.insert(variant.quality).second) {
            throw Catalog::LoadException("Video " + std::to_string(video.id) + " has quality \"" + variant.quality +
                                         "\" more than once.");
        }
        video.variants.emplace_back(std::move(variant));
    }
    return video;
}

} // namespace

Catalog::JsonCatalog::~JsonCatalog() = default;
Catalog::JsonCatalog::JsonCatalog(JsonCatalog &&) noexcept = default;

Catalog::JsonCatalog Catalog::JsonCatalog::fromJson(std::string_view jsonString,
                                                    const std::filesystem::path &mediaRoot)
{
    JsonCatalog catalog;
    try {
        nlohmann::json j = Json::parse(jsonString);
        std::vector<nlohmann::json> videos;

        Json::ObjectReader reader(j);
        reader.required(videos, "videos");
        reader.finish();

        for (const nlohmann::json &videoJson: videos) {
            Video video = parseVideo(videoJson, mediaRoot);
            VideoId id = video.id;
            if (!catalog.videos.emplace(id, std::move(video)).second) {
                throw LoadException("Video " + std::to_string(id) + " appears more than once.");
            }
        }
    }
    catch (const nlohmann::json::exception &e) {
        throw LoadException("Error parsing catalog: "s + e.what());
    }
    catch (const Json::FormatException &e) {
        throw LoadException("Error parsing catalog: "s + e.what());
    }
    return catalog;
}

Catalog::JsonCatalog Catalog::JsonCatalog::fromFile(const std::filesystem::path &path,
                                                    const std::filesystem::path &mediaRoot)
{
    std::vector<std::byte> data;
    try {
        data = Util::readFile(path);
    }
    catch (const std::ios::failure &) {
        throw LoadException("Could not read catalog file " + path.string() + ".");
    }
    return fromJson({ (const char *)data.data(), data.size() }, mediaRoot);
}

const Catalog::Video *Catalog::JsonCatalog::findVideo(VideoId id) const
{
    auto it = videos.find(id);
    return (it == videos.end()) ? nullptr : &it->second;
}

size_t Catalog::JsonCatalog::getVariantCount() const
{
    size_t result = 0;
    for (const auto &[id, video]: videos) {
        result += video.variants.size();
    }
    return result;
}
