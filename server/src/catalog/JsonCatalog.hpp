#pragma once

#include "Catalog.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string_view>

namespace Catalog
{

/**
 * Thrown if a catalog can't be loaded.
 */
class LoadException final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * A catalog loaded once from a JSON document.
 *
 * The document looks like:
 * ```
 * { "videos": [ { "id": 42, "duration": 634.5,
 *                 "variants": [ { "quality": "720p", "location": "42/720p.mp4", "size": 2500000 } ] } ] }
 * ```
 * Locations starting with http:// or https:// become RemoteUrl. Everything else is a LocalFile, resolved against the
 * media root if relative.
 */
class JsonCatalog final : public Catalog
{
public:
    ~JsonCatalog() override;
    JsonCatalog(JsonCatalog &&) noexcept;

    /**
     * Parse a catalog.
     *
     * @param jsonString The catalog document.
     * @param mediaRoot The directory relative local locations are resolved against.
     * @throws LoadException if the document is malformed, or has duplicate video IDs or duplicate qualities for a
     *                       video.
     */
    static JsonCatalog fromJson(std::string_view jsonString, const std::filesystem::path &mediaRoot);

    /**
     * Read and parse a catalog file.
     *
     * @throws LoadException if the file can't be read, or as for fromJson.
     */
    static JsonCatalog fromFile(const std::filesystem::path &path, const std::filesystem::path &mediaRoot);

    const Video *findVideo(VideoId id) const override;

    size_t getVideoCount() const
    {
        return videos.size();
    }

    /**
     * Get the number of variants across all videos, including unprocessed ones.
     */
    size_t getVariantCount() const;

private:
    JsonCatalog() = default;

    std::map<VideoId, Video> videos;
};

} // namespace Catalog
