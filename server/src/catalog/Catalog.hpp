#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @defgroup catalog Catalog
 *
 * Read-only lookup of videos and their stored quality variants.
 */
/// @addtogroup catalog
/// @{

/**
 * Contains the video catalog.
 */
namespace Catalog
{

using VideoId = uint64_t;

/**
 * A variant stored in a local file.
 */
struct LocalFile final
{
    /**
     * Absolute, or relative to the working directory. Never relative to the media root.
     */
    std::filesystem::path path;

    bool operator==(const LocalFile &) const = default;
};

/**
 * A variant that lives elsewhere, e.g: on a CDN.
 */
struct RemoteUrl final
{
    std::string url;

    bool operator==(const RemoteUrl &) const = default;
};

/**
 * Where the bytes of a variant are.
 */
using VariantLocation = std::variant<LocalFile, RemoteUrl>;

/**
 * A quality-labeled rendition of a video.
 */
struct Variant final
{
    std::string quality;
    VariantLocation location;

    /**
     * The size the catalog declares. The file on disk is authoritative.
     */
    uint64_t size = 0;

    /**
     * Whether transcoding finished. Unprocessed variants are not served.
     */
    bool processed = true;
};

/**
 * A video and its variants.
 */
struct Video final
{
    VideoId id = 0;

    /**
     * Length of the video in seconds, if known. Between 0 and the largest unsigned int.
     */
    std::optional<double> duration;

    /**
     * All the variants, in catalog order, processed or not.
     */
    std::vector<Variant> variants;
};

/**
 * Read-only access to the videos that can be streamed.
 *
 * Implementations must be safe to call from any coroutine on the server's IO context. They don't block.
 */
class Catalog
{
public:
    virtual ~Catalog();

    /**
     * Find a video.
     *
     * @return The video, or nullptr if there isn't one with that ID. The pointer is valid for the life of the catalog.
     */
    virtual const Video *findVideo(VideoId id) const = 0;

    /**
     * Find the processed variant of a video with exactly the given quality label.
     *
     * @return The variant, or nullptr if the video or the variant don't exist, or the variant isn't processed.
     */
    const Variant *findVariant(VideoId id, std::string_view quality) const;

    /**
     * Get the best quality label a video has, by the fixed priority list.
     *
     * @return The quality, or std::nullopt if the video doesn't exist or has none of the prioritized qualities.
     * @see getDefaultQualityPriority
     */
    std::optional<std::string> defaultQuality(VideoId id) const;

    /**
     * Get a video's processed variants in catalog order.
     */
    std::vector<const Variant *> getProcessedVariants(VideoId id) const;
};

} // namespace Catalog

/// @}
