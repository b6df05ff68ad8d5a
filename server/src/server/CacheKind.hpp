#pragma once

namespace Server
{

/**
 * Kind of caching to apply.
 *
 * The concrete max-age for each kind comes from the HTTP configuration.
 */
enum class CacheKind
{
    /**
     * Not cached at all (Cache-Control: no-cache).
     *
     * Used for playlists and errors, which can change as soon as a transcode finishes.
     */
    none,

    /**
     * Data that is not expected to change, like the bytes of a stored variant.
     */
    fixed,

    /**
     * HLS media segments. These never change once written.
     */
    segment
};

} // namespace Server
