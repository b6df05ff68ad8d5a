#pragma once

#include <string>
#include <string_view>

namespace Stream
{

/**
 * Build a VOD playlist with a single entry that covers a whole unsegmented video.
 *
 * This lets HLS players play videos that were never segmented.
 *
 * @param duration The target duration and the duration of the one entry, in seconds.
 * @param url Where the player gets the video from.
 */
std::string makeSingleEntryPlaylist(unsigned int duration, std::string_view url);

} // namespace Stream
