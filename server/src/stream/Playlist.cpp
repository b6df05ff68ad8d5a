#include "Playlist.hpp"

std::string Stream::makeSingleEntryPlaylist(unsigned int duration, std::string_view url)
{
    std::string d = std::to_string(duration);
    std::string result;
    result += "#EXTM3U\n";
    result += "#EXT-X-VERSION:3\n";
    result += "#EXT-X-TARGETDURATION:" + d + "\n";
    result += "#EXT-X-MEDIA-SEQUENCE:0\n";
    result += "#EXT-X-PLAYLIST-TYPE:VOD\n";
    result += "#EXTINF:" + d + ".0,\n";
    result += url;
    result += "\n";
    result += "#EXT-X-ENDLIST\n";
    return result;
}
