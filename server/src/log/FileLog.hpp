#pragma once

#include "Log.hpp"

#include "util/File.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>

namespace Log
{

/**
 * A log written to a file as JSON lines, one item per line.
 *
 * The file is truncated on construction. Older items are read back by reopening the file, so reads never disturb the
 * append position.
 */
class FileLog final : public Log
{
public:
    ~FileLog() override;

    /**
     * @param path The file to write.
     * @param endCacheSize How many of the most recent items to keep in memory for fast reads.
     */
    explicit FileLog(IOContext &ioc, std::filesystem::path path, Level minLevel, bool print,
                     size_t endCacheSize = 1024);

private:
    Awaitable<Item> load(size_t index) const override;
    Awaitable<void> store(Item item) override;

    const std::filesystem::path path;

    /**
     * The append handle.
     */
    Util::File file;

    /**
     * Byte offset of the start of every stored item, plus the offset of the next one.
     */
    std::deque<uint64_t> offsets;

    /**
     * The most recently stored items.
     */
    std::deque<Item> endCache;

    const size_t endCacheSize;

    /**
     * The index of the first item in endCache.
     */
    size_t endCacheStart = 0;
};

} // namespace Log
