#include "FileLog.hpp"

#include "util/asio.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

Log::FileLog::~FileLog() = default;

Log::FileLog::FileLog(IOContext &ioc, std::filesystem::path path, Level minLevel, bool print, size_t endCacheSize) :
    Log(minLevel, print, ioc), path(path), file(ioc, std::move(path), Util::File::Mode::create), endCacheSize(endCacheSize)
{
    offsets.emplace_back(0);
}

Awaitable<Log::Item> Log::FileLog::load(size_t index) const
{
    if (index >= endCacheStart) {
        assert(index - endCacheStart < endCache.size());
        co_return endCache[index - endCacheStart];
    }

    /* Read just the one line back with a separate handle. */
    assert(index + 1 < offsets.size());
    uint64_t start = offsets[index];
    uint64_t end = offsets[index + 1];

    Util::File reader(ioc, path);
    std::vector<std::byte> data = co_await reader.readExactAt(start, end - start);
    if (data.empty() || data.back() != (std::byte)'\n') {
        throw std::runtime_error("Log file item " + std::to_string(index) + " is not newline terminated.");
    }
    co_return Item::fromJsonString(std::string_view((const char *)data.data(), data.size() - 1));
}

Awaitable<void> Log::FileLog::store(Item item)
{
    std::string line = item.toJsonString();
    assert(line.find('\n') == std::string::npos);
    line += "\n";

    co_await file.append(line);
    offsets.emplace_back(offsets.back() + line.size());

    if (endCacheSize > 0) {
        if (endCache.size() == endCacheSize) {
            endCache.pop_front();
            endCacheStart++;
        }
        endCache.emplace_back(std::move(item));
    }
    else {
        endCacheStart++;
    }
}
