#include "MemoryLog.hpp"

#include "util/asio.hpp"

Log::MemoryLog::~MemoryLog() = default;

Log::MemoryLog::MemoryLog(IOContext &ioc, Level minLevel, bool print) : Log(minLevel, print, ioc) {}

Awaitable<Log::Item> Log::MemoryLog::load(size_t index) const
{
    // Log::operator[] only asks for stored items.
    co_return items.at(index);
}

Awaitable<void> Log::MemoryLog::store(Item item)
{
    items.push_back(std::move(item));
    co_return;
}
