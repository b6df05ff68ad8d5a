#pragma once

#include "Log.hpp"

#include <vector>

namespace Log
{

/**
 * Keeps every item in memory for the life of the process. Used when no log file is configured, and by the tests.
 */
class MemoryLog final : public Log
{
public:
    ~MemoryLog() override;
    explicit MemoryLog(IOContext &ioc, Level minLevel = Level::info, bool print = false);

private:
    Awaitable<Item> load(size_t index) const override;
    Awaitable<void> store(Item item) override;

    std::vector<Item> items;
};

} // namespace Log
