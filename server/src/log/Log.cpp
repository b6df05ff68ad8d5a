#include "Log.hpp"

#include "util/asio.hpp"

#include <cassert>
#include <cstdio>

Log::Context::PendingItem::PendingItem(Context &context, Level level, std::string_view kind) :
    context(context), steadyTime(std::chrono::steady_clock::now()), systemTime(std::chrono::system_clock::now()),
    level(level), kind(kind)
{
}

Log::Context::PendingItem::~PendingItem()
{
    context.append(*this);
}

Log::Context::Context(Log &log, std::string name, size_t index) :
    log(log), steadyCreationTime(std::chrono::steady_clock::now()), name(std::move(name)), index(index)
{
    log.append({
        .logTime = steadyCreationTime - log.steadyCreationTime,
        .systemTime = std::chrono::system_clock::now(),
        .kind = "log context",
        .message = "created",
        .contextName = this->name,
        .contextIndex = index
    });
}

Log::Context::~Context()
{
    auto now = std::chrono::steady_clock::now();
    log.append({
        .logTime = now - log.steadyCreationTime,
        .contextTime = now - steadyCreationTime,
        .systemTime = std::chrono::system_clock::now(),
        .kind = "log context",
        .message = "destroyed",
        .contextName = name,
        .contextIndex = index
    });
}

void Log::Context::append(PendingItem &item)
{
    log.append({
        .logTime = item.steadyTime - log.steadyCreationTime,
        .contextTime = item.steadyTime - steadyCreationTime,
        .systemTime = item.systemTime,
        .level = item.level,
        .kind = std::move(item.kind),
        .message = item.message.str(),
        .contextName = name,
        .contextIndex = index
    });
}

Log::Log::~Log() = default;

Log::Log::Log(Level minLevel, bool print, IOContext &ioc) :
    ioc(ioc), steadyCreationTime(std::chrono::steady_clock::now()), minLevel(minLevel), print(print)
{
}

Log::Context Log::Log::operator()(std::string_view name)
{
    assert(!name.empty());

    auto it = contextIndices.find(name);
    if (it == contextIndices.end()) {
        it = contextIndices.emplace(std::string(name), 0).first;
    }
    return Context(*this, it->first, it->second++);
}

Awaitable<Log::Item> Log::Log::operator[](size_t index) const
{
    assert(index < size());
    if (index >= storedItems) {
        co_return queue[index - storedItems];
    }
    co_return co_await load(index);
}

void Log::Log::append(Item item)
{
    // The log's own creation entry waits for the first item, when the subclass is fully constructed.
    if (size() == 0 && minLevel <= Level::info) {
        enqueue({
            .systemTime = std::chrono::system_clock::now(),
            .kind = "log",
            .message = "created"
        });
    }

    if (item.level >= minLevel) {
        enqueue(std::move(item));
    }
}

void Log::Log::enqueue(Item item)
{
    if (print) {
        fprintf(stderr, "%s\n", item.format(true).c_str());
    }

    queue.emplace_back(std::move(item));
    if (queue.size() == 1) {
        spawnDetached(ioc, [this]() -> Awaitable<void> { return drain(); });
    }
}

Awaitable<void> Log::Log::drain()
{
    while (!queue.empty()) {
        try {
            // A copy, since operator[] can read the front item while store() is suspended.
            co_await store(queue.front());
        }
        catch (const std::exception &e) {
            // There's nowhere else to report a broken log.
            fprintf(stderr, "Error storing log item: %s\n", e.what());
        }
        queue.pop_front();
        storedItems++;
    }
}
