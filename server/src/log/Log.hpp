#pragma once

#include "Item.hpp"

#include <deque>
#include <map>
#include <sstream>

#include "util/awaitable.hpp"
class IOContext;

/**
 * @defgroup log Logging
 *
 * The logging system.
 */
/// @addtogroup log
/// @{

/**
 * Structured logging.
 *
 * Every item records which context wrote it, so the entries for one connection or request can be pulled out of an
 * interleaved log.
 */
namespace Log
{

class Log;

/**
 * A named source of log items, such as one connection or one request.
 *
 * Items are written with:
 *
 *     context << Level::warning << "Range header ignored: " << value;
 *     context << "kind" << Level::info << "message";
 *
 * The item is appended when the statement ends. Creating and destroying a context are logged too, so a context's
 * items can be bracketed in time.
 */
class Context final
{
private:
    struct KindOnly;

    /**
     * The item being written by the current statement.
     */
    class PendingItem final
    {
    public:
        ~PendingItem();

        PendingItem(const PendingItem &) = delete;
        PendingItem &operator=(const PendingItem &) = delete;

        template <typename T>
        PendingItem &operator<<(T &&value)
        {
            message << std::forward<T>(value);
            return *this;
        }

    private:
        friend class Context;
        friend struct KindOnly;

        PendingItem(Context &context, Level level, std::string_view kind);

        Context &context;
        const std::chrono::steady_clock::time_point steadyTime;
        const std::chrono::system_clock::time_point systemTime;
        const Level level;
        std::string kind;
        std::ostringstream message;
    };

    /**
     * What `context << "kind"` gives: it still needs a level.
     */
    struct KindOnly final
    {
        PendingItem operator<<(Level level)
        {
            return PendingItem(context, level, kind);
        }

        Context &context;
        std::string_view kind;
    };

public:
    ~Context();

    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    /**
     * Start an item with no kind.
     */
    PendingItem operator<<(Level level)
    {
        return PendingItem(*this, level, {});
    }

    /**
     * Start an item with a kind, e.g: "endpoints". The level comes next.
     */
    KindOnly operator<<(std::string_view kind)
    {
        return { *this, kind };
    }

private:
    friend class Log;

    /**
     * @param index Contexts with the same name are told apart by this.
     */
    Context(Log &log, std::string name, size_t index);

    void append(PendingItem &item);

    Log &log;
    const std::chrono::steady_clock::time_point steadyCreationTime;
    const std::string name;
    const size_t index;
};

/**
 * A log.
 *
 * Appending never suspends: items are queued, and a coroutine hands them to store() one at a time, in order.
 * Subclasses decide where they end up.
 */
class Log
{
public:
    virtual ~Log();

    Log(const Log &) = delete;
    Log &operator=(const Log &) = delete;

    /**
     * Create a context. The name must not be empty.
     */
    Context operator()(std::string_view name);

    /**
     * Get an item by its position in the log, including items that are still queued.
     */
    Awaitable<Item> operator[](size_t index) const;

    /**
     * The number of items, including items that are still queued.
     */
    size_t size() const
    {
        return storedItems + queue.size();
    }

protected:
    /**
     * @param minLevel Items below this level are dropped.
     * @param print Also print each item to stderr, in colour.
     */
    Log(Level minLevel, bool print, IOContext &ioc);

    IOContext &ioc;

private:
    friend class Context;

    /**
     * Load an item that was previously stored.
     */
    virtual Awaitable<Item> load(size_t index) const = 0;

    /**
     * Store the next item. Calls don't overlap.
     */
    virtual Awaitable<void> store(Item item) = 0;

    /**
     * Filter an item by level, and queue it if it's kept.
     */
    void append(Item item);

    void enqueue(Item item);

    /**
     * Store queued items until the queue is empty.
     */
    Awaitable<void> drain();

    const std::chrono::steady_clock::time_point steadyCreationTime;

    const Level minLevel;
    const bool print;

    size_t storedItems = 0;

    /**
     * The next index for each context name.
     */
    std::map<std::string, size_t, std::less<>> contextIndices;

    /**
     * Items not yet stored. The front one is being stored if the queue is non-empty.
     */
    std::deque<Item> queue;
};

} // namespace Log

/// @}
