#include "asio.hpp"

#include "log/Log.hpp"

void spawnDetached(IOContext &ioc, Log::Context &log, std::string_view what, std::function<Awaitable<void>()> fn,
                   Log::Level level)
{
    spawnDetached(ioc, [fn = std::move(fn), &log, what = std::string(what), level]() -> Awaitable<void> {
        try {
            co_await fn();
        }
        catch (const std::exception &e) {
            log << "exception" << level << what << " stopped: " << e.what();
        }
    });
}
