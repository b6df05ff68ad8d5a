#pragma once

#include "log/Level.hpp"

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <functional>
#include <string_view>
#include "awaitable.hpp"

namespace Log
{

class Context;

} // namespace Log

/**
 * @defgroup asio Asynchronous IO
 *
 * Thin wrappers over boost::asio.
 */

/// @addtogroup asio
/// @{

/**
 * The event loop everything runs on. A class rather than an alias so headers can forward declare it.
 */
class IOContext final : public boost::asio::io_context
{
public:
    using boost::asio::io_context::io_context;
};

/**
 * Spawn a detached coroutine. Anything fn throws is lost.
 */
template <typename F>
void spawnDetached(IOContext &ioc, F &&fn)
{
    boost::asio::co_spawn((boost::asio::io_context &)ioc, std::forward<F>(fn), boost::asio::detached);
}

/**
 * Spawn a detached coroutine, logging any exception that escapes it.
 *
 * @param log Where to write the exception. Must outlive the coroutine.
 * @param what Names the coroutine in the log message, e.g: "Listening on [::]:8080".
 * @param level The level to log escaped exceptions at.
 */
void spawnDetached(IOContext &ioc, Log::Context &log, std::string_view what, std::function<Awaitable<void>()> fn,
                   Log::Level level = Log::Level::error);

/// @}
