#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

/// @addtogroup asio
/// @{

/**
 * The return type of every coroutine in the server, e.g: `Awaitable<void> listen();`.
 *
 * Kept apart from asio.hpp so headers that only declare coroutines stay light.
 */
template <typename T>
using Awaitable = boost::asio::awaitable<T, boost::asio::any_io_executor>;

/// @}
