#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <string_view>
#include <vector>

/**
 * @defgroup util Miscellaneous utilities
 */
/// @addtogroup util
/// @{

/**
 * Miscellaneous utilities.
 */
namespace Util
{

/**
 * Read a whole file, blocking. For startup, and for tests.
 *
 * @throws std::ios::failure if the file can't be opened or read.
 */
std::vector<std::byte> readFile(const std::filesystem::path &path);

/**
 * Split a string into exactly as many parts as are given, e.g: "100-199" into { first, last }.
 *
 * The parts refer to the original string.
 *
 * @throws std::invalid_argument If the separator does not appear exactly `parts.size() - 1` times.
 */
void split(std::string_view string, std::initializer_list<std::reference_wrapper<std::string_view>> parts,
           char separator = ' ');

/**
 * Parse a non-negative decimal integer.
 *
 * Only the digits 0-9 are accepted: no sign, no whitespace, no prefix.
 *
 * @throws std::invalid_argument if the string is empty or contains anything other than digits.
 * @throws std::out_of_range if the value doesn't fit in 64 bits.
 */
uint64_t parseUint64(std::string_view string);

/**
 * Remove leading and trailing spaces and tabs.
 */
std::string_view trim(std::string_view string);

} // namespace Util

/// @}
