#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
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
 * Concatenate vectors of vectors of bytes.
 */
std::vector<std::byte> concatenate(std::vector<std::vector<std::byte>> dataParts);

/**
 * Synchronously read the contents of a file.
 */
std::vector<std::byte> readFile(const std::filesystem::path &path);

/**
 * Synchronously write a file, replacing anything that's already there.
 */
void writeFile(const std::filesystem::path &path, std::string_view contents);

/**
 * Parse an integer represented as a string to a 64-bit signed integer.
 *
 * @param string The string representing the integer.
 * @return The parsed integer.
 * @throws std::invalid_argument If the whole string is not an integer. Unlike the C++ string to integer conversion
 *                               functions, leading whitespace, trailing garbage and an empty string are all rejected.
 * @throws std::out_of_range If the integer doesn't fit.
 */
int64_t parseInt64(std::string_view string);

/**
 * Check whether a string ends with a suffix, ignoring ASCII case.
 */
bool endsWithCaseInsensitive(std::string_view string, std::string_view suffix);

} // namespace Util

/// @}
