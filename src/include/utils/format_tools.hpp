// Tools for formatting string
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "sfhost_export.h"

namespace sfhost::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
SFHOST_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Parses the leading base-10 integer of a string.
 *
 * Leading whitespace and an optional sign are accepted; parsing stops at the
 * first non-digit. "120px" yields 120, "abc" and "" yield std::nullopt.
 * Values outside the int range yield std::nullopt.
 */
SFHOST_EXPORT std::optional<int> parse_leading_int(std::string_view text) noexcept;

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    return (pos == std::string_view::npos) ? file_path : file_path.substr(pos + 1);
}

} // namespace sfhost::format_tools
