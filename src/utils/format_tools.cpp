#include "sfh_base.hpp"

#include <cctype>
#include <limits>

namespace sfhost::format_tools
{

// Computes the fractional microsecond part separately so the output does not
// depend on the fmt chrono subsecond support of the installed fmt version.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::optional<int> parse_leading_int(std::string_view text) noexcept
{
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0)
        ++pos;

    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        negative = (text[pos] == '-');
        ++pos;
    }

    const size_t digits_begin = pos;
    long long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0)
    {
        value = value * 10 + (text[pos] - '0');
        if (value > std::numeric_limits<int>::max())
            return std::nullopt;
        ++pos;
    }
    if (pos == digits_begin)
        return std::nullopt;

    return static_cast<int>(negative ? -value : value);
}

} // namespace sfhost::format_tools
