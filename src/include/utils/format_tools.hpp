// Tools for formatting strings and comparing names
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace conduit::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
CONDUIT_RUNTIME_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// ASCII lower-case copy of @p s.
CONDUIT_RUNTIME_EXPORT std::string to_lower(std::string_view s);

/// ASCII case-insensitive equality.
CONDUIT_RUNTIME_EXPORT bool iequals(std::string_view a, std::string_view b) noexcept;

/// ASCII case-insensitive "starts with".
CONDUIT_RUNTIME_EXPORT bool istarts_with(std::string_view s, std::string_view prefix) noexcept;

/**
 * @brief Renders a dependency path such as {"D", "E"} as "D -> E -> D".
 * @details The first element is repeated at the end so the loop is visible in log output.
 *          An empty input renders as an empty string.
 */
CONDUIT_RUNTIME_EXPORT std::string format_cycle(const std::vector<std::string> &members);

/// Strict-weak ordering for case-insensitive keyed containers.
struct CaseInsensitiveLess
{
    using is_transparent = void;
    CONDUIT_RUNTIME_EXPORT bool operator()(std::string_view a, std::string_view b) const noexcept;
};

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace conduit::format_tools
