#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>    // for transform
#include <cstddef>      // for size_t
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace osprep::utils {

/// @brief Split a string into views of multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A vector of string views representing the split lines.
auto make_multiline_view(std::string_view str, char delim = '\n') noexcept -> std::vector<std::string_view>;

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Remove every trailing newline character.
auto rstrip_newlines(std::string_view str) noexcept -> std::string_view;

/// @brief Remove leading and trailing ASCII letters, e.g "fat32" -> "32".
auto strip_ascii_letters(std::string_view str) noexcept -> std::string_view;

/// @brief Remove one pair of matching surrounding quotes, if any.
auto unquote(std::string_view str) noexcept -> std::string_view;

/// @brief Number of UTF-8 code points in str.
///
/// Counts every byte that is not a continuation byte, so malformed input
/// is still given a length.
auto utf8_length(std::string_view str) noexcept -> std::size_t;

/// @brief Leading part of str holding at most max_chars code points.
/// @return A prefix of str ending on a code point boundary.
auto utf8_prefix(std::string_view str, std::size_t max_chars) noexcept -> std::string_view;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto second = [](auto&& rng) { return rng != ""; };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::transform(functor)
        | std::ranges::views::filter(second);
}

}  // namespace osprep::utils

#endif  // STRING_UTILS_HPP
