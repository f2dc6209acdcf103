#include "osprep/string_utils.hpp"

namespace {

constexpr auto is_ascii_letter(char ch) noexcept -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr auto is_utf8_continuation(char ch) noexcept -> bool {
    return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

}  // namespace

namespace osprep::utils {

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto rstrip_newlines(std::string_view str) noexcept -> std::string_view {
    while (str.ends_with('\n')) {
        str.remove_suffix(1);
    }
    return str;
}

auto strip_ascii_letters(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && is_ascii_letter(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_ascii_letter(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto unquote(std::string_view str) noexcept -> std::string_view {
    if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'') && str.back() == str.front()) {
        return str.substr(1, str.size() - 2);
    }
    return str;
}

auto utf8_length(std::string_view str) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(str, [](char ch) { return !is_utf8_continuation(ch); }));
}

auto utf8_prefix(std::string_view str, std::size_t max_chars) noexcept -> std::string_view {
    std::size_t chars{};
    for (std::size_t pos = 0; pos < str.size(); ++pos) {
        if (is_utf8_continuation(str[pos])) {
            continue;
        }
        if (chars == max_chars) {
            return str.substr(0, pos);
        }
        ++chars;
    }
    return str;
}

}  // namespace osprep::utils
