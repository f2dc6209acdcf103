#include "osprep/os_release.hpp"
#include "osprep/string_utils.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace osprep::os_release {

auto get_value(std::string_view content, std::string_view key) noexcept -> std::optional<std::string> {
    for (auto&& line : utils::make_split_view(content)) {
        if (line.starts_with('#')) {
            continue;
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos || line.substr(0, eq_pos) != key) {
            continue;
        }
        return std::make_optional<std::string>(utils::unquote(line.substr(eq_pos + 1)));
    }
    return std::nullopt;
}

auto parse_codename(std::string_view content) noexcept -> std::string {
    for (auto&& key : {"VERSION_CODENAME"sv, "UBUNTU_CODENAME"sv}) {
        auto value = os_release::get_value(content, key);
        if (value && !value->empty()) {
            return std::move(*value);
        }
    }
    return {};
}

}  // namespace osprep::os_release
