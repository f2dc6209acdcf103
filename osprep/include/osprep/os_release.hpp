#ifndef OS_RELEASE_HPP
#define OS_RELEASE_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace osprep::os_release {

/// @brief Get the unquoted value of a KEY=value line in os-release(5) content.
/// @param content Content of /etc/os-release.
/// @param key The key to look up, e.g "VERSION_CODENAME".
/// @return The value, or std::nullopt if the key is absent.
auto get_value(std::string_view content, std::string_view key) noexcept -> std::optional<std::string>;

/// @brief Get the release codename from os-release(5) content.
///
/// VERSION_CODENAME is preferred, UBUNTU_CODENAME is used when it is missing
/// or empty.
/// @return The codename, empty string if none is present.
auto parse_codename(std::string_view content) noexcept -> std::string;

}  // namespace osprep::os_release

#endif  // OS_RELEASE_HPP
