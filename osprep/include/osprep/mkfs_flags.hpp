#ifndef MKFS_FLAGS_HPP
#define MKFS_FLAGS_HPP

#include "osprep/error.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace osprep::fs {

/// Logical mkfs flags, translated per filesystem family.
enum class MkfsFlag : std::uint8_t {
    Label,
    Uuid,
    Force,
    FatSize,
    Quiet
};

/// Converts a string to MkfsFlag.
/// @param flag_name The logical flag name ("label", "uuid", "force", "fatsize", "quiet").
/// @return The MkfsFlag or std::nullopt if invalid.
[[nodiscard]] auto mkfs_flag_from_string(std::string_view flag_name) noexcept -> std::optional<MkfsFlag>;

/// Converts MkfsFlag to string.
[[nodiscard]] auto mkfs_flag_to_string(MkfsFlag flag) noexcept -> std::string_view;

/// @brief Get the family sharing mkfs flag syntax with fstype, e.g ext4 -> ext.
/// @return The family, or fstype itself when it is not grouped.
[[nodiscard]] auto family_of(std::string_view fstype) noexcept -> std::string_view;

/// @brief Get the external tool creating fstype, e.g ext4 -> mkfs.ext4.
/// @return The tool name or std::nullopt if fstype is not supported.
[[nodiscard]] auto mkfs_command_for(std::string_view fstype) noexcept -> std::optional<std::string_view>;

/// @brief Get the maximum filesystem label length (in characters) of a family.
[[nodiscard]] auto label_length_limit(std::string_view family) noexcept -> std::optional<std::size_t>;

/// @brief Get the concrete token of a flag for a family, e.g (Label, ext) -> -L.
[[nodiscard]] auto flag_token(MkfsFlag flag, std::string_view family) noexcept -> std::optional<std::string_view>;

/// @brief List every fstype that can be created.
[[nodiscard]] auto supported_filesystems() noexcept -> std::vector<std::string_view>;

/// @brief Translate a logical flag into command-line arguments for a family.
/// @param flag_name The logical flag name.
/// @param family The filesystem family.
/// @param param Value appended after the flag token.
/// @param strict Whether a flag unsupported by the family is an error.
/// @return Zero or one token, followed by param when given. Configuration
/// error for an unknown flag name, UnsupportedFlag error when strict and the
/// family lacks the flag.
[[nodiscard]] auto resolve_flag(std::string_view flag_name, std::string_view family,
    std::optional<std::string_view> param = std::nullopt, bool strict = false) noexcept -> Result<std::vector<std::string>>;

/// @brief Same as above for an already validated flag.
[[nodiscard]] auto resolve_flag(MkfsFlag flag, std::string_view family,
    std::optional<std::string_view> param = std::nullopt, bool strict = false) noexcept -> Result<std::vector<std::string>>;

}  // namespace osprep::fs

#endif  // MKFS_FLAGS_HPP
