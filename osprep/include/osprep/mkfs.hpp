#ifndef MKFS_HPP
#define MKFS_HPP

#include "osprep/error.hpp"
#include "osprep/io_utils.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace osprep::fs {

/// Parameters of a single filesystem creation.
struct MkfsRequest final {
    /// Device or file to format, must exist
    std::string path;
    /// Filesystem type, e.g "ext4", "fat32", "swap"
    std::string fstype;
    /// Filesystem label, truncated to the family limit unless strict
    std::optional<std::string> label{};
    /// Filesystem UUID
    std::optional<std::string> uuid{};
    /// Make mkfs proceed over existing data/filesystems
    bool force{false};
    /// Turn unsupported flags and too long labels into errors
    bool strict{false};
};

/// Filesystem section of a storage configuration.
struct FilesystemInfo final {
    std::optional<std::string> fstype{};
    std::optional<std::string> uuid{};
    std::optional<std::string> label{};
};

/// @brief Assemble the mkfs command line for a request, without running it.
///
/// The path is not checked here.
/// @param request What to create.
/// @param platform_codename Release codename of the running system, only
/// consulted when force is requested.
/// @return argv with the tool name first and the path last.
[[nodiscard]] auto build_mkfs_command(const MkfsRequest& request, std::string_view platform_codename) noexcept
    -> Result<std::vector<std::string>>;

/// @brief Make filesystem on block device with given path using given fstype
/// and appropriate flags for the filesystem family.
///
/// If the label is too long, it is an error in strict mode and truncated to
/// the maximum possible length otherwise. If a flag is not supported by the
/// family, it is an error in strict mode and silently ignored otherwise.
[[nodiscard]] auto make_filesystem(const MkfsRequest& request, utils::Executor& executor = utils::default_executor()) noexcept
    -> Result<void>;

/// @brief Make filesystem on block device according to storage configuration.
///
/// Old metadata on partitions that have not been wiped can cause some mkfs
/// tools to refuse to work, so force is always used.
[[nodiscard]] auto make_filesystem_from_config(std::string_view path, const FilesystemInfo& info, bool strict = false,
    utils::Executor& executor = utils::default_executor()) noexcept -> Result<void>;

/// @brief Parse FilesystemInfo from JSON object content.
/// @param json_content e.g {"fstype": "ext4", "label": "root"}.
/// @return FilesystemInfo on success, or Configuration error.
[[nodiscard]] auto parse_filesystem_info(std::string_view json_content) noexcept -> Result<FilesystemInfo>;

}  // namespace osprep::fs

#endif  // MKFS_HPP
