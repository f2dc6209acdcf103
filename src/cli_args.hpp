#ifndef CLI_ARGS_HPP
#define CLI_ARGS_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cli {

/// Subcommands of the tool.
enum class Command : std::uint8_t {
    Mkfs,
    MkfsConfig,
    GetKey,
    ListFs
};

/// Parsed command line.
struct CliArgs {
    Command command{Command::ListFs};

    // mkfs, mkfs-config
    std::string path{};
    std::string fstype{};
    std::string config_file{};
    std::optional<std::string> label{};
    std::optional<std::string> uuid{};
    bool strict{false};
    bool force{false};
    bool dry_run{false};

    // getkey
    std::string keyid{};
    std::optional<std::string> keyserver{};
};

/// Converts a string to Command.
[[nodiscard]] auto command_from_string(std::string_view command_str) noexcept -> std::optional<Command>;

/// Parses the arguments following the program name.
/// @param args The command line arguments, without argv[0].
/// @return CliArgs on success, or error string on failure.
[[nodiscard]] auto parse_cli_args(const std::vector<std::string_view>& args) noexcept
    -> std::expected<CliArgs, std::string>;

/// Usage text printed on errors.
[[nodiscard]] auto usage() noexcept -> std::string_view;

}  // namespace cli

#endif  // CLI_ARGS_HPP
