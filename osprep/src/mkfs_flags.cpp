#include "osprep/mkfs_flags.hpp"

#include <algorithm>  // for find_if
#include <array>      // for array
#include <ranges>     // for ranges::*
#include <utility>    // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using StringPair = std::pair<std::string_view, std::string_view>;

static constexpr std::array<StringPair, 13> MKFS_COMMANDS{{
    {"btrfs"sv, "mkfs.btrfs"sv},
    {"ext2"sv, "mkfs.ext2"sv},
    {"ext3"sv, "mkfs.ext3"sv},
    {"ext4"sv, "mkfs.ext4"sv},
    {"fat"sv, "mkfs.fat"sv},
    {"fat12"sv, "mkfs.fat"sv},
    {"fat16"sv, "mkfs.fat"sv},
    {"fat32"sv, "mkfs.fat"sv},
    {"jfs"sv, "jfs_mkfs"sv},
    {"ntfs"sv, "mkntfs"sv},
    {"reiserfs"sv, "mkfs.reiserfs"sv},
    {"swap"sv, "mkswap"sv},
    {"xfs"sv, "mkfs.xfs"sv},
}};

static constexpr std::array<StringPair, 6> SPECIFIC_TO_FAMILY{{
    {"ext2"sv, "ext"sv},
    {"ext3"sv, "ext"sv},
    {"ext4"sv, "ext"sv},
    {"fat12"sv, "fat"sv},
    {"fat16"sv, "fat"sv},
    {"fat32"sv, "fat"sv},
}};

static constexpr std::array<std::pair<std::string_view, std::size_t>, 8> LABEL_LENGTH_LIMITS{{
    {"btrfs"sv, 256},
    {"ext"sv, 16},
    {"fat"sv, 11},
    {"jfs"sv, 16},  // see jfs_tune manpage
    {"ntfs"sv, 32},
    {"reiserfs"sv, 16},
    {"swap"sv, 15},  // found experimentally
    {"xfs"sv, 12},
}};

struct FlagToken final {
    osprep::fs::MkfsFlag flag;
    std::string_view family;
    std::string_view token;
};

using osprep::fs::MkfsFlag;

static constexpr std::array<FlagToken, 23> FAMILY_FLAG_MAPPINGS{{
    {MkfsFlag::Label, "btrfs"sv, "--label"sv},
    {MkfsFlag::Label, "ext"sv, "-L"sv},
    {MkfsFlag::Label, "fat"sv, "-n"sv},
    {MkfsFlag::Label, "jfs"sv, "-L"sv},
    {MkfsFlag::Label, "ntfs"sv, "--label"sv},
    {MkfsFlag::Label, "reiserfs"sv, "--label"sv},
    {MkfsFlag::Label, "swap"sv, "--label"sv},
    {MkfsFlag::Label, "xfs"sv, "-L"sv},

    {MkfsFlag::Uuid, "btrfs"sv, "--uuid"sv},
    {MkfsFlag::Uuid, "ext"sv, "-U"sv},
    {MkfsFlag::Uuid, "reiserfs"sv, "--uuid"sv},
    {MkfsFlag::Uuid, "swap"sv, "--uuid"sv},

    {MkfsFlag::Force, "btrfs"sv, "--force"sv},
    {MkfsFlag::Force, "ext"sv, "-F"sv},
    {MkfsFlag::Force, "ntfs"sv, "--force"sv},
    {MkfsFlag::Force, "reiserfs"sv, "-f"sv},
    {MkfsFlag::Force, "swap"sv, "--force"sv},
    {MkfsFlag::Force, "xfs"sv, "-f"sv},

    {MkfsFlag::FatSize, "fat"sv, "-F"sv},

    {MkfsFlag::Quiet, "ext"sv, "-q"sv},
    {MkfsFlag::Quiet, "ntfs"sv, "-q"sv},
    {MkfsFlag::Quiet, "reiserfs"sv, "-q"sv},
    {MkfsFlag::Quiet, "xfs"sv, "--quiet"sv},
}};

constexpr auto find_value(const auto& table, std::string_view key) noexcept {
    return std::ranges::find_if(table, [key](auto&& entry) { return entry.first == key; });
}

}  // namespace

namespace osprep::fs {

auto mkfs_flag_from_string(std::string_view flag_name) noexcept -> std::optional<MkfsFlag> {
    if (flag_name == "label"sv) {
        return MkfsFlag::Label;
    }
    if (flag_name == "uuid"sv) {
        return MkfsFlag::Uuid;
    }
    if (flag_name == "force"sv) {
        return MkfsFlag::Force;
    }
    if (flag_name == "fatsize"sv) {
        return MkfsFlag::FatSize;
    }
    if (flag_name == "quiet"sv) {
        return MkfsFlag::Quiet;
    }
    return std::nullopt;
}

auto mkfs_flag_to_string(MkfsFlag flag) noexcept -> std::string_view {
    switch (flag) {
    case MkfsFlag::Label:
        return "label"sv;
    case MkfsFlag::Uuid:
        return "uuid"sv;
    case MkfsFlag::Force:
        return "force"sv;
    case MkfsFlag::FatSize:
        return "fatsize"sv;
    case MkfsFlag::Quiet:
        return "quiet"sv;
    }
    return "unknown"sv;
}

auto family_of(std::string_view fstype) noexcept -> std::string_view {
    const auto it = find_value(SPECIFIC_TO_FAMILY, fstype);
    return it != SPECIFIC_TO_FAMILY.end() ? it->second : fstype;
}

auto mkfs_command_for(std::string_view fstype) noexcept -> std::optional<std::string_view> {
    const auto it = find_value(MKFS_COMMANDS, fstype);
    if (it == MKFS_COMMANDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto label_length_limit(std::string_view family) noexcept -> std::optional<std::size_t> {
    const auto it = find_value(LABEL_LENGTH_LIMITS, family);
    if (it == LABEL_LENGTH_LIMITS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto flag_token(MkfsFlag flag, std::string_view family) noexcept -> std::optional<std::string_view> {
    const auto it = std::ranges::find_if(FAMILY_FLAG_MAPPINGS,
        [&](auto&& entry) { return entry.flag == flag && entry.family == family; });
    if (it == FAMILY_FLAG_MAPPINGS.end()) {
        return std::nullopt;
    }
    return it->token;
}

auto supported_filesystems() noexcept -> std::vector<std::string_view> {
    return MKFS_COMMANDS
        | std::ranges::views::transform([](auto&& entry) { return entry.first; })
        | std::ranges::to<std::vector<std::string_view>>();
}

auto resolve_flag(std::string_view flag_name, std::string_view family,
    std::optional<std::string_view> param, bool strict) noexcept -> Result<std::vector<std::string>> {
    const auto flag = fs::mkfs_flag_from_string(flag_name);
    if (!flag) {
        return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("unsupported flag '{}'"), flag_name));
    }
    return fs::resolve_flag(*flag, family, param, strict);
}

auto resolve_flag(MkfsFlag flag, std::string_view family,
    std::optional<std::string_view> param, bool strict) noexcept -> Result<std::vector<std::string>> {
    const auto token = fs::flag_token(flag, family);
    if (!token) {
        if (strict) {
            return make_error(ErrorKind::UnsupportedFlag,
                fmt::format(FMT_COMPILE("flag '{}' not supported by fs family '{}'"), fs::mkfs_flag_to_string(flag), family));
        }
        return std::vector<std::string>{};
    }

    std::vector<std::string> args{std::string{*token}};
    if (param) {
        args.emplace_back(*param);
    }
    return args;
}

}  // namespace osprep::fs
