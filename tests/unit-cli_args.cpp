#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "cli_args.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_literals;
using namespace std::string_view_literals;

TEST_CASE("cli args parsing")
{
    SECTION("mkfs with every option")
    {
        const std::vector args{"mkfs"sv, "--strict"sv, "--force"sv, "--label"sv, "cloudimg-rootfs"sv, "--uuid=6bdb3301"sv, "/dev/vda1"sv, "ext4"sv};
        const auto& result = cli::parse_cli_args(args);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->command, cli::Command::Mkfs);
        REQUIRE_EQ(result->path, "/dev/vda1"s);
        REQUIRE_EQ(result->fstype, "ext4"s);
        REQUIRE_EQ(result->label, "cloudimg-rootfs"s);
        REQUIRE_EQ(result->uuid, "6bdb3301"s);
        REQUIRE(result->strict);
        REQUIRE(result->force);
        REQUIRE(!result->dry_run);
    }
    SECTION("mkfs dry run")
    {
        const auto& result = cli::parse_cli_args({"mkfs"sv, "/dev/sda1"sv, "fat32"sv, "--dry-run"sv});
        REQUIRE(result.has_value());
        REQUIRE(result->dry_run);
        REQUIRE(!result->label.has_value());
    }
    SECTION("mkfs-config")
    {
        const auto& result = cli::parse_cli_args({"mkfs-config"sv, "/dev/sda2"sv, "format.json"sv});
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->command, cli::Command::MkfsConfig);
        REQUIRE_EQ(result->path, "/dev/sda2"s);
        REQUIRE_EQ(result->config_file, "format.json"s);
    }
    SECTION("getkey")
    {
        const auto& result = cli::parse_cli_args({"getkey"sv, "--keyserver"sv, "keys.openpgp.org"sv, "0x1A2B3C4D"sv});
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->command, cli::Command::GetKey);
        REQUIRE_EQ(result->keyid, "0x1A2B3C4D"s);
        REQUIRE_EQ(result->keyserver, "keys.openpgp.org"s);
    }
    SECTION("list-fs")
    {
        const auto& result = cli::parse_cli_args({"list-fs"sv});
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->command, cli::Command::ListFs);
    }
    SECTION("options after positionals")
    {
        const auto& result = cli::parse_cli_args({"mkfs"sv, "/dev/sdb1"sv, "btrfs"sv, "--label=data"sv, "--force"sv});
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->fstype, "btrfs"s);
        REQUIRE_EQ(result->label, "data"s);
        REQUIRE(result->force);
        REQUIRE(!result->uuid.has_value());
    }
    SECTION("errors name the subcommand and the offending option")
    {
        const auto& missing_fstype = cli::parse_cli_args({"mkfs"sv, "/dev/sda1"sv});
        REQUIRE(!missing_fstype.has_value());
        REQUIRE(missing_fstype.error().starts_with("mkfs: "));
        REQUIRE(missing_fstype.error().contains("fstype"));

        const auto& unknown_option = cli::parse_cli_args({"getkey"sv, "--uuid"sv, "x"sv, "0x1A2B3C4D"sv});
        REQUIRE(!unknown_option.has_value());
        REQUIRE(unknown_option.error().starts_with("getkey: "));
        REQUIRE(unknown_option.error().contains("uuid"));
    }
    SECTION("invalid command lines")
    {
        REQUIRE(!cli::parse_cli_args({}).has_value());
        REQUIRE_EQ(cli::parse_cli_args({"format"sv}).error(), "unknown command 'format'"s);
        REQUIRE(!cli::parse_cli_args({"mkfs"sv, "/dev/sda1"sv}).has_value());
        REQUIRE(!cli::parse_cli_args({"mkfs"sv, "/dev/sda1"sv, "ext4"sv, "--label"sv}).has_value());
        REQUIRE(!cli::parse_cli_args({"mkfs"sv, "--force=yes"sv, "/dev/sda1"sv, "ext4"sv}).has_value());
        REQUIRE(!cli::parse_cli_args({"mkfs-config"sv, "--force"sv, "/dev/sda1"sv, "format.json"sv}).has_value());
        REQUIRE(!cli::parse_cli_args({"getkey"sv, "--label"sv, "x"sv, "0x1A2B3C4D"sv}).has_value());
        REQUIRE(!cli::parse_cli_args({"list-fs"sv, "ext4"sv}).has_value());
    }
}
