#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "osprep/os_release.hpp"

#include <string>
#include <string_view>

using namespace std::string_literals;
using namespace std::string_view_literals;

static constexpr auto UBUNTU_OS_RELEASE = R"(PRETTY_NAME="Ubuntu 12.04.5 LTS"
NAME="Ubuntu"
VERSION_ID="12.04"
VERSION="12.04.5 LTS, Precise Pangolin"
VERSION_CODENAME=precise
ID=ubuntu
ID_LIKE=debian
HOME_URL="https://www.ubuntu.com/"
UBUNTU_CODENAME=precise
)"sv;

static constexpr auto ARCH_OS_RELEASE = R"(NAME="Arch Linux"
PRETTY_NAME="Arch Linux"
ID=arch
BUILD_ID=rolling
ANSI_COLOR="38;2;23;147;209"
HOME_URL="https://archlinux.org/"
LOGO=archlinux-logo
)"sv;

TEST_CASE("os-release parse test")
{
    SECTION("quoted and unquoted values")
    {
        REQUIRE_EQ(osprep::os_release::get_value(UBUNTU_OS_RELEASE, "NAME"sv), "Ubuntu"s);
        REQUIRE_EQ(osprep::os_release::get_value(UBUNTU_OS_RELEASE, "ID"sv), "ubuntu"s);
        REQUIRE_EQ(osprep::os_release::get_value(UBUNTU_OS_RELEASE, "VERSION"sv), "12.04.5 LTS, Precise Pangolin"s);
    }
    SECTION("key must match exactly")
    {
        REQUIRE_EQ(osprep::os_release::get_value(UBUNTU_OS_RELEASE, "ID_LIKE"sv), "debian"s);
        REQUIRE(!osprep::os_release::get_value(UBUNTU_OS_RELEASE, "VERSION_"sv).has_value());
    }
    SECTION("codename")
    {
        REQUIRE_EQ(osprep::os_release::parse_codename(UBUNTU_OS_RELEASE), "precise"sv);
        REQUIRE_EQ(osprep::os_release::parse_codename(ARCH_OS_RELEASE), ""sv);
        REQUIRE_EQ(osprep::os_release::parse_codename(""sv), ""sv);
    }
    SECTION("ubuntu codename fallback")
    {
        static constexpr auto content = "# comment\nVERSION_CODENAME=\nUBUNTU_CODENAME=\"noble\"\n"sv;
        REQUIRE_EQ(osprep::os_release::parse_codename(content), "noble"sv);
    }
}
