#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "fake_executor.hpp"

#include "osprep/gpg.hpp"
#include "osprep/logger.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

static constexpr auto KEY_ID = "0x1A2B3C4D5E6F7081"sv;
static constexpr auto ARMOUR = "-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nmQINBFit2ioBEADhWpZ8/wvZ6hUTiXOwQHXMAlaFHcPH9hAtr4F1y2+OYdbtMuth\n-----END PGP PUBLIC KEY BLOCK-----"sv;

const std::vector<std::string> EXPORT_CMD{"gpg"s, "--export"s, "--armour"s, std::string{KEY_ID}};
const std::vector<std::string> RECV_CMD{"gpg"s, "--keyserver"s, "keyserver.ubuntu.com"s, "--recv"s, std::string{KEY_ID}};
const std::vector<std::string> DELETE_CMD{"gpg"s, "--batch"s, "--yes"s, "--delete-keys"s, std::string{KEY_ID}};

}  // namespace

TEST_CASE("gpg key resolve test")
{
    std::vector<std::string> warnings{};
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([&warnings](const spdlog::details::log_msg& msg) {
        if (msg.level == spdlog::level::warn) {
            warnings.emplace_back(msg.payload.data(), msg.payload.size());
        }
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    osprep::logger::set_logger(logger);

    osprep::tests::FakeExecutor executor{};

    SECTION("key already on the system")
    {
        executor.push_output(std::string{ARMOUR} + "\n\n");

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(armour.has_value());
        REQUIRE_EQ(*armour, ARMOUR);
        REQUIRE(!armour->ends_with('\n'));
        REQUIRE_EQ(executor.commands, std::vector<std::vector<std::string>>{EXPORT_CMD});
    }
    SECTION("key received from keyserver and deleted afterwards")
    {
        executor.push_failure("gpg: WARNING: nothing exported");
        executor.push_output("");
        executor.push_output(std::string{ARMOUR} + "\n");

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(armour.has_value());
        REQUIRE_EQ(*armour, ARMOUR);
        REQUIRE_EQ(executor.commands, std::vector{EXPORT_CMD, RECV_CMD, EXPORT_CMD, DELETE_CMD});
    }
    SECTION("empty export counts as missing key")
    {
        executor.push_output("");
        executor.push_output("");
        executor.push_output(std::string{ARMOUR});

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(armour.has_value());
        REQUIRE_EQ(*armour, ARMOUR);
        REQUIRE_EQ(executor.commands.size(), 4);
    }
    SECTION("key still missing after receive")
    {
        executor.push_failure("gpg: WARNING: nothing exported");
        executor.push_output("");
        executor.push_failure("gpg: WARNING: nothing exported");

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(!armour.has_value());
        REQUIRE_EQ(armour.error().kind, osprep::ErrorKind::KeyFetch);
        REQUIRE_EQ(executor.commands, std::vector{EXPORT_CMD, RECV_CMD, EXPORT_CMD, DELETE_CMD});
    }
    SECTION("receive failure is reported after cleanup")
    {
        executor.push_failure("gpg: WARNING: nothing exported");
        executor.push_failure("gpg: keyserver receive failed: No data");

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, "keyserver.example.org"sv, executor);
        REQUIRE(!armour.has_value());
        REQUIRE_EQ(armour.error().kind, osprep::ErrorKind::KeyFetch);
        REQUIRE(armour.error().message.contains(KEY_ID));
        REQUIRE(armour.error().message.contains("keyserver.example.org"));
        REQUIRE(armour.error().message.contains("No data"));

        REQUIRE_EQ(executor.commands.size(), 3);
        REQUIRE_EQ(executor.commands[1], std::vector{"gpg"s, "--keyserver"s, "keyserver.example.org"s, "--recv"s, std::string{KEY_ID}});
        REQUIRE_EQ(executor.commands[2], DELETE_CMD);
    }
    SECTION("delete failure is only a warning")
    {
        executor.push_output("");
        executor.push_output("");
        executor.push_output(std::string{ARMOUR});
        executor.push_failure("gpg: key not found");

        const auto& armour = osprep::gpg::get_key_by_id(KEY_ID, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(armour.has_value());
        REQUIRE_EQ(*armour, ARMOUR);
        REQUIRE_EQ(warnings.size(), 1);
        REQUIRE(warnings[0].contains(KEY_ID));
    }
    SECTION("empty key id")
    {
        const auto& armour = osprep::gpg::get_key_by_id(""sv, osprep::gpg::DEFAULT_KEYSERVER, executor);
        REQUIRE(!armour.has_value());
        REQUIRE_EQ(armour.error().kind, osprep::ErrorKind::KeyFetch);
        REQUIRE(executor.commands.empty());
    }
}

TEST_CASE("gpg key operations test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);

    osprep::tests::FakeExecutor executor{};

    SECTION("export failure is not an error")
    {
        executor.push_failure("gpg: WARNING: nothing exported");
        REQUIRE(!osprep::gpg::export_armour(KEY_ID, executor).has_value());
    }
    SECTION("export keeps the raw armour")
    {
        executor.push_output(std::string{ARMOUR} + "\n");
        REQUIRE_EQ(osprep::gpg::export_armour(KEY_ID, executor), std::string{ARMOUR} + "\n");
    }
    SECTION("receive")
    {
        REQUIRE(osprep::gpg::recv_key(KEY_ID, "keys.openpgp.org"sv, executor).has_value());
        REQUIRE_EQ(executor.commands[0], std::vector{"gpg"s, "--keyserver"s, "keys.openpgp.org"s, "--recv"s, std::string{KEY_ID}});
    }
    SECTION("delete")
    {
        osprep::gpg::delete_key(KEY_ID, executor);
        REQUIRE_EQ(executor.commands, std::vector<std::vector<std::string>>{DELETE_CMD});
    }
}
