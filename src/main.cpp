#include "cli_args.hpp"     // for parse_cli_args
#include "config.hpp"       // for Config
#include "definitions.hpp"  // for error_inter

// import osprep
#include "osprep/file_utils.hpp"
#include "osprep/gpg.hpp"
#include "osprep/io_utils.hpp"
#include "osprep/logger.hpp"
#include "osprep/mkfs.hpp"
#include "osprep/mkfs_flags.hpp"
#include "osprep/string_utils.hpp"

#include <filesystem>  // for exists
#include <string>      // for string
#include <vector>      // for vector

#include <spdlog/common.h>                   // for level
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_mt
#include <spdlog/spdlog.h>                   // for set_default_logger, set_level

namespace {

auto report_error(const osprep::Error& error) noexcept -> int {
    error_inter("{}: {}\n", osprep::error_kind_to_string(error.kind), error.message);
    return 1;
}

auto run_mkfs(const cli::CliArgs& args) noexcept -> int {
    const osprep::fs::MkfsRequest request{
        .path   = args.path,
        .fstype = args.fstype,
        .label  = args.label,
        .uuid   = args.uuid,
        .force  = args.force,
        .strict = args.strict,
    };

    if (args.dry_run) {
        auto& executor                = osprep::utils::default_executor();
        const auto& platform_codename = request.force ? executor.platform_codename() : std::string{};
        const auto& cmd               = osprep::fs::build_mkfs_command(request, platform_codename);
        if (!cmd) {
            return report_error(cmd.error());
        }
        output_inter("{}\n", osprep::utils::join(*cmd, " "));
        return 0;
    }

    const auto& result = osprep::fs::make_filesystem(request);
    if (!result) {
        return report_error(result.error());
    }
    success_inter("Created {} filesystem on {}\n", args.fstype, args.path);
    return 0;
}

auto run_mkfs_config(const cli::CliArgs& args) noexcept -> int {
    std::error_code err{};
    if (!std::filesystem::exists(args.config_file, err)) {
        error_inter("config file '{}' does not exist\n", args.config_file);
        return 1;
    }

    const auto& content = osprep::file_utils::read_whole_file(args.config_file);
    const auto& info    = osprep::fs::parse_filesystem_info(content);
    if (!info) {
        return report_error(info.error());
    }

    const auto& result = osprep::fs::make_filesystem_from_config(args.path, *info, args.strict);
    if (!result) {
        return report_error(result.error());
    }
    success_inter("Created {} filesystem on {}\n", info->fstype.value_or(""), args.path);
    return 0;
}

auto run_getkey(const cli::CliArgs& args) noexcept -> int {
    const auto& config_data = Config::instance()->data();
    const auto& keyserver   = args.keyserver.value_or(config_data.at("KEYSERVER"));

    const auto& armour = osprep::gpg::get_key_by_id(args.keyid, keyserver);
    if (!armour) {
        return report_error(armour.error());
    }
    output_inter("{}\n", *armour);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string_view> args(argv + 1, argv + argc);
    const auto& cli_args = cli::parse_cli_args(args);
    if (!cli_args) {
        error_inter("{}\n", cli_args.error());
        output_inter("{}", cli::usage());
        return 2;
    }

    // Initialize default config.
    if (!Config::initialize()) {
        return 1;
    }
    const auto& config_data = Config::instance()->data();

    // Initialize logger.
    auto logger = spdlog::stderr_color_mt("osprep_logger");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::from_str(config_data.at("LOG_LEVEL")));

    // Set osprep logger.
    osprep::logger::set_logger(logger);

    int ret{};
    switch (cli_args->command) {
    case cli::Command::Mkfs:
        ret = run_mkfs(*cli_args);
        break;
    case cli::Command::MkfsConfig:
        ret = run_mkfs_config(*cli_args);
        break;
    case cli::Command::GetKey:
        ret = run_getkey(*cli_args);
        break;
    case cli::Command::ListFs:
        for (auto&& fstype : osprep::fs::supported_filesystems()) {
            output_inter("{}\t{}\n", fstype, osprep::fs::family_of(fstype));
        }
        break;
    }

    spdlog::shutdown();
    return ret;
}
