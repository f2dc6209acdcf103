#include "cli_args.hpp"

#include <expected>  // for expected, unexpected
#include <iterator>  // for next

#include <boost/program_options.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

namespace po = boost::program_options;

using namespace std::string_view_literals;

namespace {

static constexpr auto USAGE = R"(usage:
  osprep mkfs [--strict] [--force] [--dry-run] [--label L] [--uuid U] <path> <fstype>
  osprep mkfs-config [--strict] <path> <config.json>
  osprep getkey [--keyserver S] <keyid>
  osprep list-fs
)"sv;

// Registers the options and positional arguments accepted by command.
// Switches and positionals are written straight into cli_args.
void describe_command(cli::Command command, cli::CliArgs& cli_args, po::options_description& desc, po::positional_options_description& positional) {
    switch (command) {
    case cli::Command::Mkfs:
        desc.add_options()
            ("strict", po::bool_switch(&cli_args.strict), "Fail instead of truncating labels or dropping unsupported flags")
            ("force", po::bool_switch(&cli_args.force), "Overwrite an existing filesystem")
            ("dry-run", po::bool_switch(&cli_args.dry_run), "Print the mkfs command instead of running it")
            ("label", po::value<std::string>(), "Filesystem label")
            ("uuid", po::value<std::string>(), "Filesystem UUID")
            ("path", po::value<std::string>(&cli_args.path)->required(), "Device or image path")
            ("fstype", po::value<std::string>(&cli_args.fstype)->required(), "Filesystem type");
        positional.add("path", 1).add("fstype", 1);
        break;
    case cli::Command::MkfsConfig:
        desc.add_options()
            ("strict", po::bool_switch(&cli_args.strict), "Fail instead of truncating labels or dropping unsupported flags")
            ("path", po::value<std::string>(&cli_args.path)->required(), "Device or image path")
            ("config", po::value<std::string>(&cli_args.config_file)->required(), "JSON file with fstype, uuid and label");
        positional.add("path", 1).add("config", 1);
        break;
    case cli::Command::GetKey:
        desc.add_options()
            ("keyserver", po::value<std::string>(), "Keyserver to receive the key from")
            ("keyid", po::value<std::string>(&cli_args.keyid)->required(), "Key id or fingerprint");
        positional.add("keyid", 1);
        break;
    case cli::Command::ListFs:
        break;
    }
}

auto optional_value(const po::variables_map& vm, const char* name) noexcept -> std::optional<std::string> {
    if (vm.count(name) == 0) {
        return std::nullopt;
    }
    return vm[name].as<std::string>();
}

}  // namespace

namespace cli {

auto command_from_string(std::string_view command_str) noexcept -> std::optional<Command> {
    if (command_str == "mkfs"sv) {
        return Command::Mkfs;
    }
    if (command_str == "mkfs-config"sv) {
        return Command::MkfsConfig;
    }
    if (command_str == "getkey"sv) {
        return Command::GetKey;
    }
    if (command_str == "list-fs"sv) {
        return Command::ListFs;
    }
    return std::nullopt;
}

auto parse_cli_args(const std::vector<std::string_view>& args) noexcept
    -> std::expected<CliArgs, std::string> {
    if (args.empty()) {
        return std::unexpected("no command given");
    }

    const auto command = command_from_string(args[0]);
    if (!command) {
        return std::unexpected(fmt::format(FMT_COMPILE("unknown command '{}'"), args[0]));
    }

    CliArgs cli_args{.command = *command};
    po::options_description desc{fmt::format(FMT_COMPILE("{} options"), args[0])};
    po::positional_options_description positional{};
    describe_command(*command, cli_args, desc, positional);

    const std::vector<std::string> command_args(std::next(args.cbegin()), args.cend());
    try {
        po::variables_map vm;
        po::parsed_options parsed = po::command_line_parser(command_args).options(desc).positional(positional).run();
        po::store(parsed, vm);
        po::notify(vm);

        if (*command == Command::Mkfs) {
            cli_args.label = optional_value(vm, "label");
            cli_args.uuid  = optional_value(vm, "uuid");
        } else if (*command == Command::GetKey) {
            cli_args.keyserver = optional_value(vm, "keyserver");
        }
    } catch (const po::error& e) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), args[0], e.what()));
    }
    return cli_args;
}

auto usage() noexcept -> std::string_view {
    return USAGE;
}

}  // namespace cli
