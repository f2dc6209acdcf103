#include "osprep/io_utils.hpp"
#include "osprep/file_utils.hpp"
#include "osprep/os_release.hpp"
#include "osprep/string_utils.hpp"

#include <unistd.h>  // for access, X_OK

#include <subprocess.h>

#include <cstdint>  // for int32_t, uint32_t
#include <cstdlib>  // for getenv

#include <algorithm>   // for transform
#include <array>       // for array
#include <bit>         // for bit_cast
#include <filesystem>  // for path, is_regular_file
#include <iterator>    // for back_inserter

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto OS_RELEASE_PATH = "/etc/os-release"sv;

using read_fn_t = unsigned (*)(subprocess_s* const, char* const, unsigned);

// Reads one stream of an async child until EOF.
void read_stream(subprocess_s* process, read_fn_t read_fn, std::string& sink) noexcept {
    std::array<char, 8192> buf{};
    std::uint32_t bytes_read{};
    do {
        bytes_read = read_fn(process, buf.data(), static_cast<std::uint32_t>(buf.size()));
        if (bytes_read > 0) {
            sink.append(buf.data(), bytes_read);
        }
    } while (bytes_read != 0);
}

auto is_executable_file(const std::filesystem::path& path) noexcept -> bool {
    std::error_code err{};
    return std::filesystem::is_regular_file(path, err) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

namespace osprep::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto SystemExecutor::execute(const std::vector<std::string>& argv) noexcept -> Result<ProcessOutput> {
    if (argv.empty()) {
        return make_error(ErrorKind::ProcessExecution, "cannot execute an empty command");
    }

    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := {}", argv);
    }

    std::vector<char*> args;
    std::transform(argv.cbegin(), argv.cend(), std::back_inserter(args),
        [=](const std::string& arg) -> char* { return std::bit_cast<char*>(arg.data()); });
    args.push_back(nullptr);

    subprocess_s process{};
    char** command                = args.data();
    static constexpr auto options = subprocess_option_enable_async | subprocess_option_inherit_environment | subprocess_option_search_user_path;
    if (subprocess_create(command, options, &process) != 0) {
        return make_error(ErrorKind::ProcessExecution, fmt::format(FMT_COMPILE("failed to spawn '{}'"), argv[0]));
    }

    // stdout is drained to EOF before stderr
    ProcessOutput output{};
    read_stream(&process, subprocess_read_stdout, output.out);
    read_stream(&process, subprocess_read_stderr, output.err);

    std::int32_t ret{};
    if (subprocess_join(&process, &ret) != 0) {
        if (subprocess_destroy(&process) != 0) {
            spdlog::warn("[exec] failed to release process handle of '{}'", argv[0]);
        }
        return make_error(ErrorKind::ProcessExecution, fmt::format(FMT_COMPILE("failed to join '{}'"), argv[0]));
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::warn("[exec] failed to release process handle of '{}'", argv[0]);
    }
    output.exit_code = ret;

    if (output.exit_code != 0) {
        return make_error(ErrorKind::ProcessExecution,
            fmt::format("Unexpected error while running command.\nCommand: {}\nExit code: {}\nStderr: {}",
                fmt::join(argv, " "), output.exit_code, output.err));
    }
    return output;
}

auto SystemExecutor::locate(std::string_view tool) noexcept -> std::optional<std::string> {
    return utils::which(tool, utils::safe_getenv("PATH"));
}

auto SystemExecutor::platform_codename() noexcept -> std::string {
    std::error_code err{};
    if (!std::filesystem::exists(OS_RELEASE_PATH, err)) {
        spdlog::debug("'{}' is missing, platform codename is unknown", OS_RELEASE_PATH);
        return {};
    }
    const auto& content = file_utils::read_whole_file(OS_RELEASE_PATH);
    return os_release::parse_codename(content);
}

auto default_executor() noexcept -> Executor& {
    static SystemExecutor executor{};
    return executor;
}

auto which(std::string_view tool, std::string_view search_path) noexcept -> std::optional<std::string> {
    namespace fs = std::filesystem;

    if (tool.empty()) {
        return std::nullopt;
    }
    if (tool.contains('/')) {
        if (is_executable_file(fs::path{tool})) {
            return std::make_optional<std::string>(tool);
        }
        return std::nullopt;
    }

    for (auto&& dir : utils::make_split_view(search_path, ':')) {
        const auto& candidate = fs::path{dir} / tool;
        if (is_executable_file(candidate)) {
            return std::make_optional<std::string>(candidate.string());
        }
    }
    return std::nullopt;
}

}  // namespace osprep::utils
