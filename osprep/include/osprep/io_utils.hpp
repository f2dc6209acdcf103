#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include "osprep/error.hpp"

#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace osprep::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// Captured output of a finished child process.
struct ProcessOutput final {
    std::string out;
    std::string err;
    std::int32_t exit_code{0};
};

/// @brief Seam over everything that touches the host system.
///
/// Filesystem creation and key resolution only talk to the outside world
/// through this interface, so they can be driven by a scripted fake.
class Executor {
 public:
    Executor() noexcept          = default;
    virtual ~Executor() noexcept = default;

    Executor(const Executor&)                    = delete;
    auto operator=(const Executor&) -> Executor& = delete;

    /// @brief Run argv[0] found through PATH with the remaining arguments.
    /// @param argv The command and its arguments.
    /// @return Captured stdout/stderr, or ProcessExecution error on spawn
    /// failure or non-zero exit.
    virtual auto execute(const std::vector<std::string>& argv) noexcept -> Result<ProcessOutput> = 0;

    /// @brief Resolve a tool name against PATH.
    /// @return Path of the executable, std::nullopt if not found.
    virtual auto locate(std::string_view tool) noexcept -> std::optional<std::string> = 0;

    /// @brief Codename of the running distribution release (e.g "noble").
    /// @return empty string if it cannot be determined.
    virtual auto platform_codename() noexcept -> std::string = 0;
};

/// Executor backed by subprocess.h and the real filesystem.
class SystemExecutor final : public Executor {
 public:
    auto execute(const std::vector<std::string>& argv) noexcept -> Result<ProcessOutput> override;
    auto locate(std::string_view tool) noexcept -> std::optional<std::string> override;
    auto platform_codename() noexcept -> std::string override;
};

/// Process-wide SystemExecutor used by the convenience overloads.
auto default_executor() noexcept -> Executor&;

/// @brief Search a colon separated list of directories for an executable.
/// @param tool Bare tool name, or a path containing '/'.
/// @param search_path Value in the format of $PATH.
/// @return Path of the executable regular file, std::nullopt if none.
auto which(std::string_view tool, std::string_view search_path) noexcept -> std::optional<std::string>;

}  // namespace osprep::utils

#endif  // IO_UTILS_HPP
