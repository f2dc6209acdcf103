#include "osprep/gpg.hpp"
#include "osprep/string_utils.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace {

// Deletes a key imported only for the lookup, on every exit path
class ImportedKeyGuard final {
 public:
    ImportedKeyGuard(std::string_view key, osprep::utils::Executor& executor) noexcept
      : m_key(key), m_executor(executor) { }
    ~ImportedKeyGuard() noexcept {
        osprep::gpg::delete_key(m_key, m_executor);
    }

    ImportedKeyGuard(const ImportedKeyGuard&) = delete;
    auto operator=(const ImportedKeyGuard&)   = delete;

 private:
    std::string_view m_key;
    osprep::utils::Executor& m_executor;
};

}  // namespace

namespace osprep::gpg {

auto export_armour(std::string_view key, utils::Executor& executor) noexcept -> std::optional<std::string> {
    auto output = executor.execute({"gpg", "--export", "--armour", std::string{key}});
    if (!output) {
        // debug, since it happens for any key not on the system initially
        spdlog::debug("Failed to export armoured key '{}': {}", key, output.error().message);
        return std::nullopt;
    }
    if (output->out.empty()) {
        spdlog::debug("Nothing exported for key '{}'", key);
        return std::nullopt;
    }
    return std::make_optional<std::string>(std::move(output->out));
}

auto recv_key(std::string_view key, std::string_view keyserver, utils::Executor& executor) noexcept -> Result<void> {
    spdlog::debug("Receive gpg key '{}'", key);
    const auto& output = executor.execute({"gpg", "--keyserver", std::string{keyserver}, "--recv", std::string{key}});
    if (!output) {
        return make_error(ErrorKind::KeyFetch,
            fmt::format(FMT_COMPILE("Failed to import key '{}' from server '{}' - error {}"), key, keyserver, output.error().message));
    }
    return {};
}

void delete_key(std::string_view key, utils::Executor& executor) noexcept {
    const auto& output = executor.execute({"gpg", "--batch", "--yes", "--delete-keys", std::string{key}});
    if (!output) {
        spdlog::warn("Failed delete key '{}': {}", key, output.error().message);
    }
}

auto get_key_by_id(std::string_view keyid, std::string_view keyserver, utils::Executor& executor) noexcept -> Result<std::string> {
    if (keyid.empty() || keyserver.empty()) {
        return make_error(ErrorKind::KeyFetch, fmt::format(FMT_COMPILE("invalid key id '{}' or keyserver '{}'"), keyid, keyserver));
    }

    auto armour = gpg::export_armour(keyid, executor);
    if (!armour) {
        const ImportedKeyGuard imported_key{keyid, executor};

        auto received = gpg::recv_key(keyid, keyserver, executor);
        if (!received) {
            spdlog::error("Failed to obtain gpg key {}: {}", keyid, received.error().message);
            return std::unexpected(std::move(received.error()));
        }

        armour = gpg::export_armour(keyid, executor);
        if (!armour) {
            return make_error(ErrorKind::KeyFetch,
                fmt::format(FMT_COMPILE("key '{}' not found after import from server '{}'"), keyid, keyserver));
        }
    }

    return std::string{utils::rstrip_newlines(*armour)};
}

}  // namespace osprep::gpg
