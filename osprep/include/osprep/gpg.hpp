#ifndef GPG_HPP
#define GPG_HPP

#include "osprep/error.hpp"
#include "osprep/io_utils.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace osprep::gpg {

inline constexpr std::string_view DEFAULT_KEYSERVER = "keyserver.ubuntu.com";

/// @brief Export an armoured key from the local keyring.
/// @return The armour, std::nullopt if the key is not on the system.
[[nodiscard]] auto export_armour(std::string_view key, utils::Executor& executor = utils::default_executor()) noexcept -> std::optional<std::string>;

/// @brief Receive a key from the specified keyserver into the local keyring.
/// @return KeyFetch error naming key, keyserver and the failure.
[[nodiscard]] auto recv_key(std::string_view key, std::string_view keyserver, utils::Executor& executor = utils::default_executor()) noexcept -> Result<void>;

/// @brief Delete a key from the local keyring, failures are only logged.
void delete_key(std::string_view key, utils::Executor& executor = utils::default_executor()) noexcept;

/// @brief Get the armoured public key by its id.
///
/// A key missing locally is received from the keyserver, exported and then
/// deleted again, so the keyring is left as it was before.
/// Concurrent lookups of the same key are not coordinated.
/// @return The armour without trailing newlines, or KeyFetch error.
[[nodiscard]] auto get_key_by_id(std::string_view keyid, std::string_view keyserver = DEFAULT_KEYSERVER,
    utils::Executor& executor = utils::default_executor()) noexcept -> Result<std::string>;

}  // namespace osprep::gpg

#endif  // GPG_HPP
