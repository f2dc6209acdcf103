#ifndef ERROR_HPP
#define ERROR_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace osprep {

/// Kinds of failures reported by the library.
enum class ErrorKind : std::uint8_t {
    InvalidPath,
    UnsupportedFilesystem,
    ToolNotFound,
    LabelTooLong,
    UnsupportedFlag,
    Configuration,
    MissingField,
    KeyFetch,
    ProcessExecution
};

struct Error final {
    ErrorKind kind{ErrorKind::Configuration};
    std::string message;

    auto operator==(const Error&) const noexcept -> bool = default;
};

template <typename T>
using Result = std::expected<T, Error>;

/// Converts ErrorKind to string.
[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

/// Shorthand for std::unexpected(Error{kind, message}).
[[nodiscard]] auto make_error(ErrorKind kind, std::string message) noexcept -> std::unexpected<Error>;

}  // namespace osprep

#endif  // ERROR_HPP
