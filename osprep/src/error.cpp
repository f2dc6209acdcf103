#include "osprep/error.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace osprep {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::InvalidPath:
        return "invalid path"sv;
    case ErrorKind::UnsupportedFilesystem:
        return "unsupported filesystem"sv;
    case ErrorKind::ToolNotFound:
        return "tool not found"sv;
    case ErrorKind::LabelTooLong:
        return "label too long"sv;
    case ErrorKind::UnsupportedFlag:
        return "unsupported flag"sv;
    case ErrorKind::Configuration:
        return "configuration error"sv;
    case ErrorKind::MissingField:
        return "missing field"sv;
    case ErrorKind::KeyFetch:
        return "key fetch error"sv;
    case ErrorKind::ProcessExecution:
        return "process execution error"sv;
    }
    return "unknown"sv;
}

auto make_error(ErrorKind kind, std::string message) noexcept -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace osprep
