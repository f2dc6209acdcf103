#include "osprep/logger.hpp"

#include <utility>  // for move

namespace osprep::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace osprep::logger
