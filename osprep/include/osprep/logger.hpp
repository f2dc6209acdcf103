#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace osprep::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace osprep::logger

#endif  // LOGGER_HPP
