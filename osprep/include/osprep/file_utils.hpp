#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace osprep::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string;

}  // namespace osprep::file_utils

#endif  // FILE_UTILS_HPP
