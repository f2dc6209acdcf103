#include "osprep/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fseek, ftell
#include <cstring>  // for strerror

#include <spdlog/spdlog.h>

namespace osprep::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    // Use std::fopen because it's faster than std::ifstream
    const std::string filepath_str{filepath};
    auto* file = std::fopen(filepath_str.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0L, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0L, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

}  // namespace osprep::file_utils
