#include "config.hpp"
#include "definitions.hpp"  // for error_inter

// import osprep
#include "osprep/gpg.hpp"
#include "osprep/io_utils.hpp"

#include <memory>       // for unique_ptr, make_unique
#include <string>       // for string
#include <string_view>  // for string_view

static std::unique_ptr<Config> s_config = nullptr;

namespace {

auto env_or(const char* env_name, std::string_view default_value) noexcept -> std::string {
    const auto& value = osprep::utils::safe_getenv(env_name);
    return std::string{value.empty() ? default_value : value};
}

}  // namespace

bool Config::initialize() noexcept {
    if (s_config != nullptr) {
        error_inter("You should only initialize it once!\n");
        return false;
    }
    s_config = std::make_unique<Config>();
    if (s_config) {
        s_config->m_data["KEYSERVER"] = env_or("OSPREP_KEYSERVER", osprep::gpg::DEFAULT_KEYSERVER);
        s_config->m_data["LOG_LEVEL"] = env_or("OSPREP_LOG_LEVEL", "info");
    }

    return s_config.get();
}

auto Config::instance() -> Config* {
    return s_config.get();
}
