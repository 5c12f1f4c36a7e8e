#pragma once

#include <cstdlib>
#include <filesystem>

namespace lc::paths {

constexpr auto DEFAULT_CONFIG_PATH = "/etc/lockcopy/config.yaml";

// LOCKCOPY_CONFIG overrides the packaged location.
inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("LOCKCOPY_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

}
