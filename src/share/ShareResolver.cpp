#include "share/ShareResolver.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

using namespace lc::share;
using namespace lc::logging;
namespace fs = std::filesystem;

ShareResolver::ShareResolver(config::SharesConfig shares, std::vector<std::string> slowSharePrefixes)
    : shares_(std::move(shares)), slowSharePrefixes_(std::move(slowSharePrefixes)) {}

bool ShareResolver::isUncPath(const std::string& path) {
    if (path.size() < 3) return false;
    const bool backslash = path[0] == '\\' && path[1] == '\\';
    const bool slash = path[0] == '/' && path[1] == '/';
    return (backslash || slash) && path[2] != path[0];
}

std::string ShareResolver::serverShareBase(const std::string& path) const {
    if (!isUncPath(path)) return {};

    const char sep = path[0];
    const auto slashIndex = path.find(sep, 2);
    if (slashIndex == std::string::npos) return path;

    std::string base = path.substr(0, slashIndex);
    const std::string server = base.substr(2);

    for (const auto& [alias, replacement] : shares_.aliases) {
        if (!util::iequals(server, alias)) continue;
        std::string aliased = replacement;
        std::ranges::replace(aliased, '/', sep);
        std::ranges::replace(aliased, '\\', sep);
        base = std::string(2, sep) + aliased;
        break;
    }

    return base;
}

std::optional<fs::path> ShareResolver::mountedShareRoot(const fs::path& file) const {
    if (shares_.mounted_shares.empty()) return std::nullopt;

    std::error_code ec;
    const auto absFile = fs::absolute(file, ec).lexically_normal();
    if (ec) return std::nullopt;

    std::optional<fs::path> best;
    size_t bestDepth = 0;

    for (const auto& mount : shares_.mounted_shares) {
        auto absMount = fs::absolute(mount, ec).lexically_normal();
        if (ec) continue;
        if (!absMount.has_filename()) absMount = absMount.parent_path();

        const auto rel = absFile.lexically_relative(absMount);
        if (rel.empty() || rel == "." || *rel.begin() == "..") continue;

        const auto depth = static_cast<size_t>(std::distance(absMount.begin(), absMount.end()));
        if (!best || depth > bestDepth) {
            best = absMount;
            bestDepth = depth;
        }
    }

    return best;
}

std::optional<fs::path> ShareResolver::lockDirectoryPath(const fs::path& file) const {
    const auto str = file.string();

    if (isUncPath(str)) {
        const auto base = serverShareBase(str);
        if (base.empty()) return std::nullopt;
        return fs::path(base + std::string(1, str[0]) + shares_.lock_directory_name);
    }

    if (const auto root = mountedShareRoot(file)) return *root / shares_.lock_directory_name;

    return std::nullopt;
}

std::optional<fs::path> ShareResolver::lockDirectory(const fs::path& file) const {
    const auto expected = lockDirectoryPath(file);
    if (!expected) return std::nullopt;

    std::error_code ec;
    if (fs::is_directory(*expected, ec)) return expected;

    LogRegistry::share()->debug("[ShareResolver] Lock directory {} not found for {}", expected->string(), file.string());
    return std::nullopt;
}

bool ShareResolver::isSlowShare(const fs::path& lockDir) const {
    const auto str = lockDir.string();
    return std::ranges::any_of(slowSharePrefixes_, [&](const std::string& prefix) {
        return !prefix.empty() && util::istartsWith(str, prefix);
    });
}
