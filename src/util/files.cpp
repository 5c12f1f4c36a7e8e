#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include <climits>

namespace lc::util {

uintmax_t bytesToMB(const uintmax_t bytes) {
    return static_cast<uintmax_t>(std::llround(static_cast<double>(bytes) / 1024.0 / 1024.0));
}

std::string bytesToHumanReadable(const uintmax_t bytes) {
    static constexpr std::array<const char*, 4> suffix = {"KB", "MB", "GB", "TB"};

    if (bytes < 2048) return fmt::format("{:.1f} bytes", static_cast<double>(bytes));

    auto value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, suffix[unit]);
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

void writeLines(const std::filesystem::path& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to create file: " + path.string());
    for (const auto& l : lines) out << l << '\n';
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

std::string hostName() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) return "UnknownHost";

    std::string host(buffer);
    if (const auto dot = host.find('.'); dot != std::string::npos) host.resize(dot);
    return host.empty() ? "UnknownHost" : host;
}

bool removeFileIgnoreErrors(const std::filesystem::path& path, const std::function<void()>& beforeRetry) {
    namespace fs = std::filesystem;
    if (path.empty()) return true;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return true;
    if (fs::remove(path, ec)) return true;

    std::error_code permEc;
    fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, permEc);
    if (beforeRetry) beforeRetry();

    ec.clear();
    fs::remove(path, ec);
    if (!ec) return true;

    logging::LogRegistry::lockcopy()->warn("[files] Unable to delete file {}: {}", path.string(), ec.message());
    return false;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool istartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && iequals(str.substr(0, prefix.size()), prefix);
}

}
