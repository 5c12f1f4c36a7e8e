#include "queue/LockFile.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <regex>
#include <stdexcept>
#include <unistd.h>

using namespace lc::queue;
namespace fs = std::filesystem;

namespace {

const std::regex LOCK_FILE_NAME_RE(R"(^(\d+)_(\d+)_)");

std::string stem(const std::string& fileName) {
    const auto dot = fileName.rfind('.');
    return dot == std::string::npos ? fileName : fileName.substr(0, dot);
}

std::string managerOrDefault(const std::string& manager) {
    return manager.find_first_not_of(" \t") == std::string::npos ? std::string(UNKNOWN_MANAGER) : manager;
}

}

uintmax_t LockFile::sizeMB() const {
    return util::bytesToMB(sizeBytes);
}

std::string LockFile::fileName() const {
    return sanitizeLockFileName(fmt::format("{}_{:04}_{}_{}{}", timestampMs, sizeMB(), host, managerOrDefault(manager), LOCK_FILE_EXTENSION));
}

std::vector<std::string> LockFile::contentLines() const {
    return {
        "Date: " + util::formatLocalDateTime(util::fromLockTimestampMs(timestampMs)),
        "Source: " + source.string(),
        "Target: " + target.string(),
        "Size_Bytes: " + std::to_string(sizeBytes),
        "Manager: " + managerOrDefault(manager)
    };
}

std::string lc::queue::sanitizeLockFileName(std::string name) {
    static constexpr std::string_view invalid = "\\/:*?\"<>| ";
    for (auto& c : name)
        if (invalid.find(c) != std::string_view::npos || static_cast<unsigned char>(c) < 0x20) c = '_';
    return name;
}

std::optional<LockFileName> lc::queue::parseLockFileName(const std::string& fileName) {
    if (fs::path(fileName).extension() != LOCK_FILE_EXTENSION) return std::nullopt;

    std::smatch m;
    if (!std::regex_search(fileName, m, LOCK_FILE_NAME_RE)) return std::nullopt;

    try {
        return LockFileName{std::stoll(m[1].str()), std::stoull(m[2].str())};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

fs::path lc::queue::createLockFile(const fs::path& lockDir, const LockFile& lock) {
    auto name = lock.fileName();
    auto path = lockDir / name;

    // O_EXCL closes the window between the existence check and the create
    int fd = -1;
    while ((fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644)) < 0) {
        if (errno != EEXIST)
            throw std::runtime_error(fmt::format("Error creating lock file {}: {}", path.string(), std::strerror(errno)));
        name = stem(name) + "-" + LOCK_FILE_EXTENSION;
        path = lockDir / name;
    }
    ::close(fd);

    try {
        util::writeLines(path, lock.contentLines());
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(path, ec);
        throw;
    }

    return path;
}
