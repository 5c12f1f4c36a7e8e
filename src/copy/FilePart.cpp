#include "copy/FilePart.hpp"
#include "util/files.hpp"

#include <charconv>

using namespace lc::copy;
namespace fs = std::filesystem;

fs::path lc::copy::filePartPath(const fs::path& target) {
    return fs::path(target.string() + FILE_PART_SUFFIX);
}

fs::path lc::copy::filePartInfoPath(const fs::path& target) {
    return fs::path(target.string() + FILE_PART_INFO_SUFFIX);
}

FilePartInfo FilePartInfo::describe(const fs::path& source) {
    return {
        .sourcePath = fs::absolute(source).lexically_normal().string(),
        .length = fs::file_size(source),
        .lastWriteUtc = util::lastWriteTimeUtc(source)
    };
}

std::optional<FilePartInfo> FilePartInfo::read(const fs::path& infoFile) {
    std::error_code ec;
    if (!fs::is_regular_file(infoFile, ec)) return std::nullopt;

    std::vector<std::string> lines;
    try {
        lines = util::readLines(infoFile);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    if (lines.size() < 3) return std::nullopt;

    FilePartInfo info;
    info.sourcePath = lines[0];

    const auto& len = lines[1];
    const auto [ptr, err] = std::from_chars(len.data(), len.data() + len.size(), info.length);
    if (err != std::errc() || ptr != len.data() + len.size()) return std::nullopt;

    const auto time = util::parseUtcFileTime(lines[2]);
    if (!time) return std::nullopt;
    info.lastWriteUtc = *time;

    return info;
}

void FilePartInfo::write(const fs::path& infoFile) const {
    util::writeLines(infoFile, {sourcePath, std::to_string(length), util::formatUtcFileTime(lastWriteUtc)});
}

bool FilePartInfo::matches(const FilePartInfo& current) const {
    return sourcePath == current.sourcePath
        && length == current.length
        && util::nearlyEqualFileTimes(lastWriteUtc, current.lastWriteUtc);
}
