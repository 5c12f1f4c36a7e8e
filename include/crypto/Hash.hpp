#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace lc::crypto {

enum class Algorithm { CRC32, MD5, SHA1 };

[[nodiscard]] std::string to_string(Algorithm algorithm);

class Hash {
public:
    // Lowercase hex digest of the file's contents
    static std::string compute(const std::filesystem::path& filepath, Algorithm algorithm);

    static std::string crc32(const std::filesystem::path& filepath);
    static std::string md5(const std::filesystem::path& filepath);
    static std::string sha1(const std::filesystem::path& filepath);

    // "crc32", "md5" or "sha1", any case
    static std::optional<Algorithm> parseAlgorithm(const std::string& name);
};

}
