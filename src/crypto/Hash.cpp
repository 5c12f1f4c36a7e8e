#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <boost/crc.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace lc::crypto;
using namespace lc::logging;

namespace {

constexpr size_t BUFFER_SIZE = 64 * 1024;

std::ifstream openForHashing(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());
    return file;
}

std::string evpDigest(const std::filesystem::path& filepath, const EVP_MD* md) {
    auto file = openForHashing(filepath);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
        throw std::runtime_error("Failed to initialize digest for " + filepath.string());

    char buffer[BUFFER_SIZE];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            throw std::runtime_error("Failed to update digest for " + filepath.string());
    }
    if (file.bad()) throw std::runtime_error("Error reading file for hashing: " + filepath.string());

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
        throw std::runtime_error("Failed to finalize digest for " + filepath.string());

    std::ostringstream result;
    for (unsigned int i = 0; i < hash_len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return result.str();
}

}

std::string lc::crypto::to_string(const Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::CRC32: return "crc32";
        case Algorithm::MD5: return "md5";
        case Algorithm::SHA1: return "sha1";
    }
    return "unknown";
}

std::string Hash::compute(const std::filesystem::path& filepath, const Algorithm algorithm) {
    LogRegistry::crypto()->debug("[Hash] Computing {} of {}", to_string(algorithm), filepath.string());

    switch (algorithm) {
        case Algorithm::CRC32: return crc32(filepath);
        case Algorithm::MD5: return md5(filepath);
        case Algorithm::SHA1: return sha1(filepath);
    }
    throw std::invalid_argument("Unsupported hash algorithm");
}

std::string Hash::crc32(const std::filesystem::path& filepath) {
    auto file = openForHashing(filepath);

    boost::crc_32_type crc;
    char buffer[BUFFER_SIZE];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        crc.process_bytes(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) throw std::runtime_error("Error reading file for hashing: " + filepath.string());

    return fmt::format("{:08x}", crc.checksum());
}

std::string Hash::md5(const std::filesystem::path& filepath) {
    return evpDigest(filepath, EVP_md5());
}

std::string Hash::sha1(const std::filesystem::path& filepath) {
    return evpDigest(filepath, EVP_sha1());
}

std::optional<Algorithm> Hash::parseAlgorithm(const std::string& name) {
    for (const auto algorithm : {Algorithm::CRC32, Algorithm::MD5, Algorithm::SHA1})
        if (util::iequals(name, to_string(algorithm))) return algorithm;
    return std::nullopt;
}
