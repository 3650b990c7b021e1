/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 helpers using OpenSSL EVP
 * 
 * **Error Handling**:
 * - File not found / read errors: Throws std::runtime_error
 * - OpenSSL errors: Logs and throws std::runtime_error
 * 
 * @date 2025
 */

#include "overseer/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>

namespace overseer {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("Failed to initialise SHA-256 context");
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

} // anonymous namespace

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSha256Context();
    
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    
    return BinaryToHex(hash, length);
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }
    
    auto ctx = NewSha256Context();
    
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    
    return BinaryToHex(hash, length);
}

bool HashUtils::VerifySHA256(const std::filesystem::path& file_path,
                             const std::string& expected_hex) {
    std::string actual;
    try {
        actual = ComputeSHA256(file_path);
    }
    catch (const std::exception& e) {
        spdlog::warn("Cannot verify {}: {}", file_path.string(), e.what());
        return false;
    }
    
    if (actual.size() != expected_hex.size()) {
        return false;
    }
    
    unsigned char diff = 0;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        diff |= static_cast<unsigned char>(actual[i] ^ expected_hex[i]);
    }
    return diff == 0;
}

std::string HashUtils::BinaryToHex(const uint8_t* data, std::size_t size) {
    static const char kDigits[] = "0123456789abcdef";
    
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex += kDigits[data[i] >> 4];
        hex += kDigits[data[i] & 0x0f];
    }
    return hex;
}

} // namespace utils
} // namespace overseer
