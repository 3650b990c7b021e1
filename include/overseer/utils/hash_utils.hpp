/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for artifact integrity
 * 
 * Artifacts uploaded to the control plane carry the SHA-256 digest of their
 * content, and the local spool manifest records the same digest so that a
 * preserved diff/log can be verified before a manual re-upload.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace overseer {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digest helpers
 * 
 * **Thread Safety**: All methods are stateless and reentrant.
 * 
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(diff_text);
 * bool intact = HashUtils::VerifySHA256(spool / "diff.patch", digest);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of in-memory data
     * @param data Bytes to hash
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a file, streamed in 8KB chunks
     * @param file_path File to hash
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Check a file against an expected digest
     * 
     * Comparison is constant-time over the digest length.
     * 
     * @param file_path File to verify
     * @param expected_hex Expected lowercase hex digest
     * @return true if digests match, false on mismatch or read failure
     */
    static bool VerifySHA256(const std::filesystem::path& file_path,
                             const std::string& expected_hex);

private:
    static std::string BinaryToHex(const uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace overseer
