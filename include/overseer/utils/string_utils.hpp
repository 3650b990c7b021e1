/**
 * @file string_utils.hpp
 * @brief String helpers shared by the supervisor components
 * 
 * Trimming, splitting and joining for command output, identifier
 * sanitisation for cache paths, UUID generation for local identifiers and
 * RFC 3339 timestamps for artifact headers.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace overseer {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 * 
 * All methods are static - no instantiation required.
 * 
 * **Usage Example**:
 * @code
 * // First line of hook output, whitespace stripped
 * auto lines = StringUtils::SplitLines(output);
 * std::string snapshot_id = StringUtils::Trim(lines.front());
 * 
 * // Directory name for a repository mirror
 * auto dir = StringUtils::SanitizePathComponent("acme/widgets.git");
 * // dir = "acme_widgets.git"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split text into lines, dropping blank ones
     * 
     * Handles both LF and CRLF line endings.
     * 
     * @param text Input text
     * @return Non-blank lines, without line terminators
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Replace every malformed UTF-8 sequence with U+FFFD
     * 
     * Overlong forms, surrogates and code points above U+10FFFF count as
     * malformed. Valid input is returned unchanged.
     * 
     * @param text Raw bytes (workload output, diffs)
     * @return Valid UTF-8 text
     */
    static std::string SanitizeUtf8(const std::string& text);

    /// True when `text` is well-formed UTF-8
    static bool IsValidUtf8(const std::string& text);

    /***************************************************************************
     * Identifiers and Formatting
     ***************************************************************************/

    /**
     * @brief Make an identifier safe to use as a single path component
     * 
     * Keeps alphanumerics, '-', '_' and '.'; everything else becomes '_'.
     * Leading dots are replaced so the result can never be "." or "..".
     * 
     * @param value Raw identifier (repository id, attempt id, ...)
     * @return Sanitised component, "_" when value is empty
     */
    static std::string SanitizePathComponent(const std::string& value);

    /**
     * @brief Generate a random version-4 UUID string
     * @return UUID in canonical 8-4-4-4-12 form
     */
    static std::string GenerateUUID();

    /**
     * @brief Format a time point as RFC 3339 UTC ("2025-01-31T12:00:00Z")
     * @param time Time point to format
     * @return Formatted timestamp
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);

    /**
     * @brief Truncate string to maximum length
     * 
     * @param str Input string
     * @param max_length Maximum length including suffix
     * @param suffix Suffix appended when truncated
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace overseer
