/**
 * @file string_utils.hpp
 * @brief String helpers shared by the session, the Docker layer and the CLI
 *
 * Small, allocation-friendly helpers for trimming, splitting, joining and
 * quoting strings that end up on a shell command line inside the sandbox.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace monolith {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto libs = StringUtils::SplitWhitespace(" numpy  pandas ");
 * std::string cmd = "pip install " + StringUtils::ShellQuote(libs[0]);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Remove trailing whitespace and newlines only
     * @param str Input string
     * @return String without trailing whitespace
     */
    static std::string TrimRight(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by any whitespace
     * @param str Input string
     * @return Vector of tokens
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings
     * @param delimiter Delimiter string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Replace all occurrences of substring
     * @param str Input string
     * @param from Substring to replace
     * @param to Replacement string
     * @return Modified string
     */
    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Shell Helpers
     ***************************************************************************/

    /**
     * @brief Quote a single shell word for POSIX sh
     *
     * Words made only of safe characters are returned unchanged, anything
     * else is wrapped in single quotes with embedded quotes escaped.
     *
     * @param word Word to quote
     * @return Quoted word, `''` for an empty input
     */
    static std::string ShellQuote(const std::string& word);

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace monolith
