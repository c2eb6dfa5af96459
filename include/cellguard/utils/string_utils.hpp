/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the isolation components
 *
 * Trimming, case folding, splitting and joining, plus shell quoting for
 * arguments handed to the container runtime CLI.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace cellguard {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /**
     * @brief Trim whitespace from both ends of string
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped.
     *
     * @code
     * Split("a,,b", ',');  // {"a", "b"}
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split string by any whitespace
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Quote a single argument for /bin/sh
     *
     * Wraps the value in single quotes and escapes embedded single quotes,
     * so the shell passes it through verbatim.
     */
    static std::string ShellQuote(const std::string& arg);
};

} // namespace utils
} // namespace cellguard
