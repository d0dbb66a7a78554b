/**
 * @file string_utils.h
 * @brief ASCII string helpers for keys, operation names and list values
 */

#pragma once

#include <string>
#include <vector>

namespace archflow::common_utils {

class StringUtils {
public:
    /// Copy without leading and trailing whitespace
    static std::string trim(const std::string& s);

    static std::string toLower(std::string s);
    static std::string toUpper(std::string s);

    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    /**
     * @brief Splits on every occurrence of delimiter.
     *
     * Empty tokens are dropped, so "a,,b" and "a,b" give the same result.
     * An empty delimiter yields the whole input as one token.
     */
    static std::vector<std::string> split(const std::string& s,
                                          const std::string& delimiter,
                                          bool trimTokens = true);

    static std::string join(const std::vector<std::string>& items, const std::string& delimiter);

    static bool startsWith(const std::string& s, const std::string& prefix);
    static bool endsWith(const std::string& s, const std::string& suffix);
};

} // namespace archflow::common_utils
