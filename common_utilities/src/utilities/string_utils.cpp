#include "common_utils/utilities/string_utils.h"

#include <algorithm>
#include <cctype>

namespace archflow::common_utils {

namespace {

const char* const kWhitespace = " \t\n\r\f\v";

char lowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string StringUtils::trim(const std::string& s) {
    size_t first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string StringUtils::toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), lowerAscii);
    return s;
}

std::string StringUtils::toUpper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lowerAscii(x) == lowerAscii(y); });
}

std::vector<std::string> StringUtils::split(const std::string& s,
                                            const std::string& delimiter,
                                            bool trimTokens) {
    std::vector<std::string> tokens;
    auto emit = [&](std::string token) {
        if (trimTokens) {
            token = trim(token);
        }
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    };

    if (delimiter.empty()) {
        emit(s);
        return tokens;
    }

    size_t begin = 0;
    for (size_t at = s.find(delimiter); at != std::string::npos; at = s.find(delimiter, begin)) {
        emit(s.substr(begin, at - begin));
        begin = at + delimiter.size();
    }
    emit(s.substr(begin));
    return tokens;
}

std::string StringUtils::join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::string result;
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it != items.begin()) {
            result += delimiter;
        }
        result += *it;
    }
    return result;
}

bool StringUtils::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace archflow::common_utils
