#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

/** Lowercase copy of an ASCII string */
inline std::string toLower(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/** Strip spaces, tabs and line breaks from both ends */
inline std::string trim(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return std::string{str.substr(start, end - start + 1)};
}

inline bool startsWithIgnoreCase(std::string_view str, std::string_view prefix) {
    if (str.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(str[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

/** Split on an exact delimiter; keeps empty pieces */
inline std::vector<std::string_view> split(std::string_view str, std::string_view delim) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(str.substr(start));
            return parts;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + delim.size();
    }
}

/** Split on runs of whitespace; never yields empty tokens */
inline std::vector<std::string_view> splitWhitespace(std::string_view str) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < str.size()) {
        while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos]))) {
            pos++;
        }
        size_t begin = pos;
        while (pos < str.size() && !std::isspace(static_cast<unsigned char>(str[pos]))) {
            pos++;
        }
        if (pos > begin) {
            tokens.push_back(str.substr(begin, pos - begin));
        }
    }
    return tokens;
}

} // namespace utils

#endif // STRING_UTILS_HPP
