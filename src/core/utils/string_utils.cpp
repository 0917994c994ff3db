#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace gv {
namespace str {

std::string trim(std::string_view s) {
    return trimRight(trimLeft(s));
}

std::string trimLeft(std::string_view s) {
    auto it = std::find_if(s.begin(), s.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(it, s.end());
}

std::string trimRight(std::string_view s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(s.begin(), it.base());
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    if (prefix.length() > s.length()) {
        return false;
    }
    return s.substr(0, prefix.length()) == prefix;
}

bool containsIgnoreCase(std::string_view s, std::string_view substring) {
    std::string sLower = toLower(s);
    std::string subLower = toLower(substring);
    return sLower.find(subLower) != std::string::npos;
}

bool parseInt(std::string_view s, int& out) {
    auto result = std::from_chars(s.data(), s.data() + s.size(), out);
    return result.ec == std::errc{} && result.ptr == s.data() + s.size();
}

bool isHexColor(std::string_view s) {
    if (s.size() != 6) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

}  // namespace str
}  // namespace gv
