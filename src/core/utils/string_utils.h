#pragma once

#include <string>
#include <string_view>

namespace gv {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Lower-case copy
std::string toLower(std::string_view s);

// Prefix check
bool startsWith(std::string_view s, std::string_view prefix);

// Contains check
bool containsIgnoreCase(std::string_view s, std::string_view substring);

// Parse integer from string (whole string must be consumed)
bool parseInt(std::string_view s, int& out);

// Is the text exactly six hex digits (RRGGBB)?
bool isHexColor(std::string_view s);

} // namespace str
} // namespace gv
