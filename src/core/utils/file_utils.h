#pragma once

#include <string>
#include <string_view>

#include "../types.h"

namespace gv {
namespace file {

// Read entire file to string
Result<std::string> readText(const Path& path);

// Write string to file
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// Delete a file
[[nodiscard]] bool remove(const Path& path);

} // namespace file
} // namespace gv
