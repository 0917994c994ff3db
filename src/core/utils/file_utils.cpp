#include "file_utils.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "log.h"

namespace gv {
namespace file {

Result<std::string> readText(const Path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

bool writeText(const Path& path, std::string_view content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for writing: %s", path.string().c_str());
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool remove(const Path& path) {
    std::error_code ec;
    bool result = fs::remove(path, ec);
    if (ec) {
        log::errorf("FileIO", "Failed to remove: %s (%s)", path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return result;
}

} // namespace file
} // namespace gv
