#include "filesystem_probe.hpp"
#include "core/csd_log.h"

#include <filesystem>
#include <system_error>

namespace CSD {
namespace Paths {

std::vector<std::string> DiskProbe::ListDirectories(const std::string& dir) const {
    std::vector<std::string> names;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        LOG_DEBUG("Cannot list %s: %s", dir.c_str(), ec.message().c_str());
        return names;
    }

    const std::filesystem::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        LOG_WARN("Directory listing of %s stopped early: %s", dir.c_str(), ec.message().c_str());
    }
    return names;
}

bool DiskProbe::DirectoryExists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool DiskProbe::FileExists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace Paths
} // namespace CSD
