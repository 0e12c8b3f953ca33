#include "wildcard_path.hpp"
#include "core/csd_log.h"

#include <algorithm>
#include <vector>

namespace CSD {
namespace Paths {

bool HasWildcard(const std::string& path) {
    return path.find('*') != std::string::npos;
}

bool MatchesSegmentPattern(const std::string& name, const std::string& pattern) {
    // Linear two-pointer match; remembers only the last '*' seen.
    size_t n = 0, p = 0;
    size_t star = std::string::npos;
    size_t resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (p < pattern.size() && pattern[p] == name[n]) {
            ++p;
            ++n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

static std::vector<std::string> SplitSegments(const std::string& relative) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= relative.size()) {
        size_t slash = relative.find('/', start);
        if (slash == std::string::npos) slash = relative.size();
        if (slash > start) {
            segments.push_back(relative.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

static std::string JoinPath(const std::string& prefix, const std::string& segment) {
    if (prefix.empty() || prefix.back() == '/') return prefix + segment;
    return prefix + "/" + segment;
}

Result<std::string> ResolveWildcardPath(const std::string& path, const FilesystemProbe& probe) {
    if (!HasWildcard(path)) {
        return Result<std::string>::Ok(path);
    }

    if (path.rfind("//", 0) == 0 || path.rfind("\\\\", 0) == 0) {
        LOG_ERROR("Wildcards in network paths are not supported: %s", path.c_str());
        return Result<std::string>::Fail(Status::UnsupportedInput, path);
    }
    if (path.front() != '/') {
        LOG_ERROR("Wildcard path must be absolute: %s", path.c_str());
        return Result<std::string>::Fail(Status::UnsupportedInput, path);
    }

    std::string resolved = "/";
    for (const auto& segment : SplitSegments(path.substr(1))) {
        if (!HasWildcard(segment)) {
            resolved = JoinPath(resolved, segment);
            continue;
        }

        std::vector<std::string> matches;
        for (const auto& child : probe.ListDirectories(resolved)) {
            if (MatchesSegmentPattern(child, segment)) {
                matches.push_back(child);
            }
        }

        if (matches.empty()) {
            LOG_DEBUG("No directory under %s matches '%s'", resolved.c_str(), segment.c_str());
            resolved = JoinPath(resolved, segment);
            continue;
        }

        // Ordinal order: "v2" beats "v10"
        const auto& best = *std::max_element(matches.begin(), matches.end());
        LOG_DEBUG("'%s' under %s -> %s (%zu candidates)",
                  segment.c_str(), resolved.c_str(), best.c_str(), matches.size());
        resolved = JoinPath(resolved, best);
    }

    return Result<std::string>::Ok(resolved);
}

} // namespace Paths
} // namespace CSD
