#pragma once
#include <string>
#include <vector>

// ============================================================================
// Read-only Filesystem Probe
// ============================================================================
// The wildcard resolver and the run orchestrator only ever look at the
// filesystem through this interface, so both can be exercised against an
// in-memory tree.

namespace CSD {
namespace Paths {

class FilesystemProbe {
public:
    virtual ~FilesystemProbe() = default;

    /// Names (not full paths) of the immediate child directories of `dir`.
    /// Returns an empty list when `dir` does not exist or cannot be read.
    virtual std::vector<std::string> ListDirectories(const std::string& dir) const = 0;

    virtual bool DirectoryExists(const std::string& path) const = 0;
    virtual bool FileExists(const std::string& path) const = 0;
};

/// FilesystemProbe over the real disk (std::filesystem, non-throwing overloads).
class DiskProbe : public FilesystemProbe {
public:
    std::vector<std::string> ListDirectories(const std::string& dir) const override;
    bool DirectoryExists(const std::string& path) const override;
    bool FileExists(const std::string& path) const override;
};

} // namespace Paths
} // namespace CSD
