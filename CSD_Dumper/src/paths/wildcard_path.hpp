#pragma once
#include "core/csd_status.hpp"
#include "filesystem_probe.hpp"

#include <string>

// ============================================================================
// Wildcard Path Resolver
// ============================================================================
// Turns a path such as
//   /home/me/Unity/Hub/Editor/*/Editor/Data
// into a concrete path by picking, at every segment containing '*', the
// ordinally greatest child directory whose name matches the segment.
// Used to locate the newest local toolchain install without parsing versions.

namespace CSD {
namespace Paths {

/// Whole-segment glob match: '*' matches any run of characters (including
/// none), every other character matches itself.
bool MatchesSegmentPattern(const std::string& name, const std::string& pattern);

/// True if `path` contains at least one '*'.
bool HasWildcard(const std::string& path);

/// Resolve `path` against `probe`.
///
/// - No '*' anywhere: `path` is returned unchanged and the probe is not touched.
/// - A wildcard segment with no matching child keeps its literal pattern text;
///   the caller's existence check reports the miss.
/// - Relative and network-style (//host, \\host) wildcard paths fail with
///   Status::UnsupportedInput.
Result<std::string> ResolveWildcardPath(const std::string& path, const FilesystemProbe& probe);

} // namespace Paths
} // namespace CSD
