#pragma once
#include <cstddef>
#include <string>

namespace CSD {
namespace Paths {

/// Output path for the image at `image_index` (discovery order).
/// Index 0 keeps `base_path`; index k inserts "-k" before the extension of
/// the final segment ("types.cs" -> "types-1.cs") or appends it when there
/// is no extension ("out" -> "out-1").
std::string PlanArtifactPath(const std::string& base_path, size_t image_index);

} // namespace Paths
} // namespace CSD
