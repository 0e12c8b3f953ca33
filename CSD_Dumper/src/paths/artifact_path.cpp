#include "artifact_path.hpp"

namespace CSD {
namespace Paths {

std::string PlanArtifactPath(const std::string& base_path, size_t image_index) {
    if (image_index == 0) return base_path;

    const std::string suffix = "-" + std::to_string(image_index);

    size_t segment_start = base_path.find_last_of("/\\");
    segment_start = (segment_start == std::string::npos) ? 0 : segment_start + 1;

    // A leading dot (".hidden") or a trailing dot ("name.") is not an extension
    size_t dot = base_path.rfind('.');
    bool has_extension = dot != std::string::npos
        && dot > segment_start
        && dot + 1 < base_path.size();

    if (!has_extension) return base_path + suffix;

    std::string planned = base_path;
    planned.insert(dot, suffix);
    return planned;
}

} // namespace Paths
} // namespace CSD
