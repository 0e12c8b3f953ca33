#include "model_builder.hpp"
#include "core/csd_log.h"

#include <set>

namespace CSD {
namespace Model {

TypeModel DefaultModelBuilder::BuildModel(const Image& image) {
    TypeModel model;
    model.image_name = image.name;
    model.assemblies = image.assemblies;

    // Track emitted type names to avoid duplicate definitions
    std::set<std::string> seen;
    size_t duplicates = 0;

    for (const auto& type : image.types) {
        if (!seen.insert(type.FullName()).second) {
            ++duplicates;
            continue;
        }
        if (!type.assembly.empty() && !model.FindAssembly(type.assembly)) {
            model.assemblies.push_back(AssemblyInfo{ type.assembly, {} });
        }
        model.types.push_back(type);
    }

    if (duplicates > 0) {
        LOG_WARN("Image %s: dropped %zu duplicate type definition(s)", image.name.c_str(), duplicates);
    }
    LOG_DEBUG("Image %s: %zu types in %zu assemblies",
              image.name.c_str(), model.types.size(), model.assemblies.size());
    return model;
}

} // namespace Model
} // namespace CSD
