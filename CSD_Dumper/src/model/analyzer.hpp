#pragma once
#include "type_model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace CSD {
namespace Model {

// Loads every image found in a binary + metadata pair, in discovery order.
// std::nullopt means the inputs could not be analyzed at all.
class Analyzer {
public:
    virtual ~Analyzer() = default;
    virtual std::optional<std::vector<Image>> LoadFromFile(const std::string& binary_path,
                                                           const std::string& metadata_path) = 0;
};

// Builds the renderable type model for one image.
class ModelBuilder {
public:
    virtual ~ModelBuilder() = default;
    virtual TypeModel BuildModel(const Image& image) = 0;
};

} // namespace Model
} // namespace CSD
