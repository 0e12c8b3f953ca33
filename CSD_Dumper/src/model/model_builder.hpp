#pragma once
#include "analyzer.hpp"

namespace CSD {
namespace Model {

// Copies an image's declarations into a TypeModel. A (namespace, name) pair
// declared twice keeps its first declaration; assemblies keep discovery order.
class DefaultModelBuilder : public ModelBuilder {
public:
    TypeModel BuildModel(const Image& image) override;
};

} // namespace Model
} // namespace CSD
