#pragma once
#include "source_renderer.hpp"

namespace CSD {
namespace Codegen {

// Writes a data-only Python script per image: a `types` list of
// (TypeDefIndex, full name) tuples in declaration order.
class PythonScriptWriter : public ScriptRenderer {
public:
    Result<void> WriteScriptToFile(const Model::TypeModel& model, const std::string& path) override;
};

} // namespace Codegen
} // namespace CSD
