#pragma once
#include "core/csd_status.hpp"
#include "layout/dump_options.hpp"
#include "model/type_model.hpp"

#include <set>
#include <string>
#include <vector>

// ============================================================================
// Source Renderer Interface
// ============================================================================
// One call per image, chosen by the layout dispatcher. `types` is already
// filtered against the excluded namespaces and ordered by the sort key;
// renderers group it but never reorder within a group.

namespace CSD {
namespace Codegen {

struct RenderContext {
    const Model::TypeModel& model;
    std::vector<const Model::TypeEntry*> types;
    const std::set<std::string>& excluded_namespaces;
    bool suppress_metadata = false;
    bool must_compile = false;
};

class SourceRenderer {
public:
    virtual ~SourceRenderer() = default;

    virtual Result<void> WriteSingleFile(const RenderContext& ctx, const std::string& path,
                                         Layout::SortOrder sort) = 0;

    virtual Result<void> WriteFilesByNamespace(const RenderContext& ctx, const std::string& path,
                                               Layout::SortOrder sort, bool flatten) = 0;

    virtual Result<void> WriteFilesByAssembly(const RenderContext& ctx, const std::string& path,
                                              Layout::SortOrder sort, bool separate_attributes) = 0;

    virtual Result<void> WriteFilesByClass(const RenderContext& ctx, const std::string& path,
                                           bool flatten) = 0;

    virtual Result<void> WriteFilesByClassTree(const RenderContext& ctx, const std::string& path,
                                               bool separate_attributes) = 0;

    virtual Result<void> WriteSolution(const RenderContext& ctx, const std::string& path,
                                       const std::string& toolchain_root,
                                       const std::string& toolchain_assemblies_root) = 0;
};

// Writes one helper script per image for use alongside a disassembler.
class ScriptRenderer {
public:
    virtual ~ScriptRenderer() = default;
    virtual Result<void> WriteScriptToFile(const Model::TypeModel& model, const std::string& path) = 0;
};

} // namespace Codegen
} // namespace CSD
