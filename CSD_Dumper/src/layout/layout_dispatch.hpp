#pragma once
#include "dump_options.hpp"
#include "codegen/source_renderer.hpp"
#include "core/csd_status.hpp"
#include "model/type_model.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

// ============================================================================
// Layout Dispatch
// ============================================================================
// Picks exactly one renderer call per image from the effective
// (layout, sort, solution mode) options:
//
//   single    index|name   WriteSingleFile
//   namespace index|name   WriteFilesByNamespace
//   assembly  index|name   WriteFilesByAssembly
//   class     -            WriteFilesByClass
//   tree      -            WriteFilesByClassTree
//   solution  -            WriteSolution (tree + must_compile + separate attributes)
//
// Anything else is Status::UnsupportedCombination.

namespace CSD {
namespace Layout {

/// Resolved toolchain locations; only read in solution mode.
struct ToolchainPaths {
    std::string root;
    std::string assemblies_root;
};

namespace Strategy {

struct SingleFile   { SortOrder sort = SortOrder::Index; };
struct ByNamespace  { SortOrder sort = SortOrder::Index; bool flatten = false; };
struct ByAssembly   { SortOrder sort = SortOrder::Index; bool separate_attributes = false; };
struct ByClass      { bool flatten = false; };
struct ByClassTree  { bool separate_attributes = false; };
struct Solution     {};

} // namespace Strategy

using LayoutStrategy = std::variant<
    Strategy::SingleFile,
    Strategy::ByNamespace,
    Strategy::ByAssembly,
    Strategy::ByClass,
    Strategy::ByClassTree,
    Strategy::Solution>;

/// Map effective options onto a strategy. Call with EffectiveOptions().
Result<LayoutStrategy> SelectStrategy(const DumpOptions& effective);

/// Types of `model` outside the excluded namespaces, ordered by `sort`
/// (ties broken by the other key). No sort key means declaration index order.
std::vector<const Model::TypeEntry*> SelectTypes(const Model::TypeModel& model,
                                                 const std::set<std::string>& excluded,
                                                 std::optional<SortOrder> sort);

/// Render one image. `options` are the configured options; solution-mode
/// overrides are applied here without touching them.
Result<void> Dispatch(const Model::Image& image,
                      const Model::TypeModel& model,
                      const DumpOptions& options,
                      const std::string& artifact_path,
                      Codegen::SourceRenderer& renderer,
                      const ToolchainPaths& toolchain);

} // namespace Layout
} // namespace CSD
