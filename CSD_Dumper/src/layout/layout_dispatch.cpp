#include "layout_dispatch.hpp"
#include "core/csd_log.h"

#include <algorithm>

namespace CSD {
namespace Layout {

using Model::TypeEntry;

Result<LayoutStrategy> SelectStrategy(const DumpOptions& effective) {
    if (effective.create_solution) {
        return Result<LayoutStrategy>::Ok(Strategy::Solution{});
    }

    const SortOrder sort = effective.sort;
    const bool sort_known = sort == SortOrder::Index || sort == SortOrder::Name;

    switch (effective.layout) {
    case LayoutSchema::Single:
        if (sort_known) return Result<LayoutStrategy>::Ok(Strategy::SingleFile{ sort });
        break;
    case LayoutSchema::Namespace:
        if (sort_known) {
            return Result<LayoutStrategy>::Ok(Strategy::ByNamespace{ sort, effective.flatten_hierarchy });
        }
        break;
    case LayoutSchema::Assembly:
        if (sort_known) {
            return Result<LayoutStrategy>::Ok(
                Strategy::ByAssembly{ sort, effective.separate_assembly_attributes });
        }
        break;
    case LayoutSchema::Class:
        // One file per type: the sort key has no effect
        return Result<LayoutStrategy>::Ok(Strategy::ByClass{ effective.flatten_hierarchy });
    case LayoutSchema::Tree:
        return Result<LayoutStrategy>::Ok(Strategy::ByClassTree{ effective.separate_assembly_attributes });
    }

    std::string detail = "layout=" + std::to_string(static_cast<int>(effective.layout))
                       + " sort=" + std::to_string(static_cast<int>(sort));
    return Result<LayoutStrategy>::Fail(Status::UnsupportedCombination, detail);
}

std::vector<const TypeEntry*> SelectTypes(const Model::TypeModel& model,
                                          const std::set<std::string>& excluded,
                                          std::optional<SortOrder> sort) {
    std::vector<const TypeEntry*> types;
    types.reserve(model.types.size());
    for (const auto& type : model.types) {
        if (IsNamespaceExcluded(type.ns, excluded)) continue;
        types.push_back(&type);
    }

    if (sort == SortOrder::Name) {
        std::sort(types.begin(), types.end(), [](const TypeEntry* a, const TypeEntry* b) {
            if (a->name != b->name) return a->name < b->name;
            return a->index < b->index;
        });
    } else {
        std::sort(types.begin(), types.end(), [](const TypeEntry* a, const TypeEntry* b) {
            if (a->index != b->index) return a->index < b->index;
            return a->name < b->name;
        });
    }
    return types;
}

namespace {

// Exhaustive over LayoutStrategy: a new alternative without an overload
// here does not compile.
struct StrategyInvoker {
    Codegen::SourceRenderer& renderer;
    const Model::TypeModel& model;
    const DumpOptions& effective;
    const std::string& path;
    const ToolchainPaths& toolchain;

    Codegen::RenderContext Context(std::optional<SortOrder> sort) const {
        return Codegen::RenderContext{
            model,
            SelectTypes(model, effective.excluded_namespaces, sort),
            effective.excluded_namespaces,
            effective.suppress_metadata,
            effective.must_compile,
        };
    }

    Result<void> operator()(const Strategy::SingleFile& s) const {
        return renderer.WriteSingleFile(Context(s.sort), path, s.sort);
    }
    Result<void> operator()(const Strategy::ByNamespace& s) const {
        return renderer.WriteFilesByNamespace(Context(s.sort), path, s.sort, s.flatten);
    }
    Result<void> operator()(const Strategy::ByAssembly& s) const {
        return renderer.WriteFilesByAssembly(Context(s.sort), path, s.sort, s.separate_attributes);
    }
    Result<void> operator()(const Strategy::ByClass& s) const {
        return renderer.WriteFilesByClass(Context(std::nullopt), path, s.flatten);
    }
    Result<void> operator()(const Strategy::ByClassTree& s) const {
        return renderer.WriteFilesByClassTree(Context(std::nullopt), path, s.separate_attributes);
    }
    Result<void> operator()(const Strategy::Solution&) const {
        return renderer.WriteSolution(Context(std::nullopt), path, toolchain.root, toolchain.assemblies_root);
    }
};

} // namespace

Result<void> Dispatch(const Model::Image& image,
                      const Model::TypeModel& model,
                      const DumpOptions& options,
                      const std::string& artifact_path,
                      Codegen::SourceRenderer& renderer,
                      const ToolchainPaths& toolchain) {
    const DumpOptions effective = EffectiveOptions(options);

    auto strategy = SelectStrategy(effective);
    if (!strategy) {
        LOG_ERROR("Image %zu (%s): unsupported layout/sort combination (%s)",
                  image.index, image.name.c_str(), strategy.detail.c_str());
        return Result<void>::Fail(strategy.status, strategy.detail);
    }

    LOG_DEBUG("Image %zu (%s): layout %s, sort %s%s -> %s",
              image.index, image.name.c_str(), ToString(effective.layout), ToString(effective.sort),
              effective.create_solution ? " (solution)" : "", artifact_path.c_str());

    return std::visit(StrategyInvoker{ renderer, model, effective, artifact_path, toolchain },
                      strategy.value);
}

} // namespace Layout
} // namespace CSD
