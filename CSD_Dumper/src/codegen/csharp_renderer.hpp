#pragma once
#include "source_renderer.hpp"

#include <set>
#include <string>
#include <vector>

// ============================================================================
// C# Declaration Renderer
// ============================================================================
// Writes C# declaration stubs for every type handed over by the layout
// dispatcher, partitioned into files according to the chosen layout:
//
//   single     <path>
//   namespace  <path>/<A.B.C>.cs            or <path>/A/B/C.cs
//   assembly   <path>/<Assembly>.cs         (+ <path>/<Assembly>/AssemblyInfo.cs)
//   class      <path>/<A.B.C>/<Type>.cs     or <path>/A/B/C/<Type>.cs
//   tree       <path>/<Assembly>/A/B/C/<Type>.cs
//              (+ <path>/<Assembly>/Properties/AssemblyInfo.cs)
//   solution   tree + <path>/<Assembly>/<Assembly>.csproj + <path>/<Image>.sln
//
// Types in the global namespace go to "-global-" where a namespace name is
// needed for a file, and to the layout root where a folder is needed. Types
// without an assembly go to "-unassigned-". Neither is a valid C#
// identifier. Two groups that still map to one file within a single layout
// call ("Foo" and "Foo.dll") fail with Status::WriteFailed.

namespace CSD {
namespace Codegen {

class CSharpRenderer : public SourceRenderer {
public:
    Result<void> WriteSingleFile(const RenderContext& ctx, const std::string& path,
                                 Layout::SortOrder sort) override;

    Result<void> WriteFilesByNamespace(const RenderContext& ctx, const std::string& path,
                                       Layout::SortOrder sort, bool flatten) override;

    Result<void> WriteFilesByAssembly(const RenderContext& ctx, const std::string& path,
                                      Layout::SortOrder sort, bool separate_attributes) override;

    Result<void> WriteFilesByClass(const RenderContext& ctx, const std::string& path,
                                   bool flatten) override;

    Result<void> WriteFilesByClassTree(const RenderContext& ctx, const std::string& path,
                                       bool separate_attributes) override;

    Result<void> WriteSolution(const RenderContext& ctx, const std::string& path,
                               const std::string& toolchain_root,
                               const std::string& toolchain_assemblies_root) override;

    /// Files written by this renderer since construction, in write order.
    const std::vector<std::string>& GetGeneratedFiles() const { return m_generated_files; }

    /// Deterministic "{XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}" project GUID for `name`.
    static std::string ProjectGuid(const std::string& name);

private:
    Result<void> WriteClassTree(const RenderContext& ctx, const std::string& path,
                                bool separate_attributes);
    Result<void> WriteTextFile(const std::string& path, const std::string& content);

    std::vector<std::string> m_generated_files;
    std::set<std::string> m_layout_paths;   // Files claimed by the current layout call
};

} // namespace Codegen
} // namespace CSD
