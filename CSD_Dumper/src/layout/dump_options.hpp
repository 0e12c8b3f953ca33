#pragma once
#include <optional>
#include <set>
#include <string>

// ============================================================================
// Dump Options
// ============================================================================

namespace CSD {
namespace Layout {

enum class LayoutSchema {
    Single,     // one file
    Namespace,  // one file per namespace
    Assembly,   // one file per assembly
    Class,      // one file per type, in namespace folders
    Tree,       // one file per type, in assembly and namespace folders
};

enum class SortOrder {
    Index,      // TypeDefIndex
    Name,       // ordinal type name
};

struct DumpOptions {
    // Namespaces (and their dotted children) left out of every layout
    std::set<std::string> excluded_namespaces = DefaultExcludedNamespaces();

    LayoutSchema layout = LayoutSchema::Single;
    SortOrder sort = SortOrder::Index;

    // Namespace/Class layouts: "A.B.C" folder instead of A/B/C
    bool flatten_hierarchy = false;

    // Diff tidying: no method pointers, field offsets or type indices
    bool suppress_metadata = false;

    // Compilation tidying: try hard to emit code that compiles
    bool must_compile = false;

    // Assembly/Tree layouts: assembly-level attributes in AssemblyInfo.cs
    bool separate_assembly_attributes = false;

    // Solution mode; implies Tree, must_compile and separate_assembly_attributes
    bool create_solution = false;

    // Toolchain locations for solution mode. '*' segments pick the last
    // matching folder in ordinal order.
    std::string toolchain_root;
    std::string toolchain_assemblies_root;

    std::string output_base_path = "types.cs";
    std::string script_output_path = "il2cpp.py";

    static std::set<std::string> DefaultExcludedNamespaces();
};

/// Options as dispatch sees them: solution mode forces Tree layout,
/// must_compile and separate_assembly_attributes. `options` is not modified.
DumpOptions EffectiveOptions(const DumpOptions& options);

/// True if `ns` equals an excluded namespace or is nested below one
/// ("System.Collections" is excluded by "System", "SystemX" is not).
bool IsNamespaceExcluded(const std::string& ns, const std::set<std::string>& excluded);

/// Case-insensitive; std::nullopt for unknown names.
std::optional<LayoutSchema> ParseLayoutSchema(const std::string& text);
std::optional<SortOrder> ParseSortOrder(const std::string& text);

const char* ToString(LayoutSchema layout);
const char* ToString(SortOrder sort);

} // namespace Layout
} // namespace CSD
