#include "dump_options.hpp"

#include <algorithm>
#include <cctype>

namespace CSD {
namespace Layout {

std::set<std::string> DumpOptions::DefaultExcludedNamespaces() {
    return {
        "System",
        "Mono",
        "Microsoft.Win32",
        "Unity",
        "UnityEditor",
        "UnityEngine",
        "UnityEngineInternal",
        "AOT",
        "JetBrains.Annotations",
    };
}

DumpOptions EffectiveOptions(const DumpOptions& options) {
    DumpOptions effective = options;
    if (effective.create_solution) {
        effective.layout = LayoutSchema::Tree;
        effective.must_compile = true;
        effective.separate_assembly_attributes = true;
    }
    return effective;
}

bool IsNamespaceExcluded(const std::string& ns, const std::set<std::string>& excluded) {
    for (const auto& prefix : excluded) {
        if (ns == prefix) return true;
        if (ns.size() > prefix.size() && ns.compare(0, prefix.size(), prefix) == 0
            && ns[prefix.size()] == '.') {
            return true;
        }
    }
    return false;
}

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<LayoutSchema> ParseLayoutSchema(const std::string& text) {
    std::string lower = ToLower(text);
    if (lower == "single") return LayoutSchema::Single;
    if (lower == "namespace") return LayoutSchema::Namespace;
    if (lower == "assembly") return LayoutSchema::Assembly;
    if (lower == "class") return LayoutSchema::Class;
    if (lower == "tree") return LayoutSchema::Tree;
    return std::nullopt;
}

std::optional<SortOrder> ParseSortOrder(const std::string& text) {
    std::string lower = ToLower(text);
    if (lower == "index") return SortOrder::Index;
    if (lower == "name") return SortOrder::Name;
    return std::nullopt;
}

const char* ToString(LayoutSchema layout) {
    switch (layout) {
    case LayoutSchema::Single:    return "single";
    case LayoutSchema::Namespace: return "namespace";
    case LayoutSchema::Assembly:  return "assembly";
    case LayoutSchema::Class:     return "class";
    case LayoutSchema::Tree:      return "tree";
    }
    return "unknown";
}

const char* ToString(SortOrder sort) {
    switch (sort) {
    case SortOrder::Index: return "index";
    case SortOrder::Name:  return "name";
    }
    return "unknown";
}

} // namespace Layout
} // namespace CSD
