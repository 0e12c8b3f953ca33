#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ============================================================================
// Image & Type Model
// ============================================================================
// An Image is one analyzable module found in a binary+metadata pair; the
// TypeModel is what the dumper renders for it. Only Index and Name take part
// in ordering; the rest feeds namespace exclusion and the C# renderer.

namespace CSD {
namespace Model {

enum class TypeKind {
    Class,
    Struct,
    Enum,
    Interface,
};

inline const char* ToKeyword(TypeKind kind) {
    switch (kind) {
    case TypeKind::Class:     return "class";
    case TypeKind::Struct:    return "struct";
    case TypeKind::Enum:      return "enum";
    case TypeKind::Interface: return "interface";
    }
    return "class";
}

struct TypeEntry {
    int32_t index = 0;              // TypeDefIndex
    std::string name;               // Raw name, may carry a generic arity ("List`1")
    std::string ns;                 // Empty for the global namespace
    std::string assembly;           // "Assembly-CSharp.dll"
    TypeKind kind = TypeKind::Class;
    std::string visibility = "public";
    std::string modifiers;          // "sealed ", "abstract static ", ...
    std::string base_type;

    std::string FullName() const { return ns.empty() ? name : ns + "." + name; }
};

struct AssemblyInfo {
    std::string name;
    std::vector<std::string> attributes;   // "[assembly: AssemblyVersion(\"1.0.0.0\")]"
};

struct Image {
    size_t index = 0;                      // Discovery order
    std::string name;
    std::vector<AssemblyInfo> assemblies;
    std::vector<TypeEntry> types;
};

struct TypeModel {
    std::string image_name;
    std::vector<AssemblyInfo> assemblies;
    std::vector<TypeEntry> types;          // Declaration order

    const AssemblyInfo* FindAssembly(const std::string& name) const {
        for (const auto& asm_info : assemblies) {
            if (asm_info.name == name) return &asm_info;
        }
        return nullptr;
    }
};

} // namespace Model
} // namespace CSD
