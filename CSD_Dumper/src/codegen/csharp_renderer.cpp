#include "csharp_renderer.hpp"
#include "core/csd_log.h"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace CSD {
namespace Codegen {

using Model::AssemblyInfo;
using Model::TypeEntry;

// ============================================================================
// Naming Helpers
// ============================================================================

/// Characters that cannot appear in a file name on common filesystems
static std::string SafeFileComponent(const std::string& name) {
    std::string safe = name;
    for (auto& c : safe) {
        switch (c) {
        case '/': case '\\': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            c = '_';
            break;
        case '`':
            c = '-';   // keep generic arity: List`1 -> List-1
            break;
        default:
            break;
        }
    }
    return safe;
}

/// Strip backtick+arity suffix for use as a C# identifier ("List`1" -> "List")
static std::string SanitizeTypeName(const std::string& name) {
    auto pos = name.find('`');
    return (pos != std::string::npos) ? name.substr(0, pos) : name;
}

static std::string NamespaceFileStem(const std::string& ns) {
    return ns.empty() ? "-global-" : SafeFileComponent(ns);
}

/// "A.B.C" -> A/B/C; empty namespace -> empty path
static fs::path NamespaceDirectories(const std::string& ns) {
    fs::path dir;
    size_t start = 0;
    while (start < ns.size()) {
        size_t dot = ns.find('.', start);
        if (dot == std::string::npos) dot = ns.size();
        if (dot > start) dir /= SafeFileComponent(ns.substr(start, dot - start));
        start = dot + 1;
    }
    return dir;
}

/// "Assembly-CSharp.dll" -> "Assembly-CSharp"
static std::string AssemblyStem(const std::string& assembly) {
    if (assembly.empty()) return "-unassigned-";
    std::string stem = assembly;
    const std::string ext = ".dll";
    if (stem.size() > ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0) {
        stem.resize(stem.size() - ext.size());
    }
    return SafeFileComponent(stem);
}

static bool IsCompilerGenerated(const TypeEntry& type) {
    return type.name.find('<') != std::string::npos || type.name.find('>') != std::string::npos;
}

static std::string XmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':  out += "&amp;"; break;
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        default:   out += c; break;
        }
    }
    return out;
}

// ============================================================================
// Text Generation
// ============================================================================

/// Types the renderer will actually emit, in the dispatcher's order
static std::vector<const TypeEntry*> EmittableTypes(const RenderContext& ctx) {
    std::vector<const TypeEntry*> types;
    types.reserve(ctx.types.size());
    for (const auto* type : ctx.types) {
        // Compiler-generated types never compile as written
        if (ctx.must_compile && IsCompilerGenerated(*type)) continue;
        types.push_back(type);
    }
    return types;
}

static std::string FileHeader(const RenderContext& ctx) {
    std::stringstream ss;
    ss << "// Generated by CSD Dumper\n";
    ss << "// Image: " << ctx.model.image_name << "\n";
    ss << "// Do not edit manually\n\n";
    return ss.str();
}

static std::string AssemblyAttributes(const AssemblyInfo& asm_info, const RenderContext& ctx) {
    if (asm_info.attributes.empty()) return "";

    std::stringstream ss;
    ss << "// Assembly: " << asm_info.name << "\n";
    for (const auto& attribute : asm_info.attributes) {
        // Attribute arguments may reference types that are not emitted
        if (ctx.must_compile) ss << "// ";
        ss << attribute << "\n";
    }
    ss << "\n";
    return ss.str();
}

static std::string Declaration(const TypeEntry& type, const RenderContext& ctx, const std::string& indent) {
    std::stringstream ss;

    ss << indent << type.visibility << " " << type.modifiers << Model::ToKeyword(type.kind)
       << " " << SanitizeTypeName(type.name);
    if (!type.base_type.empty()) {
        ss << " : " << SanitizeTypeName(type.base_type);
    }
    if (!ctx.suppress_metadata) {
        ss << " // TypeDefIndex: " << type.index;
    }
    ss << "\n";
    ss << indent << "{\n";
    ss << indent << "}\n";
    return ss.str();
}

/// Types in the given order; consecutive types sharing a namespace share a block
static std::string TypeBlocks(const std::vector<const TypeEntry*>& types, const RenderContext& ctx) {
    std::stringstream ss;
    bool open = false;
    std::string current_ns;

    for (const auto* type : types) {
        if (!open || type->ns != current_ns) {
            if (open && !current_ns.empty()) ss << "}\n\n";
            current_ns = type->ns;
            open = true;
            if (!current_ns.empty()) {
                ss << "namespace " << current_ns << "\n{\n";
            }
        }
        ss << Declaration(*type, ctx, current_ns.empty() ? "" : "    ") << "\n";
    }
    if (open && !current_ns.empty()) ss << "}\n";
    return ss.str();
}

// ============================================================================
// File Output
// ============================================================================

Result<void> CSharpRenderer::WriteTextFile(const std::string& path, const std::string& content) {
    fs::path file_path(path);

    if (!m_layout_paths.insert(file_path.lexically_normal().string()).second) {
        LOG_ERROR("Two output groups map to %s", path.c_str());
        return Result<void>::Fail(Status::WriteFailed, path);
    }

    if (file_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Failed to create directory %s: %s",
                      file_path.parent_path().string().c_str(), ec.message().c_str());
            return Result<void>::Fail(Status::WriteFailed, file_path.parent_path().string());
        }
    }

    std::ofstream out(file_path);
    if (!out.is_open()) {
        LOG_ERROR("Failed to write: %s", path.c_str());
        return Result<void>::Fail(Status::WriteFailed, path);
    }
    out << content;
    out.close();
    if (out.fail()) {
        LOG_ERROR("Failed to write: %s", path.c_str());
        return Result<void>::Fail(Status::WriteFailed, path);
    }

    m_generated_files.push_back(path);
    LOG_TRACE("Wrote %s", path.c_str());
    return Result<void>::Ok();
}

Result<void> CSharpRenderer::WriteSingleFile(const RenderContext& ctx, const std::string& path,
                                             Layout::SortOrder sort) {
    m_layout_paths.clear();
    LOG_DEBUG("Single file %s (sort: %s)", path.c_str(), Layout::ToString(sort));

    std::stringstream file;
    file << FileHeader(ctx);
    for (const auto& asm_info : ctx.model.assemblies) {
        file << AssemblyAttributes(asm_info, ctx);
    }
    file << TypeBlocks(EmittableTypes(ctx), ctx);

    return WriteTextFile(path, file.str());
}

Result<void> CSharpRenderer::WriteFilesByNamespace(const RenderContext& ctx, const std::string& path,
                                                   Layout::SortOrder sort, bool flatten) {
    m_layout_paths.clear();
    LOG_DEBUG("Files by namespace under %s (sort: %s, flatten: %d)",
              path.c_str(), Layout::ToString(sort), flatten ? 1 : 0);

    std::map<std::string, std::vector<const TypeEntry*>> by_namespace;
    for (const auto* type : EmittableTypes(ctx)) {
        by_namespace[type->ns].push_back(type);
    }

    for (const auto& [ns, types] : by_namespace) {
        fs::path file_path = fs::path(path);
        if (flatten || ns.empty()) {
            file_path /= NamespaceFileStem(ns) + ".cs";
        } else {
            fs::path dirs = NamespaceDirectories(ns);
            file_path /= dirs.parent_path();
            file_path /= dirs.filename().string() + ".cs";
        }

        auto written = WriteTextFile(file_path.string(), FileHeader(ctx) + TypeBlocks(types, ctx));
        if (!written) return written;
    }
    return Result<void>::Ok();
}

Result<void> CSharpRenderer::WriteFilesByAssembly(const RenderContext& ctx, const std::string& path,
                                                  Layout::SortOrder sort, bool separate_attributes) {
    m_layout_paths.clear();
    LOG_DEBUG("Files by assembly under %s (sort: %s, separate attributes: %d)",
              path.c_str(), Layout::ToString(sort), separate_attributes ? 1 : 0);

    std::map<std::string, std::vector<const TypeEntry*>> by_assembly;
    for (const auto* type : EmittableTypes(ctx)) {
        by_assembly[type->assembly].push_back(type);
    }

    for (const auto& [assembly, types] : by_assembly) {
        std::string stem = AssemblyStem(assembly);
        const AssemblyInfo* asm_info = ctx.model.FindAssembly(assembly);

        std::stringstream file;
        file << FileHeader(ctx);
        if (asm_info && !separate_attributes) {
            file << AssemblyAttributes(*asm_info, ctx);
        }
        file << TypeBlocks(types, ctx);

        auto written = WriteTextFile((fs::path(path) / (stem + ".cs")).string(), file.str());
        if (!written) return written;

        if (separate_attributes) {
            std::string attributes = asm_info ? AssemblyAttributes(*asm_info, ctx) : std::string();
            written = WriteTextFile((fs::path(path) / stem / "AssemblyInfo.cs").string(),
                                    FileHeader(ctx) + attributes);
            if (!written) return written;
        }
    }
    return Result<void>::Ok();
}

Result<void> CSharpRenderer::WriteFilesByClass(const RenderContext& ctx, const std::string& path,
                                               bool flatten) {
    m_layout_paths.clear();
    LOG_DEBUG("Files by class under %s (flatten: %d)", path.c_str(), flatten ? 1 : 0);

    for (const auto* type : EmittableTypes(ctx)) {
        fs::path dir = fs::path(path);
        if (!type->ns.empty()) {
            dir /= flatten ? fs::path(SafeFileComponent(type->ns)) : NamespaceDirectories(type->ns);
        }

        auto written = WriteTextFile((dir / (SafeFileComponent(type->name) + ".cs")).string(),
                                     FileHeader(ctx) + TypeBlocks({ type }, ctx));
        if (!written) return written;
    }
    return Result<void>::Ok();
}

Result<void> CSharpRenderer::WriteFilesByClassTree(const RenderContext& ctx, const std::string& path,
                                                   bool separate_attributes) {
    m_layout_paths.clear();
    return WriteClassTree(ctx, path, separate_attributes);
}

Result<void> CSharpRenderer::WriteClassTree(const RenderContext& ctx, const std::string& path,
                                            bool separate_attributes) {
    LOG_DEBUG("Class tree under %s (separate attributes: %d)", path.c_str(), separate_attributes ? 1 : 0);

    std::map<std::string, bool> assemblies_seen;
    for (const auto* type : EmittableTypes(ctx)) {
        fs::path dir = fs::path(path) / AssemblyStem(type->assembly) / NamespaceDirectories(type->ns);

        auto written = WriteTextFile((dir / (SafeFileComponent(type->name) + ".cs")).string(),
                                     FileHeader(ctx) + TypeBlocks({ type }, ctx));
        if (!written) return written;
        assemblies_seen[type->assembly] = true;
    }

    // Without separate files, assembly attributes are not emitted in tree layout
    if (!separate_attributes) return Result<void>::Ok();

    for (const auto& [assembly, seen] : assemblies_seen) {
        const AssemblyInfo* asm_info = ctx.model.FindAssembly(assembly);
        std::string attributes = asm_info ? AssemblyAttributes(*asm_info, ctx) : std::string();

        fs::path info_path = fs::path(path) / AssemblyStem(assembly) / "Properties" / "AssemblyInfo.cs";
        auto written = WriteTextFile(info_path.string(), FileHeader(ctx) + attributes);
        if (!written) return written;
    }
    return Result<void>::Ok();
}

// ============================================================================
// Solution Output
// ============================================================================

static uint64_t Fnv1a64(const std::string& text, uint64_t seed) {
    uint64_t hash = seed;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string CSharpRenderer::ProjectGuid(const std::string& name) {
    uint64_t hi = Fnv1a64(name, 14695981039346656037ULL);
    uint64_t lo = Fnv1a64(name + "#project", hi);

    char guid[40];
    snprintf(guid, sizeof(guid), "{%08X-%04X-%04X-%04X-%012llX}",
             static_cast<unsigned>(hi >> 32),
             static_cast<unsigned>((hi >> 16) & 0xFFFF),
             static_cast<unsigned>(hi & 0xFFFF),
             static_cast<unsigned>(lo >> 48),
             static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return guid;
}

static std::string ProjectFile(const std::string& stem, const std::string& toolchain_root,
                               const std::string& toolchain_assemblies_root) {
    fs::path managed = fs::path(toolchain_root) / "Editor" / "Data" / "Managed";

    std::stringstream ss;
    ss << "<Project Sdk=\"Microsoft.NET.Sdk\">\n";
    ss << "  <PropertyGroup>\n";
    ss << "    <TargetFramework>netstandard2.0</TargetFramework>\n";
    ss << "    <AssemblyName>" << XmlEscape(stem) << "</AssemblyName>\n";
    ss << "    <GenerateAssemblyInfo>false</GenerateAssemblyInfo>\n";
    ss << "    <NoWarn>0108;0114;0162;0168;0219</NoWarn>\n";
    ss << "  </PropertyGroup>\n";
    ss << "  <ItemGroup>\n";
    ss << "    <Reference Include=\"UnityEngine\">\n";
    ss << "      <HintPath>" << XmlEscape((managed / "UnityEngine.dll").string()) << "</HintPath>\n";
    ss << "    </Reference>\n";
    ss << "    <Reference Include=\"UnityEditor\">\n";
    ss << "      <HintPath>" << XmlEscape((managed / "UnityEditor.dll").string()) << "</HintPath>\n";
    ss << "    </Reference>\n";
    ss << "    <Reference Include=\"UnityEngine.UI\">\n";
    ss << "      <HintPath>" << XmlEscape((fs::path(toolchain_assemblies_root) / "UnityEngine.UI.dll").string())
       << "</HintPath>\n";
    ss << "    </Reference>\n";
    ss << "  </ItemGroup>\n";
    ss << "</Project>\n";
    return ss.str();
}

static std::string SolutionFile(const std::vector<std::string>& stems) {
    // C# project type GUID used by SDK-style projects
    const char* csharp_project_type = "{9A19103F-16F7-4668-BE54-9A1E7A4F7556}";

    std::stringstream ss;
    ss << "\nMicrosoft Visual Studio Solution File, Format Version 12.00\n";
    ss << "# Visual Studio Version 16\n";
    for (const auto& stem : stems) {
        ss << "Project(\"" << csharp_project_type << "\") = \"" << stem << "\", \""
           << stem << "\\" << stem << ".csproj\", \"" << CSharpRenderer::ProjectGuid(stem) << "\"\n";
        ss << "EndProject\n";
    }
    ss << "Global\n";
    ss << "\tGlobalSection(SolutionConfigurationPlatforms) = preSolution\n";
    ss << "\t\tDebug|Any CPU = Debug|Any CPU\n";
    ss << "\t\tRelease|Any CPU = Release|Any CPU\n";
    ss << "\tEndGlobalSection\n";
    ss << "\tGlobalSection(ProjectConfigurationPlatforms) = postSolution\n";
    for (const auto& stem : stems) {
        std::string guid = CSharpRenderer::ProjectGuid(stem);
        ss << "\t\t" << guid << ".Debug|Any CPU.ActiveCfg = Debug|Any CPU\n";
        ss << "\t\t" << guid << ".Debug|Any CPU.Build.0 = Debug|Any CPU\n";
        ss << "\t\t" << guid << ".Release|Any CPU.ActiveCfg = Release|Any CPU\n";
        ss << "\t\t" << guid << ".Release|Any CPU.Build.0 = Release|Any CPU\n";
    }
    ss << "\tEndGlobalSection\n";
    ss << "EndGlobal\n";
    return ss.str();
}

Result<void> CSharpRenderer::WriteSolution(const RenderContext& ctx, const std::string& path,
                                           const std::string& toolchain_root,
                                           const std::string& toolchain_assemblies_root) {
    m_layout_paths.clear();
    LOG_DEBUG("Solution under %s", path.c_str());

    auto tree = WriteClassTree(ctx, path, true);
    if (!tree) return tree;

    // One project per assembly that received at least one type, in discovery order
    std::map<std::string, bool> has_types;
    for (const auto* type : EmittableTypes(ctx)) {
        has_types[type->assembly] = true;
    }

    std::vector<std::string> stems;
    auto add_project = [&](const std::string& assembly) -> Result<void> {
        std::string stem = AssemblyStem(assembly);
        stems.push_back(stem);
        fs::path project_path = fs::path(path) / stem / (stem + ".csproj");
        return WriteTextFile(project_path.string(),
                             ProjectFile(stem, toolchain_root, toolchain_assemblies_root));
    };

    for (const auto& asm_info : ctx.model.assemblies) {
        if (has_types.erase(asm_info.name) == 0) continue;
        auto written = add_project(asm_info.name);
        if (!written) return written;
    }
    // Types whose assembly the model never listed
    for (const auto& [assembly, seen] : has_types) {
        auto written = add_project(assembly);
        if (!written) return written;
    }

    std::string solution_name = SafeFileComponent(fs::path(ctx.model.image_name).stem().string());
    if (solution_name.empty()) solution_name = "Solution";
    return WriteTextFile((fs::path(path) / (solution_name + ".sln")).string(), SolutionFile(stems));
}

} // namespace Codegen
} // namespace CSD
