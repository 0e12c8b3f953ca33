#include "command_line.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace CSD {
namespace Cli {

std::string DefaultToolchainRoot() {
    const char* home = std::getenv("HOME");
    std::string base = home ? home : "";
    return base + "/Unity/Hub/Editor/*";
}

std::string DefaultToolchainAssembliesRoot(const std::string& toolchain_root) {
    return toolchain_root
        + "/Editor/Data/Resources/PackageManager/ProjectTemplates/libcache/com.unity.template.3d-*/ScriptAssemblies";
}

void PrintBanner(FILE* out) {
    fprintf(out, "CSD Dumper\n");
    fprintf(out, "Version %s\n", CSD_VERSION);
    fprintf(out, "C# signature and solution generator for IL2CPP type listings\n");
    fprintf(out, "Copyright (c) CSD Dumper contributors\n");
    fprintf(out, "\n");
}

void PrintUsage(FILE* out) {
    fprintf(out,
        "Usage: csd-dump [options]\n"
        "\n"
        "  -i, --bin <file>                 IL2CPP binary file input (default: libil2cpp.so)\n"
        "  -m, --metadata <file>            IL2CPP metadata file input (default: global-metadata.dat)\n"
        "  -c, --cs-out <path>              C# output file (single-file layout) or path (other layouts)\n"
        "                                   (default: types.cs)\n"
        "  -p, --py-out <file>              Python script output file (default: il2cpp.py)\n"
        "  -e, --exclude-namespaces <list>  Comma-separated namespaces to suppress in C# output,\n"
        "                                   or 'none' to include all namespaces\n"
        "  -l, --layout <schema>            single | namespace | assembly | class | tree (default: single)\n"
        "  -s, --sort <order>               index | name (default: index); no effect for class/tree\n"
        "  -f, --flatten                    Flatten the namespace hierarchy into a single folder\n"
        "                                   (namespace and class layouts)\n"
        "  -n, --suppress-metadata          Diff tidying: omit method pointers, field offsets and type indices\n"
        "  -k, --must-compile               Compilation tidying: try really hard to emit code that compiles\n"
        "      --separate-attributes        Place assembly-level attributes in AssemblyInfo.cs files\n"
        "                                   (assembly and tree layouts)\n"
        "  -j, --project                    Create a solution and projects; implies --layout tree,\n"
        "                                   --must-compile and --separate-attributes\n"
        "      --unity-path <path>          Unity editor path (with --project); '*' selects the last\n"
        "                                   matching folder in ordinal order\n"
        "      --unity-assemblies <path>    Unity script assemblies path (with --project); wildcards as above\n"
        "      --log-file <file>            Also append log output to this file\n"
        "  -h, --help                       Show this help\n"
        "      --version                    Show version information\n");
}

static std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::set<std::string> ParseNamespaceList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = Trim(value.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }

    if (items.size() == 1 && ToLower(items[0]) == "none") {
        return {};
    }
    return std::set<std::string>(items.begin(), items.end());
}

Result<CommandLine> ParseCommandLine(int argc, const char* const argv[]) {
    CommandLine cmd;
    std::string unity_path;
    std::string unity_assemblies;

    auto fail = [](const std::string& message) {
        return Result<CommandLine>::Fail(Status::InvalidArguments, message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string inline_value;
        bool has_inline_value = false;

        // --flag=value
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline_value = true;
            }
        }

        bool consumed_value = false;
        auto take_value = [&](std::string& out) -> bool {
            consumed_value = true;
            if (has_inline_value) { out = inline_value; return true; }
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        auto is = [&](const char* short_name, const char* long_name) {
            return (short_name && arg == short_name) || arg == long_name;
        };

        std::string value;

        if (is("-h", "--help")) {
            cmd.show_help = true;
        } else if (is(nullptr, "--version")) {
            cmd.show_version = true;
        } else if (is("-i", "--bin")) {
            if (!take_value(cmd.binary_file)) return fail("Missing value for " + arg);
        } else if (is("-m", "--metadata")) {
            if (!take_value(cmd.metadata_file)) return fail("Missing value for " + arg);
        } else if (is("-c", "--cs-out")) {
            if (!take_value(cmd.options.output_base_path)) return fail("Missing value for " + arg);
        } else if (is("-p", "--py-out")) {
            if (!take_value(cmd.options.script_output_path)) return fail("Missing value for " + arg);
        } else if (is("-e", "--exclude-namespaces")) {
            if (!take_value(value)) return fail("Missing value for " + arg);
            cmd.options.excluded_namespaces = ParseNamespaceList(value);
        } else if (is("-l", "--layout")) {
            if (!take_value(value)) return fail("Missing value for " + arg);
            auto layout = Layout::ParseLayoutSchema(value);
            if (!layout) {
                return fail("Unknown layout '" + value + "' (expected single, namespace, assembly, class or tree)");
            }
            cmd.options.layout = *layout;
        } else if (is("-s", "--sort")) {
            if (!take_value(value)) return fail("Missing value for " + arg);
            auto sort = Layout::ParseSortOrder(value);
            if (!sort) return fail("Unknown sort order '" + value + "' (expected index or name)");
            cmd.options.sort = *sort;
        } else if (is("-f", "--flatten")) {
            cmd.options.flatten_hierarchy = true;
        } else if (is("-n", "--suppress-metadata")) {
            cmd.options.suppress_metadata = true;
        } else if (is("-k", "--must-compile")) {
            cmd.options.must_compile = true;
        } else if (is(nullptr, "--separate-attributes")) {
            cmd.options.separate_assembly_attributes = true;
        } else if (is("-j", "--project")) {
            cmd.options.create_solution = true;
        } else if (is(nullptr, "--unity-path")) {
            if (!take_value(unity_path)) return fail("Missing value for " + arg);
        } else if (is(nullptr, "--unity-assemblies")) {
            if (!take_value(unity_assemblies)) return fail("Missing value for " + arg);
        } else if (is(nullptr, "--log-file")) {
            if (!take_value(cmd.log_file)) return fail("Missing value for " + arg);
        } else {
            return fail("Unknown option " + arg);
        }

        // Switches take no value
        if (has_inline_value && !consumed_value) {
            return fail("Option " + arg + " does not take a value");
        }
    }

    cmd.options.toolchain_root = unity_path.empty() ? DefaultToolchainRoot() : unity_path;
    cmd.options.toolchain_assemblies_root = unity_assemblies.empty()
        ? DefaultToolchainAssembliesRoot(cmd.options.toolchain_root)
        : unity_assemblies;

    return Result<CommandLine>::Ok(cmd);
}

} // namespace Cli
} // namespace CSD
