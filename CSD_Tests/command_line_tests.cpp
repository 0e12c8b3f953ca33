#include "core/command_line.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

using namespace CSD;
using namespace CSD::Cli;

namespace {

Result<CommandLine> Parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{ "csd-dump" };
    argv.insert(argv.end(), args.begin(), args.end());
    return ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(CommandLineTest, Defaults) {
    auto parsed = Parse({});
    ASSERT_TRUE(parsed);

    const CommandLine& cmd = parsed.value;
    EXPECT_EQ(cmd.binary_file, "libil2cpp.so");
    EXPECT_EQ(cmd.metadata_file, "global-metadata.dat");
    EXPECT_TRUE(cmd.log_file.empty());
    EXPECT_EQ(cmd.options.layout, Layout::LayoutSchema::Single);
    EXPECT_EQ(cmd.options.sort, Layout::SortOrder::Index);
    EXPECT_EQ(cmd.options.output_base_path, "types.cs");
    EXPECT_EQ(cmd.options.script_output_path, "il2cpp.py");
    EXPECT_EQ(cmd.options.excluded_namespaces, Layout::DumpOptions::DefaultExcludedNamespaces());
    EXPECT_EQ(cmd.options.toolchain_root, DefaultToolchainRoot());
    EXPECT_EQ(cmd.options.toolchain_assemblies_root, DefaultToolchainAssembliesRoot(DefaultToolchainRoot()));
    EXPECT_FALSE(cmd.show_help);
}

TEST(CommandLineTest, ShortAndLongOptions) {
    auto parsed = Parse({ "-i", "game.so", "--metadata", "meta.dat", "-c", "out/cs", "--py-out=out/x.py",
                          "-l", "Namespace", "--sort", "NAME", "-f", "-n", "-k", "--separate-attributes",
                          "--log-file", "dump.log" });
    ASSERT_TRUE(parsed) << parsed.detail;

    const CommandLine& cmd = parsed.value;
    EXPECT_EQ(cmd.binary_file, "game.so");
    EXPECT_EQ(cmd.metadata_file, "meta.dat");
    EXPECT_EQ(cmd.options.output_base_path, "out/cs");
    EXPECT_EQ(cmd.options.script_output_path, "out/x.py");
    EXPECT_EQ(cmd.options.layout, Layout::LayoutSchema::Namespace);
    EXPECT_EQ(cmd.options.sort, Layout::SortOrder::Name);
    EXPECT_TRUE(cmd.options.flatten_hierarchy);
    EXPECT_TRUE(cmd.options.suppress_metadata);
    EXPECT_TRUE(cmd.options.must_compile);
    EXPECT_TRUE(cmd.options.separate_assembly_attributes);
    EXPECT_FALSE(cmd.options.create_solution);
    EXPECT_EQ(cmd.log_file, "dump.log");
}

TEST(CommandLineTest, ExcludedNamespaceList) {
    auto parsed = Parse({ "-e", " Game.Core , Plugin,," });
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.options.excluded_namespaces, (std::set<std::string>{ "Game.Core", "Plugin" }));

    parsed = Parse({ "--exclude-namespaces", "None" });
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value.options.excluded_namespaces.empty());
}

TEST(CommandLineTest, AssembliesPathFollowsExplicitEditorPath) {
    auto parsed = Parse({ "-j", "--unity-path", "/opt/unity/*" });
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value.options.create_solution);
    EXPECT_EQ(parsed.value.options.toolchain_root, "/opt/unity/*");
    EXPECT_EQ(parsed.value.options.toolchain_assemblies_root, DefaultToolchainAssembliesRoot("/opt/unity/*"));

    parsed = Parse({ "--unity-path", "/opt/unity/*", "--unity-assemblies", "/opt/asm" });
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.options.toolchain_assemblies_root, "/opt/asm");
}

TEST(CommandLineTest, DefaultEditorPathIsUnderHome) {
    const char* home = std::getenv("HOME");
    std::string expected = std::string(home ? home : "") + "/Unity/Hub/Editor/*";
    EXPECT_EQ(DefaultToolchainRoot(), expected);
    EXPECT_EQ(DefaultToolchainAssembliesRoot("/u"),
              "/u/Editor/Data/Resources/PackageManager/ProjectTemplates/libcache/com.unity.template.3d-*/ScriptAssemblies");
}

TEST(CommandLineTest, HelpAndVersion) {
    EXPECT_TRUE(Parse({ "-h" }).value.show_help);
    EXPECT_TRUE(Parse({ "--version" }).value.show_version);
}

TEST(CommandLineTest, RejectsBadInput) {
    auto unknown = Parse({ "--frobnicate" });
    EXPECT_EQ(unknown.status, Status::InvalidArguments);
    EXPECT_NE(unknown.detail.find("--frobnicate"), std::string::npos);

    EXPECT_EQ(Parse({ "-i" }).status, Status::InvalidArguments);
    EXPECT_EQ(Parse({ "--layout", "folders" }).status, Status::InvalidArguments);
    EXPECT_EQ(Parse({ "-s", "size" }).status, Status::InvalidArguments);
    EXPECT_EQ(Parse({ "--flatten=yes" }).status, Status::InvalidArguments);
}
