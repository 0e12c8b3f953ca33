#include "layout/layout_dispatch.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace CSD;
using namespace CSD::Layout;

namespace {

Model::TypeEntry MakeType(int32_t index, const std::string& ns, const std::string& name,
                          const std::string& assembly = "Assembly-CSharp.dll") {
    Model::TypeEntry type;
    type.index = index;
    type.ns = ns;
    type.name = name;
    type.assembly = assembly;
    return type;
}

// Records which renderer entry point was called and what it was given.
class RecordingRenderer : public Codegen::SourceRenderer {
public:
    struct Call {
        std::string method;
        std::string path;
        std::vector<std::string> type_names;
        bool flatten = false;
        bool separate_attributes = false;
        bool must_compile = false;
        bool suppress_metadata = false;
        std::string toolchain_root;
        std::string toolchain_assemblies_root;
    };

    Result<void> WriteSingleFile(const Codegen::RenderContext& ctx, const std::string& path,
                                 SortOrder) override {
        Record("single", ctx, path);
        return Result<void>::Ok();
    }
    Result<void> WriteFilesByNamespace(const Codegen::RenderContext& ctx, const std::string& path,
                                       SortOrder, bool flatten) override {
        Record("namespace", ctx, path).flatten = flatten;
        return Result<void>::Ok();
    }
    Result<void> WriteFilesByAssembly(const Codegen::RenderContext& ctx, const std::string& path,
                                      SortOrder, bool separate_attributes) override {
        Record("assembly", ctx, path).separate_attributes = separate_attributes;
        return Result<void>::Ok();
    }
    Result<void> WriteFilesByClass(const Codegen::RenderContext& ctx, const std::string& path,
                                   bool flatten) override {
        Record("class", ctx, path).flatten = flatten;
        return Result<void>::Ok();
    }
    Result<void> WriteFilesByClassTree(const Codegen::RenderContext& ctx, const std::string& path,
                                       bool separate_attributes) override {
        Record("tree", ctx, path).separate_attributes = separate_attributes;
        return Result<void>::Ok();
    }
    Result<void> WriteSolution(const Codegen::RenderContext& ctx, const std::string& path,
                               const std::string& toolchain_root,
                               const std::string& toolchain_assemblies_root) override {
        Call& call = Record("solution", ctx, path);
        call.toolchain_root = toolchain_root;
        call.toolchain_assemblies_root = toolchain_assemblies_root;
        return Result<void>::Ok();
    }

    std::vector<Call> calls;

private:
    Call& Record(const char* method, const Codegen::RenderContext& ctx, const std::string& path) {
        Call call;
        call.method = method;
        call.path = path;
        for (const auto* type : ctx.types) call.type_names.push_back(type->FullName());
        call.must_compile = ctx.must_compile;
        call.suppress_metadata = ctx.suppress_metadata;
        calls.push_back(call);
        return calls.back();
    }
};

class LayoutDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        image.index = 0;
        image.name = "GameAssembly";
        model.image_name = "GameAssembly";
        model.types = {
            MakeType(3, "Game", "Zeta"),
            MakeType(1, "Game", "Alpha"),
            MakeType(2, "System.Collections", "Hidden"),
            MakeType(0, "Game.UI", "Menu"),
        };
        options.excluded_namespaces = { "System" };
    }

    Result<void> DispatchOnce() {
        return Dispatch(image, model, options, "out/types.cs", renderer, toolchain);
    }

    Model::Image image;
    Model::TypeModel model;
    DumpOptions options;
    ToolchainPaths toolchain{ "/unity/2022", "/unity/2022/ScriptAssemblies" };
    RecordingRenderer renderer;
};

} // namespace

TEST_F(LayoutDispatchTest, SingleLayoutByIndex) {
    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_EQ(renderer.calls[0].method, "single");
    EXPECT_EQ(renderer.calls[0].path, "out/types.cs");
    EXPECT_EQ(renderer.calls[0].type_names,
              (std::vector<std::string>{ "Game.UI.Menu", "Game.Alpha", "Game.Zeta" }));
}

TEST_F(LayoutDispatchTest, NamespaceLayoutByName) {
    options.layout = LayoutSchema::Namespace;
    options.sort = SortOrder::Name;
    options.flatten_hierarchy = true;

    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_EQ(renderer.calls[0].method, "namespace");
    EXPECT_TRUE(renderer.calls[0].flatten);
    EXPECT_EQ(renderer.calls[0].type_names,
              (std::vector<std::string>{ "Game.Alpha", "Game.UI.Menu", "Game.Zeta" }));
}

TEST_F(LayoutDispatchTest, NamespaceLayoutByIndex) {
    options.layout = LayoutSchema::Namespace;

    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_EQ(renderer.calls[0].method, "namespace");
    EXPECT_FALSE(renderer.calls[0].flatten);
    EXPECT_EQ(renderer.calls[0].type_names,
              (std::vector<std::string>{ "Game.UI.Menu", "Game.Alpha", "Game.Zeta" }));
}

TEST_F(LayoutDispatchTest, AssemblyLayoutPassesSeparateAttributes) {
    options.layout = LayoutSchema::Assembly;
    options.separate_assembly_attributes = true;

    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_EQ(renderer.calls[0].method, "assembly");
    EXPECT_TRUE(renderer.calls[0].separate_attributes);
}

TEST_F(LayoutDispatchTest, ClassAndTreeLayoutsIgnoreSortKey) {
    options.layout = LayoutSchema::Class;
    options.sort = SortOrder::Name;
    ASSERT_TRUE(DispatchOnce());

    options.layout = LayoutSchema::Tree;
    ASSERT_TRUE(DispatchOnce());

    ASSERT_EQ(renderer.calls.size(), 2u);
    EXPECT_EQ(renderer.calls[0].method, "class");
    EXPECT_EQ(renderer.calls[1].method, "tree");
    for (const auto& call : renderer.calls) {
        EXPECT_EQ(call.type_names,
                  (std::vector<std::string>{ "Game.UI.Menu", "Game.Alpha", "Game.Zeta" }));
    }
}

TEST_F(LayoutDispatchTest, SolutionModeForcesTreeWithCompilableOutput) {
    options.layout = LayoutSchema::Single;
    options.create_solution = true;

    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_EQ(renderer.calls[0].method, "solution");
    EXPECT_TRUE(renderer.calls[0].must_compile);
    EXPECT_EQ(renderer.calls[0].toolchain_root, "/unity/2022");
    EXPECT_EQ(renderer.calls[0].toolchain_assemblies_root, "/unity/2022/ScriptAssemblies");

    // Configured options stay as given
    EXPECT_EQ(options.layout, LayoutSchema::Single);
    EXPECT_FALSE(options.must_compile);
}

TEST_F(LayoutDispatchTest, SuppressMetadataReachesRenderer) {
    options.suppress_metadata = true;
    ASSERT_TRUE(DispatchOnce());
    ASSERT_EQ(renderer.calls.size(), 1u);
    EXPECT_TRUE(renderer.calls[0].suppress_metadata);
}

TEST_F(LayoutDispatchTest, UnknownLayoutIsUnsupportedCombination) {
    options.layout = static_cast<LayoutSchema>(99);

    auto result = DispatchOnce();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, Status::UnsupportedCombination);
    EXPECT_TRUE(renderer.calls.empty());
}

TEST_F(LayoutDispatchTest, UnknownSortIsUnsupportedForSortedLayouts) {
    options.layout = LayoutSchema::Assembly;
    options.sort = static_cast<SortOrder>(7);

    auto result = DispatchOnce();
    EXPECT_EQ(result.status, Status::UnsupportedCombination);
    EXPECT_TRUE(renderer.calls.empty());
}

TEST(SelectTypesTest, EmptyExclusionKeepsEverything) {
    Model::TypeModel model;
    model.types = { MakeType(5, "System", "Object"), MakeType(4, "", "Program") };

    auto types = SelectTypes(model, {}, SortOrder::Index);
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0]->name, "Program");
    EXPECT_EQ(types[1]->name, "Object");
}

TEST(SelectTypesTest, TiesBreakOnTheOtherKey) {
    Model::TypeModel model;
    model.types = { MakeType(9, "B", "Same"), MakeType(2, "A", "Same"), MakeType(2, "C", "Other") };

    auto by_name = SelectTypes(model, {}, SortOrder::Name);
    ASSERT_EQ(by_name.size(), 3u);
    EXPECT_EQ(by_name[0]->FullName(), "C.Other");
    EXPECT_EQ(by_name[1]->FullName(), "A.Same");
    EXPECT_EQ(by_name[2]->FullName(), "B.Same");

    auto by_index = SelectTypes(model, {}, SortOrder::Index);
    EXPECT_EQ(by_index[0]->FullName(), "C.Other");
    EXPECT_EQ(by_index[1]->FullName(), "A.Same");
    EXPECT_EQ(by_index[2]->FullName(), "B.Same");
}
