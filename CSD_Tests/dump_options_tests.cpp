#include "layout/dump_options.hpp"

#include <gtest/gtest.h>

using namespace CSD::Layout;

TEST(DumpOptionsTest, Defaults) {
    DumpOptions options;
    EXPECT_EQ(options.layout, LayoutSchema::Single);
    EXPECT_EQ(options.sort, SortOrder::Index);
    EXPECT_FALSE(options.create_solution);
    EXPECT_EQ(options.output_base_path, "types.cs");
    EXPECT_EQ(options.script_output_path, "il2cpp.py");
    EXPECT_EQ(options.excluded_namespaces.count("System"), 1u);
    EXPECT_EQ(options.excluded_namespaces.count("UnityEngine"), 1u);
}

TEST(DumpOptionsTest, SolutionModeOverridesWithoutMutatingInput) {
    DumpOptions options;
    options.layout = LayoutSchema::Namespace;
    options.create_solution = true;

    DumpOptions effective = EffectiveOptions(options);
    EXPECT_EQ(effective.layout, LayoutSchema::Tree);
    EXPECT_TRUE(effective.must_compile);
    EXPECT_TRUE(effective.separate_assembly_attributes);

    EXPECT_EQ(options.layout, LayoutSchema::Namespace);
    EXPECT_FALSE(options.must_compile);
    EXPECT_FALSE(options.separate_assembly_attributes);
}

TEST(DumpOptionsTest, WithoutSolutionModeOptionsPassThrough) {
    DumpOptions options;
    options.layout = LayoutSchema::Assembly;
    options.sort = SortOrder::Name;

    DumpOptions effective = EffectiveOptions(options);
    EXPECT_EQ(effective.layout, LayoutSchema::Assembly);
    EXPECT_EQ(effective.sort, SortOrder::Name);
    EXPECT_FALSE(effective.must_compile);
}

TEST(DumpOptionsTest, ExclusionCoversNestedNamespacesOnly) {
    std::set<std::string> excluded{ "System", "Microsoft.Win32" };

    EXPECT_TRUE(IsNamespaceExcluded("System", excluded));
    EXPECT_TRUE(IsNamespaceExcluded("System.Collections.Generic", excluded));
    EXPECT_TRUE(IsNamespaceExcluded("Microsoft.Win32.SafeHandles", excluded));

    EXPECT_FALSE(IsNamespaceExcluded("SystemX", excluded));
    EXPECT_FALSE(IsNamespaceExcluded("Microsoft", excluded));
    EXPECT_FALSE(IsNamespaceExcluded("", excluded));
    EXPECT_FALSE(IsNamespaceExcluded("Game.System", excluded));
}

TEST(DumpOptionsTest, ParsingIsCaseInsensitive) {
    EXPECT_EQ(ParseLayoutSchema("Tree"), LayoutSchema::Tree);
    EXPECT_EQ(ParseLayoutSchema("NAMESPACE"), LayoutSchema::Namespace);
    EXPECT_EQ(ParseSortOrder("Name"), SortOrder::Name);
    EXPECT_EQ(ParseSortOrder("index"), SortOrder::Index);

    EXPECT_FALSE(ParseLayoutSchema("folder").has_value());
    EXPECT_FALSE(ParseSortOrder("").has_value());
}

TEST(DumpOptionsTest, NamesRoundTrip) {
    for (auto layout : { LayoutSchema::Single, LayoutSchema::Namespace, LayoutSchema::Assembly,
                         LayoutSchema::Class, LayoutSchema::Tree }) {
        EXPECT_EQ(ParseLayoutSchema(ToString(layout)), layout);
    }
}
