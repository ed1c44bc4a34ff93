//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/GraphDatabaseTests.cpp
// Purpose: Load build graph exports and resolve deferred values through them.
// Key invariants: Interface properties follow interface links; first occurrence wins.
// Ownership/Lifetime: Each test owns its GraphDatabase.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SessionFixture.hpp"
#include "session/GraphDatabase.hpp"

using namespace clingkit::session;
using clingkit::support::ErrorCode;

namespace
{

constexpr std::string_view kAdderGraph = R"JSON({
  "project": "adder",
  "targets": {
    "adder": {
      "type": "SHARED_LIBRARY",
      "file": "/build/src/libadder.so",
      "cxx_standard": 17,
      "properties": {
        "INTERFACE_INCLUDE_DIRECTORIES": ["$<BUILD_INTERFACE:/src/include/>", "$<INSTALL_INTERFACE:include>"]
      }
    },
    "adder2": {
      "file": "/build/src/libadder2.so",
      "properties": {
        "INTERFACE_INCLUDE_DIRECTORIES": "$<BUILD_INTERFACE:/src/include/>",
        "INTERFACE_COMPILE_DEFINITIONS": ["ADDER2=1"]
      },
      "interface_link_libraries": ["adder", "m"]
    },
    "tool": { "type": "EXECUTABLE", "file": "/build/tool", "cxx_standard": "14" }
  }
})JSON";

GraphDatabase adderGraph()
{
    auto graph = GraphDatabase::parse(kAdderGraph, "graph.json");
    EXPECT_TRUE(graph) << (graph ? "" : graph.error().message);
    return graph ? graph.value() : GraphDatabase("invalid");
}

std::vector<std::string> resolve(const GraphDatabase &graph, const std::string &text)
{
    auto items = graph.resolve(makeProperty(text));
    EXPECT_TRUE(items) << (items ? "" : items.error().message);
    return items ? items.value() : std::vector<std::string>{};
}

} // namespace

TEST(GraphDatabaseTest, ParsesTargets)
{
    GraphDatabase graph = adderGraph();
    EXPECT_EQ(graph.projectName(), "adder");

    const TargetInfo *adder = graph.findTarget("adder");
    ASSERT_NE(adder, nullptr);
    EXPECT_EQ(adder->kind, TargetKind::SharedLibrary);
    EXPECT_EQ(adder->standard, CxxStandard::Cxx17);

    const TargetInfo *adder2 = graph.findTarget("adder2");
    ASSERT_NE(adder2, nullptr);
    EXPECT_EQ(adder2->kind, TargetKind::SharedLibrary);
    EXPECT_FALSE(adder2->standard.has_value());

    const TargetInfo *tool = graph.findTarget("tool");
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->kind, TargetKind::Executable);
    EXPECT_EQ(tool->standard, CxxStandard::Cxx14);

    EXPECT_EQ(graph.findTarget("missing"), nullptr);
}

TEST(GraphDatabaseTest, ResolvesLiteralsWithoutEvaluation)
{
    GraphDatabase graph = adderGraph();
    EXPECT_EQ(resolve(graph, "/usr/include"), (std::vector<std::string>{"/usr/include"}));
    EXPECT_TRUE(resolve(graph, "").empty());
}

TEST(GraphDatabaseTest, InterfacePropertiesAreTransitive)
{
    GraphDatabase graph = adderGraph();
    EXPECT_EQ(resolve(graph, "$<TARGET_PROPERTY:adder2,INTERFACE_INCLUDE_DIRECTORIES>"),
              (std::vector<std::string>{"/src/include/"}));
    EXPECT_EQ(resolve(graph, "$<TARGET_PROPERTY:adder2,INTERFACE_COMPILE_DEFINITIONS>"),
              (std::vector<std::string>{"ADDER2=1"}));
    EXPECT_TRUE(resolve(graph, "$<TARGET_PROPERTY:adder,INTERFACE_COMPILE_FLAGS>").empty());
    EXPECT_EQ(resolve(graph, "$<TARGET_FILE:adder2>"), (std::vector<std::string>{"/build/src/libadder2.so"}));
}

TEST(GraphDatabaseTest, RejectsInterfaceCycles)
{
    GraphDatabase graph("cyclic");
    auto a = clingkit::tests::sharedLibrary("a", "/b/liba.so");
    a.properties["INTERFACE_INCLUDE_DIRECTORIES"] = {"/a"};
    a.interfaceLinks = {"b"};
    auto b = clingkit::tests::sharedLibrary("b", "/b/libb.so");
    b.interfaceLinks = {"a"};
    graph.addTarget(a);
    graph.addTarget(b);

    auto items = graph.resolve(makeProperty("$<TARGET_PROPERTY:a,INTERFACE_INCLUDE_DIRECTORIES>"));
    ASSERT_FALSE(items);
    EXPECT_EQ(items.error().code, ErrorCode::InvalidConfiguration);
    EXPECT_NE(items.error().message.find("cyclic"), std::string::npos);
}

TEST(GraphDatabaseTest, ReportsMalformedDocuments)
{
    auto notJson = GraphDatabase::parse("{ nope", "broken.json");
    ASSERT_FALSE(notJson);
    EXPECT_EQ(notJson.error().code, ErrorCode::InvalidConfiguration);
    EXPECT_EQ(notJson.error().message.rfind("broken.json: ", 0), 0u);

    auto badType = GraphDatabase::parse(R"({"targets": {"x": {"type": "DLL"}}})", "g.json");
    ASSERT_FALSE(badType);
    EXPECT_NE(badType.error().message.find("unknown type 'DLL'"), std::string::npos);

    auto badStandard = GraphDatabase::parse(R"({"targets": {"x": {"cxx_standard": 16}}})", "g.json");
    ASSERT_FALSE(badStandard);

    auto missing = GraphDatabase::load("/nonexistent/clingkit/graph.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::Io);
}

TEST(GraphDatabaseTest, TargetWithoutArtifact)
{
    auto graph = GraphDatabase::parse(R"({"targets": {"iface": {"type": "INTERFACE_LIBRARY"}}})", "g.json");
    ASSERT_TRUE(graph);
    auto items = graph.value().resolve(makeProperty("$<TARGET_FILE:iface>"));
    ASSERT_FALSE(items);
    EXPECT_EQ(items.error().code, ErrorCode::InvalidConfiguration);
}
