//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ArtifactComposerTests.cpp
// Purpose: Compose and render the bootstrap header and the session manifest.
// Key invariants: Deferred values resolving to nothing contribute no output.
// Ownership/Lifetime: Graphs are built in memory per test.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SessionFixture.hpp"
#include "session/ArtifactComposer.hpp"

#include <nlohmann/json.hpp>

using namespace clingkit::session;
using clingkit::support::ErrorCode;
using clingkit::tests::sharedLibrary;

namespace
{

GraphDatabase fooGraph()
{
    GraphDatabase graph("demo");
    auto foo = sharedLibrary("foo", "/b/libfoo.so");
    foo.properties["INTERFACE_INCLUDE_DIRECTORIES"] = {"/C"};
    foo.properties["INTERFACE_COMPILE_DEFINITIONS"] = {"FOO=1", "BAR"};
    graph.addTarget(foo);
    graph.addTarget(sharedLibrary("bare", "/b/libbare.so"));
    return graph;
}

ComposeContext context()
{
    return ComposeContext{"/opt/xeus/bin/xcpp", "demo", "/src/demo", "/build/demo"};
}

} // namespace

TEST(ArtifactComposerTest, DefaultDisplayNameAndIdentity)
{
    EXPECT_EQ(defaultDisplayName(CxxStandard::Cxx17, "adder"), "C++17 (adder)");
    EXPECT_EQ(deriveSessionId("C++17 (adder)"), "42ed68d4-2055-59bd-b44b-80b79d31f9cd");

    SessionRequest request;
    request.standard = CxxStandard::Cxx14;
    ComposedSession session = composeSession(request, context());
    EXPECT_EQ(session.displayName, "C++14 (demo)");
    EXPECT_EQ(session.sessionId, deriveSessionId("C++14 (demo)"));
    EXPECT_EQ(session.headerPath, std::filesystem::path("/build/demo/xeus_cling.hh"));
    EXPECT_EQ(session.manifestPath, std::filesystem::path("/build/demo/kernel.json"));

    request.kernelName = "Custom";
    EXPECT_EQ(composeSession(request, context()).displayName, "Custom");
}

TEST(ArtifactComposerTest, HeaderOrderingAndEmptySuppression)
{
    SessionRequest request;
    request.includeDirectories = {LiteralValue{"/A"},
                                  LiteralValue{"/B"},
                                  DeferredValue{"$<TARGET_PROPERTY:foo,INTERFACE_INCLUDE_DIRECTORIES>"},
                                  DeferredValue{"$<TARGET_PROPERTY:bare,INTERFACE_INCLUDE_DIRECTORIES>"}};
    request.libraryDirectories = {LiteralValue{"/opt/lib"}};
    request.linkLibraries = {DeferredValue{"$<TARGET_FILE:foo>"}};
    request.setupHeaders = {"foo.hpp"};

    ComposedSession session = composeSession(request, context());
    auto header = renderText(session.header, fooGraph());
    ASSERT_TRUE(header) << header.error().message;
    EXPECT_EQ(header.value(),
              "#pragma cling add_include_path(\"/A\")\n"
              "#pragma cling add_include_path(\"/B\")\n"
              "#pragma cling add_include_path(\"/C\")\n"
              "#pragma cling add_library_path(\"/opt/lib\")\n"
              "#pragma cling load(\"/b/libfoo.so\")\n"
              "#include<foo.hpp>\n");
}

TEST(ArtifactComposerTest, ManifestEncodesStandardAndArguments)
{
    SessionRequest request;
    request.standard = CxxStandard::Cxx11;
    request.compileFlags = {LiteralValue{"-O2"},
                            DeferredValue{"$<TARGET_PROPERTY:foo,INTERFACE_COMPILE_FLAGS>"}};
    request.compileDefinitions = {LiteralValue{"MANUAL"},
                                  DeferredValue{"$<TARGET_PROPERTY:foo,INTERFACE_COMPILE_DEFINITIONS>"}};

    ComposedSession session = composeSession(request, context());
    auto text = renderManifest(session.manifest, fooGraph());
    ASSERT_TRUE(text) << text.error().message;

    auto json = nlohmann::json::parse(text.value());
    EXPECT_EQ(json["display_name"], "C++11 (demo)");
    EXPECT_EQ(json["language"], "C++11");
    const std::vector<std::string> argv = json["argv"].get<std::vector<std::string>>();
    EXPECT_EQ(argv,
              (std::vector<std::string>{"/opt/xeus/bin/xcpp",
                                        "-f",
                                        "{connection_file}",
                                        "-std=c++11",
                                        "-O2",
                                        "-DMANUAL",
                                        "-DFOO=1",
                                        "-DBAR",
                                        "-include",
                                        "/build/demo/xeus_cling.hh"}));
}

TEST(ArtifactComposerTest, ManifestKeyOrder)
{
    SessionRequest request;
    ComposedSession session = composeSession(request, context());
    auto text = renderManifest(session.manifest, fooGraph());
    ASSERT_TRUE(text);
    const std::string &out = text.value();
    EXPECT_LT(out.find("\"display_name\""), out.find("\"argv\""));
    EXPECT_LT(out.find("\"argv\""), out.find("\"language\""));
    EXPECT_EQ(out.back(), '\n');
}

TEST(ArtifactComposerTest, LogosResolveAgainstSourceDir)
{
    SessionRequest request;
    request.logoFiles = {"assets/logo-32x32.png", "/abs/logo-64x64.png"};
    ComposedSession session = composeSession(request, context());
    ASSERT_EQ(session.logos.size(), 2u);
    EXPECT_EQ(session.logos[0].source, std::filesystem::path("/src/demo/assets/logo-32x32.png"));
    EXPECT_EQ(session.logos[0].destination, std::filesystem::path("/build/demo/logo-32x32.png"));
    EXPECT_EQ(session.logos[1].source, std::filesystem::path("/abs/logo-64x64.png"));
}

TEST(ArtifactComposerTest, RenderPropagatesResolutionErrors)
{
    SessionRequest request;
    request.linkLibraries = {DeferredValue{"$<TARGET_FILE:ghost>"}};
    ComposedSession session = composeSession(request, context());
    auto header = renderText(session.header, fooGraph());
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, ErrorCode::UnknownTarget);
}
