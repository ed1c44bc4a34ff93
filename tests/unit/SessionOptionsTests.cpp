//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/SessionOptionsTests.cpp
// Purpose: Parse session keyword arguments and session files.
// Key invariants: Unknown keys and unparsed arguments are warnings, never errors.
// Ownership/Lifetime: Session files live in a per-test TempDir.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "SessionFixture.hpp"
#include "session/SessionOptions.hpp"

using namespace clingkit::session;
using clingkit::support::DiagnosticEngine;
using clingkit::support::ErrorCode;
using clingkit::support::Severity;
using clingkit::tests::TempDir;

TEST(SessionArgumentsTest, CollectsMultiValueKeywords)
{
    DiagnosticEngine diags;
    SessionOptions opts = parseSessionArguments(
        {"TARGETS", "adder", "adder2", "INCLUDE_DIRECTORIES", "/a", "/b", "COMPILE_DEFINITIONS", "X=1"}, diags);

    EXPECT_EQ(opts.targets, (std::vector<std::string>{"adder", "adder2"}));
    EXPECT_EQ(opts.includeDirectories, (std::vector<std::string>{"/a", "/b"}));
    EXPECT_EQ(opts.compileDefinitions, (std::vector<std::string>{"X=1"}));
    EXPECT_FALSE(opts.cxxStandard.has_value());
    EXPECT_FALSE(opts.required);
    EXPECT_EQ(diags.warningCount(), 0u);
}

TEST(SessionArgumentsTest, OptionsAndSingleValues)
{
    DiagnosticEngine diags;
    SessionOptions opts = parseSessionArguments(
        {"REQUIRED", "CXX_STANDARD", "11", "KERNEL_NAME", "Adder", "NO_INSTALL", "CXX_STANDARD", "14"}, diags);

    EXPECT_TRUE(opts.required);
    EXPECT_TRUE(opts.noInstall);
    EXPECT_EQ(opts.cxxStandard, std::optional<std::string>("14"));
    EXPECT_EQ(opts.kernelName, std::optional<std::string>("Adder"));
}

TEST(SessionArgumentsTest, LeadingTokensWarn)
{
    DiagnosticEngine diags;
    SessionOptions opts = parseSessionArguments({"TARGET", "adder", "TARGETS", "adder2"}, diags);

    EXPECT_EQ(opts.targets, (std::vector<std::string>{"adder2"}));
    ASSERT_EQ(diags.warningCount(), 1u);
    const auto &warning = diags.diagnostics().front();
    EXPECT_EQ(warning.severity, Severity::Warning);
    EXPECT_NE(warning.message.find("this often indicates typos"), std::string::npos);
    EXPECT_NE(warning.message.find("TARGET adder"), std::string::npos);
}

TEST(SessionLineTest, QuotesAndComments)
{
    auto tokens = tokenizeSessionLine(R"(KERNEL_NAME "C++ \"adder\" kernel"  # display name)");
    ASSERT_TRUE(tokens);
    EXPECT_EQ(tokens.value(), (std::vector<std::string>{"KERNEL_NAME", "C++ \"adder\" kernel"}));

    auto empty = tokenizeSessionLine(R"(COMPILE_FLAGS "")");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty.value(), (std::vector<std::string>{"COMPILE_FLAGS", ""}));

    auto open = tokenizeSessionLine(R"(KERNEL_NAME "unterminated)");
    ASSERT_FALSE(open);
    EXPECT_EQ(open.error().code, ErrorCode::InvalidConfiguration);
}

TEST(SessionArgumentsTest, EmptySingleValueFallsBackToDefault)
{
    DiagnosticEngine diags;
    SessionOptions opts =
        parseSessionArguments({"KERNEL_NAME", "Adder", "KERNEL_NAME", "", "CXX_STANDARD", ""}, diags);
    EXPECT_FALSE(opts.kernelName.has_value());
    EXPECT_FALSE(opts.cxxStandard.has_value());
    EXPECT_EQ(diags.warningCount(), 0u);
}

TEST(SessionFileTest, QuotedEmptyValueIsUnset)
{
    TempDir dir;
    auto path = dir.write("empty.session", "TARGETS adder\nKERNEL_NAME \"\"\n");
    DiagnosticEngine diags;
    auto tokens = readSessionFile(path, diags);
    ASSERT_TRUE(tokens);
    SessionOptions opts = parseSessionArguments(tokens.value(), diags);
    EXPECT_FALSE(opts.kernelName.has_value());
}

TEST(SessionFileTest, UnknownKeysAreSkippedWithLocation)
{
    TempDir dir;
    auto path = dir.write("adder.session",
                          "# adder session\n"
                          "TARGETS adder\n"
                          "\n"
                          "SETUP_HEADER adder.hpp\n"
                          "SETUP_HEADERS adder.hpp\n"
                          "CXX_STANDARD 14\n");
    DiagnosticEngine diags;
    auto tokens = readSessionFile(path, diags);
    ASSERT_TRUE(tokens);
    SessionOptions opts = parseSessionArguments(tokens.value(), diags);
    EXPECT_EQ(opts.targets, (std::vector<std::string>{"adder"}));
    EXPECT_EQ(opts.setupHeaders, (std::vector<std::string>{"adder.hpp"}));
    EXPECT_EQ(opts.cxxStandard, std::optional<std::string>("14"));

    ASSERT_EQ(diags.warningCount(), 1u);
    EXPECT_EQ(diags.diagnostics().front().message,
              path.string() + ":4: unknown configuration key 'SETUP_HEADER' ignored");
}

TEST(SessionFileTest, BadQuotingNamesTheLine)
{
    TempDir dir;
    auto path = dir.write("bad.session", "TARGETS adder\nKERNEL_NAME \"oops\n");
    DiagnosticEngine diags;
    auto tokens = readSessionFile(path, diags);
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().message.rfind(path.string() + ":2: ", 0), 0u);
}

TEST(SessionFileTest, MissingFile)
{
    DiagnosticEngine diags;
    auto tokens = readSessionFile("/nonexistent/clingkit.session", diags);
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().code, ErrorCode::Io);
}
