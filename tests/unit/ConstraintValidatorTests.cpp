//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ConstraintValidatorTests.cpp
// Purpose: Check the validation gate that runs before any generation.
// Key invariants: Checks run in a fixed order: standard, pairing, URL scheme, logo names.
// Ownership/Lifetime: Tests own all inputs.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "session/ConstraintValidator.hpp"
#include "session/PropertyCollector.hpp"

using namespace clingkit::session;
using clingkit::support::ErrorCode;

TEST(ConstraintValidatorTest, DefaultsToSeventeen)
{
    SessionOptions opts;
    auto standard = validateOptions(opts);
    ASSERT_TRUE(standard);
    EXPECT_EQ(standard.value(), CxxStandard::Cxx17);
}

TEST(ConstraintValidatorTest, AcceptsInterpreterLevels)
{
    for (const char *level : {"11", "14", "17"})
    {
        SessionOptions opts;
        opts.cxxStandard = level;
        auto standard = validateOptions(opts);
        ASSERT_TRUE(standard) << level;
        EXPECT_EQ(toNumber(standard.value()), level);
    }
}

TEST(ConstraintValidatorTest, RejectsOtherLevels)
{
    for (const char *level : {"98", "20", "23", "3", "seventeen"})
    {
        SessionOptions opts;
        opts.cxxStandard = level;
        auto standard = validateOptions(opts);
        ASSERT_FALSE(standard) << level;
        EXPECT_EQ(standard.error().code, ErrorCode::UnsupportedStandard) << level;
    }
}

TEST(ConstraintValidatorTest, PairingLength)
{
    SessionOptions opts;
    opts.doxygenUrls = {"https://a/", "https://b/"};
    opts.doxygenTagfiles = {"a.tag"};
    auto result = validateOptions(opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::PairingLength);
}

TEST(ConstraintValidatorTest, InsecureUrl)
{
    SessionOptions opts;
    opts.doxygenUrls = {"https://ok.example/", "http://example.com/"};
    opts.doxygenTagfiles = {"a.tag", "b.tag"};
    auto result = validateOptions(opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InsecureUrl);
    EXPECT_NE(result.error().message.find("http://example.com/"), std::string::npos);
}

TEST(ConstraintValidatorTest, LogoNames)
{
    SessionOptions opts;
    opts.kernelLogoFiles = {"assets/logo-32x32.png", "/abs/logo-64x64.png"};
    EXPECT_TRUE(validateOptions(opts));

    opts.kernelLogoFiles.push_back("assets/logo.png");
    auto result = validateOptions(opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::IllegalAssetName);
}

TEST(ConstraintValidatorTest, StandardCheckedBeforePairing)
{
    SessionOptions opts;
    opts.cxxStandard = "20";
    opts.doxygenUrls = {"http://insecure/"};
    auto result = validateOptions(opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedStandard);
}

TEST(ConstraintValidatorTest, RequestRechecksTargets)
{
    SessionRequest request;
    request.standard = CxxStandard::Cxx14;
    request.targets.push_back(CollectedTarget{"newer", TargetKind::SharedLibrary, CxxStandard::Cxx17});
    auto result = validateRequest(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::StandardMismatch);

    request.targets.front().standard = CxxStandard::Cxx11;
    EXPECT_TRUE(validateRequest(request));

    request.standard = CxxStandard::Cxx20;
    auto unsupported = validateRequest(request);
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error().code, ErrorCode::UnsupportedStandard);
}
