//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ValueModelTests.cpp
// Purpose: Cover standard levels, target kinds and literal/deferred values.
// Key invariants: Only C++11, C++14 and C++17 are interpreter levels.
// Ownership/Lifetime: Tests own all inputs.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "session/BuildGraph.hpp"
#include "session/CxxStandard.hpp"
#include "session/PropertyValue.hpp"

using namespace clingkit::session;

TEST(CxxStandardTest, ParsesKnownUniverse)
{
    EXPECT_EQ(parseCxxStandard("98"), CxxStandard::Cxx98);
    EXPECT_EQ(parseCxxStandard("11"), CxxStandard::Cxx11);
    EXPECT_EQ(parseCxxStandard("23"), CxxStandard::Cxx23);
    EXPECT_FALSE(parseCxxStandard("03").has_value());
    EXPECT_FALSE(parseCxxStandard("17x").has_value());
    EXPECT_FALSE(parseCxxStandard("").has_value());
    EXPECT_EQ(cxxStandardFromNumber(14), CxxStandard::Cxx14);
    EXPECT_FALSE(cxxStandardFromNumber(15).has_value());
}

TEST(CxxStandardTest, InterpreterSubset)
{
    EXPECT_FALSE(isInterpreterSupported(CxxStandard::Cxx98));
    EXPECT_TRUE(isInterpreterSupported(CxxStandard::Cxx11));
    EXPECT_TRUE(isInterpreterSupported(CxxStandard::Cxx14));
    EXPECT_TRUE(isInterpreterSupported(CxxStandard::Cxx17));
    EXPECT_FALSE(isInterpreterSupported(CxxStandard::Cxx20));
    EXPECT_FALSE(isInterpreterSupported(CxxStandard::Cxx23));
    EXPECT_EQ(kDefaultStandard, CxxStandard::Cxx17);
}

TEST(CxxStandardTest, OrdersNinetyEightBeforeEleven)
{
    EXPECT_TRUE(isCompatible(CxxStandard::Cxx98, CxxStandard::Cxx11));
    EXPECT_TRUE(isCompatible(CxxStandard::Cxx11, CxxStandard::Cxx17));
    EXPECT_TRUE(isCompatible(CxxStandard::Cxx14, CxxStandard::Cxx14));
    EXPECT_FALSE(isCompatible(CxxStandard::Cxx17, CxxStandard::Cxx14));
    EXPECT_EQ(toNumber(CxxStandard::Cxx98), "98");
    EXPECT_EQ(toNumber(CxxStandard::Cxx17), "17");
}

TEST(TargetKindTest, OnlySharedLibrariesLoad)
{
    EXPECT_EQ(parseTargetKind("SHARED_LIBRARY"), TargetKind::SharedLibrary);
    EXPECT_EQ(parseTargetKind("STATIC_LIBRARY"), TargetKind::StaticLibrary);
    EXPECT_EQ(parseTargetKind("EXECUTABLE"), TargetKind::Executable);
    EXPECT_FALSE(parseTargetKind("shared").has_value());

    EXPECT_TRUE(isLoadable(TargetKind::SharedLibrary));
    EXPECT_FALSE(isLoadable(TargetKind::ModuleLibrary));
    EXPECT_FALSE(isLoadable(TargetKind::InterfaceLibrary));
}

TEST(PropertyValueTest, ClassifiesGeneratorExpressions)
{
    EXPECT_FALSE(isDeferred(makeProperty("/usr/include")));
    EXPECT_TRUE(isDeferred(makeProperty("$<TARGET_FILE:adder>")));
    EXPECT_TRUE(isDeferred(makeProperty("prefix/$<CONFIG>/include")));
    EXPECT_EQ(spelling(makeProperty("$<TARGET_FILE:adder>")), "$<TARGET_FILE:adder>");
}

TEST(PropertyValueTest, SplitDropsEmptyItems)
{
    EXPECT_TRUE(splitList("").empty());
    EXPECT_TRUE(splitList(";;").empty());
    EXPECT_EQ(splitList("a;;b;"), (std::vector<std::string>{"a", "b"}));
}
