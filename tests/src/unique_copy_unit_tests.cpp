/**
 * @file unique_copy_unit_tests.cpp
 * @brief Unit tests for CopyErrorKind conversions.
 */
#include "UniqueCopy/UniqueCopy.hpp"
#include "gtest/gtest.h"

#include <set>
#include <string>
#include <vector>

TEST(CopyErrorKindTest, ToString_NamesEveryKind)
{
    EXPECT_STREQ(CopyErrorKindToString(CopyErrorKind::None), "None");
    EXPECT_STREQ(CopyErrorKindToString(CopyErrorKind::Usage), "Usage");
    EXPECT_STREQ(CopyErrorKindToString(CopyErrorKind::Read), "Read");
    EXPECT_STREQ(CopyErrorKindToString(CopyErrorKind::Naming), "Naming");
    EXPECT_STREQ(CopyErrorKindToString(CopyErrorKind::Copy), "Copy");
}

TEST(CopyErrorKindTest, ToExitCode_MapsEachFailureClass)
{
    EXPECT_EQ(CopyErrorKindToExitCode(CopyErrorKind::None), 0);
    EXPECT_EQ(CopyErrorKindToExitCode(CopyErrorKind::Usage), 1);
    EXPECT_EQ(CopyErrorKindToExitCode(CopyErrorKind::Read), 2);
    EXPECT_EQ(CopyErrorKindToExitCode(CopyErrorKind::Naming), 3);
    EXPECT_EQ(CopyErrorKindToExitCode(CopyErrorKind::Copy), 4);
}

TEST(CopyErrorKindTest, ToExitCode_IsDistinctPerKind)
{
    // Arrange
    const std::vector<CopyErrorKind> allKinds = {CopyErrorKind::None, CopyErrorKind::Usage, CopyErrorKind::Read, CopyErrorKind::Naming,
                                                 CopyErrorKind::Copy};
    std::set<int> exitCodes;

    // Act
    for (const auto& errorKind : allKinds)
    {
        exitCodes.insert(CopyErrorKindToExitCode(errorKind));
    }

    // Assert
    ASSERT_EQ(exitCodes.size(), allKinds.size());
}

TEST(CopyConfigTest, Defaults_AreQuietWithoutCallback)
{
    CopyConfig config;

    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(static_cast<bool>(config.onProgress));
    EXPECT_TRUE(config.sourceFile.empty());
}
