/**
 * Snare Core Library - Pattern Tests
 *
 * Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Tests for signature compilation and canonical form
 */

#include <gtest/gtest.h>
#include <Snare/Core/Pattern.hpp>
#include <unordered_set>

using namespace Snare;
using namespace Snare::Core::Memory;

TEST(PatternTests, CompileValidPattern) {
    auto result = Pattern::compile("48 8B 5C 24 10");

    ASSERT_TRUE(result.isSuccess()) << "Pattern compilation should succeed";
    EXPECT_EQ(result.value().size(), 5u);
    EXPECT_EQ(result.value().bytes()[0], 0x48);
    EXPECT_EQ(result.value().bytes()[1], 0x8B);
    EXPECT_EQ(result.value().bytes()[4], 0x10);
    EXPECT_EQ(result.value().wildcardCount(), 0u);
}

TEST(PatternTests, CompilePatternWithWildcards) {
    auto result = Pattern::compile("48 8B ? ? 90");

    ASSERT_TRUE(result.isSuccess()) << "Pattern with wildcards should compile";
    EXPECT_EQ(result.value().size(), 5u);
    EXPECT_TRUE(result.value().mask()[0]);
    EXPECT_TRUE(result.value().mask()[1]);
    EXPECT_FALSE(result.value().mask()[2]);
    EXPECT_FALSE(result.value().mask()[3]);
    EXPECT_TRUE(result.value().mask()[4]);
    EXPECT_TRUE(result.value().isWildcard(2));
    EXPECT_FALSE(result.value().isWildcard(4));
    EXPECT_FALSE(result.value().isWildcard(99));
}

TEST(PatternTests, SingleAndDoubleQuestionMarksAreEquivalent) {
    auto single = Pattern::compile("48 ? 5C");
    auto dbl = Pattern::compile("48 ?? 5C");

    ASSERT_TRUE(single.isSuccess());
    ASSERT_TRUE(dbl.isSuccess());
    EXPECT_EQ(single.value(), dbl.value());
    EXPECT_EQ(single.value().hash(), dbl.value().hash());
}

TEST(PatternTests, PackedTokensCompile) {
    auto packed = Pattern::compile("488B??00FF");
    auto spaced = Pattern::compile("48 8B ?? 00 FF");

    ASSERT_TRUE(packed.isSuccess());
    ASSERT_TRUE(spaced.isSuccess());
    EXPECT_EQ(packed.value(), spaced.value());
}

TEST(PatternTests, LowercaseHexAccepted) {
    auto result = Pattern::compile("e8 ?? ?? ?? ?? c3");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().bytes()[0], 0xE8);
    EXPECT_EQ(result.value().bytes()[5], 0xC3);
}

TEST(PatternTests, EmptyPatternRejected) {
    auto empty = Pattern::compile("");
    auto blank = Pattern::compile("   \t ");

    ASSERT_TRUE(empty.isFailure());
    EXPECT_EQ(empty.error(), ErrorCode::PatternSyntaxError);
    ASSERT_TRUE(blank.isFailure());
    EXPECT_EQ(blank.error(), ErrorCode::PatternSyntaxError);
}

TEST(PatternTests, InvalidCharacterRejected) {
    auto result = Pattern::compile("48 ZZ 90");

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::PatternSyntaxError);
}

TEST(PatternTests, OddLengthHexRejected) {
    auto trailing = Pattern::compile("48 8B 5");
    auto run = Pattern::compile("488B5 90");

    EXPECT_EQ(trailing.error(), ErrorCode::PatternSyntaxError);
    EXPECT_EQ(run.error(), ErrorCode::PatternSyntaxError);
}

TEST(PatternTests, CanonicalString) {
    auto result = Pattern::compile("48 8b ? 00   ff");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().toString(), "48 8B ?? 00 FF");
}

TEST(PatternTests, WildcardRatio) {
    auto result = Pattern::compile("?? ?? 90 90");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_DOUBLE_EQ(result.value().wildcardRatio(), 0.5);
}

TEST(PatternTests, MatchesAtHonorsMask) {
    auto result = Pattern::compile("48 8B ?? 00 FF");
    ASSERT_TRUE(result.isSuccess());

    const Byte match[] = {0x48, 0x8B, 0x12, 0x00, 0xFF};
    const Byte other[] = {0x48, 0x8B, 0x12, 0x01, 0xFF};

    EXPECT_TRUE(result.value().matchesAt(match));
    EXPECT_FALSE(result.value().matchesAt(other));
}

TEST(PatternTests, WildcardAndZeroByteDiffer) {
    auto wildcard = Pattern::compile("48 ??");
    auto zero = Pattern::compile("48 00");

    ASSERT_TRUE(wildcard.isSuccess());
    ASSERT_TRUE(zero.isSuccess());
    EXPECT_NE(wildcard.value(), zero.value());
}

TEST(PatternTests, UsableAsHashKey) {
    std::unordered_set<Pattern, PatternHash> set;
    set.insert(Pattern::compile("90 90").value());
    set.insert(Pattern::compile("9090").value());
    set.insert(Pattern::compile("90 ??").value());

    EXPECT_EQ(set.size(), 2u);
}
