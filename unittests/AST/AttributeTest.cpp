// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/AST/Attribute.h"
#include "metalith/Basic/DiagnosticEngine.h"

#include "gtest/gtest.h"

#include <vector>

using namespace Metalith;
using namespace AST;

TEST(RequestsInlineTest, WordAndAlwaysFormsAsk)
{
    EXPECT_TRUE(RequestsInline({MakeAttribute(MetaItem::Word("inline"))}));
    EXPECT_TRUE(RequestsInline({MakeAttribute(MetaItem::List("inline", {MetaItem::Word("always")}))}));
}

TEST(RequestsInlineTest, NeverAndMalformedFormsDoNot)
{
    EXPECT_FALSE(RequestsInline({MakeAttribute(MetaItem::List("inline", {MetaItem::Word("never")}))}));
    EXPECT_FALSE(RequestsInline({MakeAttribute(MetaItem::List("inline", {}))}));
    EXPECT_FALSE(RequestsInline(
        {MakeAttribute(MetaItem::List("inline", {MetaItem::Word("always"), MetaItem::Word("never")}))}));
    EXPECT_FALSE(RequestsInline({MakeAttribute(MetaItem::NameValue("inline", "always"))}));
    EXPECT_FALSE(RequestsInline({MakeAttribute(MetaItem::Word("cold"))}));
    EXPECT_FALSE(RequestsInline({}));
}

TEST(RequestsInlineTest, AnyMatchingAttributeCounts)
{
    std::vector<Attribute> attrs = {MakeAttribute(MetaItem::List("inline", {MetaItem::Word("never")})),
        MakeAttribute(MetaItem::Word("inline"))};
    EXPECT_TRUE(RequestsInline(attrs));
}

TEST(FindReprAttrsTest, KnownHintsInSourceOrder)
{
    DiagnosticEngine diag;
    std::vector<Attribute> attrs = {
        MakeAttribute(MetaItem::List("repr", {MetaItem::Word("packed"), MetaItem::Word("i64")})),
        MakeAttribute(MetaItem::Word("repr")),
        MakeAttribute(MetaItem::List("repr", {MetaItem::Word("simd"), MetaItem::Word("wide")}))};
    auto reprs = FindReprAttrs(diag, attrs);
    ASSERT_EQ(reprs.size(), 3u);
    EXPECT_EQ(reprs[0].kind, ReprKind::PACKED);
    EXPECT_EQ(reprs[1].ToString(), "i64");
    EXPECT_EQ(reprs[2].ToString(), "simd");
    EXPECT_EQ(diag.GetWarningCount(), 1u);
    EXPECT_EQ(diag.GetErrorCount(), 0u);
}
