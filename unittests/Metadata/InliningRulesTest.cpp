// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/InliningRules.h"

#include "gtest/gtest.h"

using namespace Metalith::Metadata;

TEST(InliningRulesTest, PlainBodyStaysLocal)
{
    EXPECT_FALSE(NeedsInlinedBody(false, false, false, false));
}

TEST(InliningRulesTest, EachReasonExportsTheBody)
{
    EXPECT_TRUE(NeedsInlinedBody(true, false, false, false));
    EXPECT_TRUE(NeedsInlinedBody(false, true, false, false));
    EXPECT_TRUE(NeedsInlinedBody(false, false, true, false));
    EXPECT_TRUE(NeedsInlinedBody(false, false, false, true));
    EXPECT_TRUE(NeedsInlinedBody(true, true, true, true));
}

TEST(InliningRulesTest, OnlyMonomorphicMembersGetASymbol)
{
    EXPECT_TRUE(AttachesLinkageSymbol(false));
    EXPECT_FALSE(AttachesLinkageSymbol(true));
}
