// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/RecordReader.h"
#include "metalith/Metadata/RecordWriter.h"
#include "metalith/Metadata/Tags.h"

#include "gtest/gtest.h"

#include <memory>
#include <string>
#include <vector>

using namespace Metalith;
using namespace Metadata;

namespace {
std::vector<uint8_t> Written(const RecordWriter& w)
{
    auto& buffer = w.GetBuffer();
    return std::vector<uint8_t>(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(w.Position()));
}
} // namespace

class RecordWriterTest : public testing::Test {
protected:
    void SetUp() override
    {
        diag = std::make_unique<DiagnosticEngine>();
    }

    std::unique_ptr<DiagnosticEngine> diag;
};

TEST_F(RecordWriterTest, SmallRecordIsCompacted)
{
    RecordWriter w(*diag);
    w.WrTaggedU32(Tag::DEF_ID, 0x01020304);
    std::vector<uint8_t> expected = {0x22, 0x84, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(Written(w), expected);
}

TEST_F(RecordWriterTest, StrictRecordKeepsFourByteSize)
{
    RecordWriter w(*diag, false);
    w.WrTaggedU32(Tag::DEF_ID, 0x01020304);
    std::vector<uint8_t> expected = {0x22, 0x10, 0x00, 0x00, 0x04, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(Written(w), expected);
}

TEST_F(RecordWriterTest, LongTagTakesTwoBytes)
{
    RecordWriter w(*diag);
    w.WrTaggedU8(Tag::ITEMS, 7);
    std::vector<uint8_t> expected = {0xf1, 0x00, 0x81, 0x07};
    EXPECT_EQ(Written(w), expected);
}

TEST_F(RecordWriterTest, CompactionBoundary)
{
    RecordWriter w(*diag);
    std::vector<uint8_t> payload(0x100, 0xab);
    w.WrTaggedBytes(Tag::PATHS_DATA_NAME, payload.data(), payload.size());
    // 256 bytes still fit a two-byte size.
    EXPECT_EQ(w.Position(), 1u + 2u + 0x100u);
    EXPECT_EQ(w.GetBuffer()[1], 0x41);
    EXPECT_EQ(w.GetBuffer()[2], 0x00);

    RecordWriter large(*diag);
    payload.push_back(0xab);
    large.WrTaggedBytes(Tag::PATHS_DATA_NAME, payload.data(), payload.size());
    EXPECT_EQ(large.Position(), 1u + 4u + 0x101u);
    std::vector<uint8_t> size(large.GetBuffer().begin() + 1, large.GetBuffer().begin() + 5);
    std::vector<uint8_t> expectedSize = {0x10, 0x00, 0x01, 0x01};
    EXPECT_EQ(size, expectedSize);
}

TEST_F(RecordWriterTest, StablePositionBlocksCompactionOfEnclosingRecord)
{
    RecordWriter w(*diag);
    w.StartTag(Tag::ITEMS_DATA);
    w.WrU8(1);
    auto stable = w.MarkStablePosition();
    w.WrTaggedU8(Tag::ITEM_SORT, 'r');
    w.EndTag();

    EXPECT_EQ(stable, 6u);
    std::vector<uint8_t> expected = {0x20, 0x10, 0x00, 0x00, 0x04, 0x01, 0x3e, 0x81, 'r'};
    EXPECT_EQ(Written(w), expected);
    // The marked record is still where it was promised.
    auto doc = DocAt(w.GetBuffer().data(), w.Position(), stable);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->tag, Tag::ITEM_SORT);
    EXPECT_EQ(doc->doc.AsU8().value(), 'r');
}

TEST_F(RecordWriterTest, NestedRecordsReadBack)
{
    RecordWriter w(*diag);
    w.StartTag(Tag::UNIT_DEPS);
    w.StartTag(Tag::UNIT_DEP);
    w.WrTaggedStr(Tag::UNIT_DEP_UNIT_NAME, "core");
    w.WrTaggedStr(Tag::UNIT_DEP_HASH, "abc");
    w.EndTag();
    w.StartTag(Tag::UNIT_DEP);
    w.WrTaggedStr(Tag::UNIT_DEP_UNIT_NAME, "alloc");
    w.WrTaggedStr(Tag::UNIT_DEP_HASH, "def");
    w.EndTag();
    w.EndTag();
    w.WrTaggedU64(Tag::DEF_ID, 0x0000000100000002ULL);
    EXPECT_EQ(w.OpenRecordCount(), 0u);

    auto body = Doc::Whole(w.GetBuffer().data(), w.Position());
    auto deps = body.Get(Tag::UNIT_DEPS);
    ASSERT_TRUE(deps.has_value());
    auto entries = deps->TaggedDocs(Tag::UNIT_DEP);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].Get(Tag::UNIT_DEP_UNIT_NAME)->AsStr(), "core");
    EXPECT_EQ(entries[1].Get(Tag::UNIT_DEP_UNIT_NAME)->AsStr(), "alloc");
    EXPECT_EQ(entries[1].Get(Tag::UNIT_DEP_HASH)->AsStr(), "def");
    EXPECT_EQ(body.Get(Tag::DEF_ID)->AsU64().value(), 0x0000000100000002ULL);
    EXPECT_FALSE(body.Get(Tag::DEF_ID)->AsU32().has_value());
}

TEST_F(RecordWriterTest, InvalidTagIsFatal)
{
    RecordWriter w(*diag);
    EXPECT_THROW(w.StartTag(0xf5), InternalCompilerError);
    EXPECT_THROW(w.StartTag(NUM_TAGS), InternalCompilerError);
    EXPECT_EQ(diag->GetErrorCount(), 2u);
}

TEST_F(RecordWriterTest, UnbalancedEndTagIsFatal)
{
    RecordWriter w(*diag);
    try {
        w.EndTag();
        FAIL() << "EndTag without StartTag must throw";
    } catch (const InternalCompilerError& e) {
        EXPECT_EQ(e.GetKind(), DiagKind::METADATA_UNBALANCED_RECORD);
    }
}

TEST(TagsTest, TagNames)
{
    EXPECT_STREQ(TagName(Tag::ITEMS_DATA_ITEM), "ITEMS_DATA_ITEM");
    EXPECT_STREQ(TagName(Tag::STRUCT_FIELD_ID), "STRUCT_FIELD_ID");
    EXPECT_STREQ(TagName(0xeeee), "<unknown>");
}
