// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/IndexBuilder.h"

#include "gtest/gtest.h"

#include <cstring>
#include <string>
#include <vector>

using namespace Metalith;
using namespace Metadata;

class IndexBuilderTest : public testing::Test {
protected:
    /// ITEMS { DEF_ID(key) for every key, INDEX }, each DEF_ID record indexed under its key.
    void WriteIndexedRecords(RecordWriter& w, int64_t count)
    {
        std::vector<IndexEntry<int64_t>> entries;
        w.StartTag(Tag::ITEMS);
        for (int64_t key = 0; key < count; ++key) {
            entries.push_back({key, w.MarkStablePosition()});
            w.WrTaggedU32(Tag::DEF_ID, static_cast<uint32_t>(key));
        }
        EncodeI64Index(w, entries);
        w.EndTag();
    }

    DiagnosticEngine diag;
};

TEST_F(IndexBuilderTest, EveryKeyIsFound)
{
    RecordWriter w(diag);
    const int64_t count = 1000;
    WriteIndexedRecords(w, count);

    auto body = Doc::Whole(w.GetBuffer().data(), w.Position());
    auto items = body.Get(Tag::ITEMS);
    ASSERT_TRUE(items.has_value());
    for (int64_t key = 0; key < count; ++key) {
        auto record = LookupItem(*items, key);
        ASSERT_TRUE(record.has_value()) << "key " << key;
        EXPECT_EQ(record->AsU32().value(), static_cast<uint32_t>(key));
    }
    EXPECT_FALSE(LookupItem(*items, count).has_value());
    EXPECT_FALSE(LookupItem(*items, count + 12345).has_value());
}

TEST_F(IndexBuilderTest, TableHasOneSlotPerBucket)
{
    RecordWriter w(diag);
    WriteIndexedRecords(w, 3);
    auto body = Doc::Whole(w.GetBuffer().data(), w.Position());
    auto index = body.Get(Tag::ITEMS)->Get(Tag::INDEX);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->Get(Tag::INDEX_TABLE)->Size(), INDEX_BUCKET_COUNT * sizeof(uint32_t));
    EXPECT_EQ(index->Get(Tag::INDEX_BUCKETS)->TaggedDocs(Tag::INDEX_BUCKETS_BUCKET).size(), INDEX_BUCKET_COUNT);
}

TEST_F(IndexBuilderTest, EmptyIndexFindsNothing)
{
    RecordWriter w(diag);
    WriteIndexedRecords(w, 0);
    auto body = Doc::Whole(w.GetBuffer().data(), w.Position());
    EXPECT_FALSE(LookupItem(*body.Get(Tag::ITEMS), 0).has_value());
}

TEST_F(IndexBuilderTest, KeysOutsideThirtyOneBitsAreFatal)
{
    RecordWriter w(diag);
    EXPECT_THROW(WriteI64Key(w, -1), InternalCompilerError);
    EXPECT_THROW(WriteI64Key(w, INDEX_KEY_LIMIT), InternalCompilerError);

    std::vector<IndexEntry<int64_t>> entries = {{INDEX_KEY_LIMIT + 1, 0}};
    try {
        w.StartTag(Tag::ITEMS);
        EncodeI64Index(w, entries);
        FAIL() << "oversized key must be rejected";
    } catch (const InternalCompilerError& e) {
        EXPECT_EQ(e.GetKind(), DiagKind::METADATA_KEY_OVERFLOW);
    }
}

TEST_F(IndexBuilderTest, OffsetsOutsideThirtyTwoBitsAreFatal)
{
    RecordWriter w(diag);
    std::vector<IndexEntry<int64_t>> entries = {{1, INDEX_OFFSET_LIMIT}};
    try {
        w.StartTag(Tag::ITEMS);
        EncodeI64Index(w, entries);
        FAIL() << "oversized offset must be rejected";
    } catch (const InternalCompilerError& e) {
        EXPECT_EQ(e.GetKind(), DiagKind::METADATA_OFFSET_OVERFLOW);
    }
}

TEST_F(IndexBuilderTest, StringKeys)
{
    RecordWriter w(diag);
    std::vector<std::string> names = {"alpha", "beta", "gamma", "delta"};
    std::vector<IndexEntry<std::string>> entries;
    w.StartTag(Tag::ITEMS);
    for (auto& name : names) {
        entries.push_back({name, w.MarkStablePosition()});
        w.WrTaggedStr(Tag::PATHS_DATA_NAME, name);
    }
    EncodeIndex<std::string>(
        w, entries, [](RecordWriter& writer, const std::string& key) { writer.WrStr(key); });
    w.EndTag();

    auto body = Doc::Whole(w.GetBuffer().data(), w.Position());
    auto items = body.Get(Tag::ITEMS);
    ASSERT_TRUE(items.has_value());
    for (auto& name : names) {
        auto record = LookupIndex(*items, Utils::SipHash::GetHashValue(name), [&name](const uint8_t* key, size_t len) {
            return len == name.size() && std::memcmp(key, name.data(), len) == 0;
        });
        ASSERT_TRUE(record.has_value()) << name;
        EXPECT_EQ(record->AsStr(), name);
    }
}
