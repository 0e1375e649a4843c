// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/TypeEncoder.h"
#include "metalith/Sema/TypeManager.h"

#include "gtest/gtest.h"

#include <functional>
#include <string>

using namespace Metalith;
using namespace Metadata;
using namespace Sema;

class TypeEncoderTest : public testing::Test {
protected:
    /// Run @p encode against a fresh stream and return everything it wrote.
    std::string Encoded(const std::function<void(TypeEncoder&)>& encode)
    {
        RecordWriter w(diag);
        AbbreviationCache cache;
        TypeEncoder enc(w, cache);
        encode(enc);
        auto& buffer = w.GetBuffer();
        return std::string(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(w.Position()));
    }

    DiagnosticEngine diag;
    TypeManager tm;
};

TEST_F(TypeEncoderTest, Primitives)
{
    EXPECT_EQ(EncodedTy(diag, tm.GetBoolTy()), "b");
    EXPECT_EQ(EncodedTy(diag, tm.GetCharTy()), "c");
    EXPECT_EQ(EncodedTy(diag, tm.GetStrTy()), "v");
    EXPECT_EQ(EncodedTy(diag, tm.GetIntTy(IntKind::I32)), "ML");
    EXPECT_EQ(EncodedTy(diag, tm.GetIntTy(IntKind::ISIZE)), "is");
    EXPECT_EQ(EncodedTy(diag, tm.GetUintTy(UintKind::U8)), "Mb");
    EXPECT_EQ(EncodedTy(diag, tm.GetUintTy(UintKind::USIZE)), "us");
    EXPECT_EQ(EncodedTy(diag, tm.GetFloatTy(FloatKind::F64)), "MF");
    EXPECT_EQ(EncodedTy(diag, tm.GetErrorTy()), "e");
}

TEST_F(TypeEncoderTest, Compounds)
{
    auto i32 = tm.GetIntTy(IntKind::I32);
    auto u8 = tm.GetUintTy(UintKind::U8);
    EXPECT_EQ(EncodedTy(diag, tm.GetStructTy({0, 5}, tm.GetEmptySubsts())), "a[0:5|e[][][]]");
    EXPECT_EQ(EncodedTy(diag, tm.GetEnumTy({2, 9}, tm.GetEmptySubsts())), "t[2:9|e[][][]]");
    EXPECT_EQ(EncodedTy(diag, tm.GetRefTy(Region::Static(), i32, AST::Mutability::MUTABLE)), "&tmML");
    EXPECT_EQ(EncodedTy(diag, tm.GetRawPtrTy(i32, AST::Mutability::IMMUTABLE)), "*ML");
    EXPECT_EQ(EncodedTy(diag, tm.GetBoxTy(u8)), "~Mb");
    EXPECT_EQ(EncodedTy(diag, tm.GetTupleTy({tm.GetBoolTy(), tm.GetCharTy()})), "T[bc]");
    EXPECT_EQ(EncodedTy(diag, tm.GetArrayTy(u8, 4)), "VMb/4|");
    EXPECT_EQ(EncodedTy(diag, tm.GetSliceTy(u8)), "VMb/|");
    EXPECT_EQ(EncodedTy(diag, tm.GetParamTy(ParamSpace::FN_SPACE, 1, "U")), "p[2|1|U]");
}

TEST_F(TypeEncoderTest, GenericArguments)
{
    PerParamSpace<Ptr<Ty>> types;
    types.Push(ParamSpace::TYPE_SPACE, tm.GetBoolTy());
    PerParamSpace<Region> regions;
    regions.Push(ParamSpace::TYPE_SPACE, Region::EarlyBound(ParamSpace::TYPE_SPACE, 0, "a"));
    auto substs = tm.GetSubsts(types, regions);
    EXPECT_EQ(EncodedTy(diag, tm.GetStructTy({0, 3}, substs)), "a[0:3|n[B[0|0|a]][][][b][][]]");
}

TEST_F(TypeEncoderTest, FunctionTypes)
{
    BareFnSig sig;
    sig.inputs = {tm.GetIntTy(IntKind::I32)};
    sig.output = tm.GetBoolTy();
    EXPECT_EQ(EncodedTy(diag, tm.GetFnTy(std::nullopt, sig)), "Gn[Rust][ML]Nb");

    BareFnSig diverging;
    diverging.unsafety = AST::Unsafety::UNSAFE;
    diverging.abi = AST::Abi::C;
    diverging.variadic = true;
    EXPECT_EQ(EncodedTy(diag, tm.GetFnTy(AST::DeclId{0, 4}, diverging)), "F0:4|u[C][]Vz");
}

TEST_F(TypeEncoderTest, RepeatedTypeIsAbbreviated)
{
    auto point = tm.GetStructTy({0, 5}, tm.GetEmptySubsts());
    auto text = Encoded([&point](TypeEncoder& enc) {
        enc.EncTy(point);
        enc.EncTy(point);
    });
    EXPECT_EQ(text, "a[0:5|e[][][]]#0:e#");
}

TEST_F(TypeEncoderTest, ShortTypeIsNotAbbreviated)
{
    auto text = Encoded([this](TypeEncoder& enc) {
        enc.EncTy(tm.GetBoolTy());
        enc.EncTy(tm.GetBoolTy());
        enc.EncTy(tm.GetIntTy(IntKind::I64));
        enc.EncTy(tm.GetIntTy(IntKind::I64));
    });
    EXPECT_EQ(text, "bbMDMD");
}

TEST_F(TypeEncoderTest, Predicates)
{
    TraitRef clone{{1, 2}, tm.GetEmptySubsts()};
    EXPECT_EQ(Encoded([&clone](TypeEncoder& enc) { enc.EncPredicate(Predicate::Trait(clone)); }), "t1:2|e[][][]");

    auto outlives = Predicate::RegionOutlives(Region::EarlyBound(ParamSpace::TYPE_SPACE, 0, "a"), Region::Static());
    EXPECT_EQ(Encoded([&outlives](TypeEncoder& enc) { enc.EncPredicate(outlives); }), "rB[0|0|a]t");

    auto equate = Predicate::Equate(tm.GetBoolTy(), tm.GetCharTy());
    EXPECT_EQ(Encoded([&equate](TypeEncoder& enc) { enc.EncPredicate(equate); }), "ebc");
}

TEST_F(TypeEncoderTest, Regions)
{
    EXPECT_EQ(Encoded([](TypeEncoder& enc) { enc.EncRegion(Region::LateBound(1, 0)); }), "b[1|a0|]");
    EXPECT_EQ(Encoded([](TypeEncoder& enc) { enc.EncRegion(Region::Static()); }), "t");
}

TEST_F(TypeEncoderTest, InferenceVariablesAreFatal)
{
    EXPECT_THROW(EncodedTy(diag, tm.GetInferTy()), InternalCompilerError);
    Region infer;
    infer.kind = RegionKind::INFER;
    EXPECT_THROW(Encoded([&infer](TypeEncoder& enc) { enc.EncRegion(infer); }), InternalCompilerError);
    EXPECT_EQ(diag.GetErrorCount(), 2u);
}
