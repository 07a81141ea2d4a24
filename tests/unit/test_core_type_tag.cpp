// File: tests/unit/test_core_type_tag.cpp
// Purpose: Verify TypeTag value semantics, equality and canonical rendering.
// Key invariants: Copies are deep; rendering matches the type tag grammar.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/core/TypeTag.hpp, src/core/TransactionArgument.hpp

#include <gtest/gtest.h>

#include "core/TransactionArgument.hpp"
#include "core/TypeTag.hpp"

#include <cstdint>
#include <vector>

using namespace movetext::core;

namespace
{
StructTag makeStruct(const char *address, const char *module, const char *name,
                     std::vector<TypeTag> params = {})
{
    return StructTag{AccountAddress::fromHexLiteral(address).value(),
                     Identifier::make(module).value(),
                     Identifier::make(name).value(),
                     std::move(params)};
}
} // namespace

TEST(CoreTypeTag, RendersPrimitivesAndVectors)
{
    EXPECT_EQ(toString(TypeTag::u8()), "u8");
    EXPECT_EQ(toString(TypeTag::u64()), "u64");
    EXPECT_EQ(toString(TypeTag::u128()), "u128");
    EXPECT_EQ(toString(TypeTag::boolean()), "bool");
    EXPECT_EQ(toString(TypeTag::address()), "address");
    EXPECT_EQ(toString(TypeTag::signer()), "signer");
    EXPECT_EQ(toString(TypeTag::vector(TypeTag::vector(TypeTag::u8()))), "vector<vector<u8>>");
}

TEST(CoreTypeTag, RendersStructTags)
{
    StructTag plain = makeStruct("0x1", "Diem", "Diem");
    EXPECT_EQ(toString(plain), "0x1::Diem::Diem");

    StructTag generic =
        makeStruct("0x00a", "M", "S", {TypeTag::u8(), TypeTag::structure(makeStruct("0x2", "P", "Q"))});
    EXPECT_EQ(toString(generic), "0xa::M::S<u8, 0x2::P::Q>");
    EXPECT_EQ(toString(TypeTag::structure(generic)), "0xa::M::S<u8, 0x2::P::Q>");
}

TEST(CoreTypeTag, CopiesAreDeepAndEqual)
{
    TypeTag original = TypeTag::vector(TypeTag::structure(makeStruct("0x1", "M", "S", {TypeTag::boolean()})));
    TypeTag copy = original;
    EXPECT_EQ(copy, original);
    EXPECT_NE(&copy.element(), &original.element());

    TypeTag other = TypeTag::u8();
    other = copy;
    EXPECT_EQ(other, original);
    EXPECT_EQ(other.kind(), TypeTag::Kind::Vector);
    EXPECT_EQ(other.element().structTag().typeParams.size(), 1u);
}

TEST(CoreTypeTag, EqualityComparesPayloads)
{
    EXPECT_EQ(TypeTag::u8(), TypeTag::u8());
    EXPECT_NE(TypeTag::u8(), TypeTag::u64());
    EXPECT_NE(TypeTag::vector(TypeTag::u8()), TypeTag::vector(TypeTag::u64()));
    EXPECT_NE(TypeTag::structure(makeStruct("0x1", "M", "S")),
              TypeTag::structure(makeStruct("0x2", "M", "S")));
    EXPECT_NE(TypeTag::structure(makeStruct("0x1", "M", "S")),
              TypeTag::structure(makeStruct("0x1", "M", "S", {TypeTag::u8()})));
}

TEST(CoreTransactionArgument, RendersReparseableLiterals)
{
    EXPECT_EQ(toString(TransactionArgument::u8(255)), "255u8");
    EXPECT_EQ(toString(TransactionArgument::u64(7)), "7u64");
    EXPECT_EQ(toString(TransactionArgument::u128(movetext::support::kUInt128Max)),
              "340282366920938463463374607431768211455u128");
    EXPECT_EQ(toString(TransactionArgument::boolean(true)), "true");
    EXPECT_EQ(toString(TransactionArgument::address(AccountAddress())), "0x0");
    EXPECT_EQ(toString(TransactionArgument::u8Vector({0xde, 0xad})), "x\"dead\"");
    EXPECT_EQ(toString(TransactionArgument::u8Vector({})), "x\"\"");
}

TEST(CoreTransactionArgument, KindParticipatesInEquality)
{
    EXPECT_EQ(TransactionArgument::u64(1), TransactionArgument::u64(1));
    EXPECT_NE(TransactionArgument::u8(1), TransactionArgument::u64(1));
    EXPECT_NE(TransactionArgument::u128(1), TransactionArgument::u64(1));
}

TEST(CoreTransactionArgument, DefaultIsZeroU8)
{
    TransactionArgument a;
    TransactionArgument b;
    EXPECT_EQ(a.kind, TransactionArgument::Kind::U8);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, TransactionArgument::u8(0));
    EXPECT_EQ(toString(a), "0u8");
}
