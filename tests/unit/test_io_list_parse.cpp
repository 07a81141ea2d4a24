// File: tests/unit/test_io_list_parse.cpp
// Purpose: Verify the three list entry points.
// Key invariants: Lists may be empty and may end with one trailing comma.
// Ownership/Lifetime: Standalone unit test executable.
// Links: include/movetext/io/TextParse.hpp

#include <gtest/gtest.h>

#include "movetext/io/TextParse.hpp"

#include <string>
#include <vector>

using namespace movetext;
using core::TransactionArgument;
using core::TypeTag;

TEST(IoListParse, TypeTags)
{
    auto tags = io::parseTypeTags("u8, vector<bool>, 0x1::M::S<u64>,");
    ASSERT_TRUE(tags);
    ASSERT_EQ(tags.value().size(), 3u);
    EXPECT_EQ(tags.value()[0], TypeTag::u8());
    EXPECT_EQ(tags.value()[1], TypeTag::vector(TypeTag::boolean()));
    EXPECT_EQ(core::toString(tags.value()[2]), "0x1::M::S<u64>");

    auto empty = io::parseTypeTags("   ");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());

    EXPECT_FALSE(io::parseTypeTags("u8,,"));
    EXPECT_FALSE(io::parseTypeTags(","));
    EXPECT_FALSE(io::parseTypeTags("u8 u64"));
}

TEST(IoListParse, TransactionArguments)
{
    auto args = io::parseTransactionArguments("1u8, true, 0x1, x\"ab\",");
    ASSERT_TRUE(args);
    EXPECT_EQ(args.value(),
              (std::vector<TransactionArgument>{
                  TransactionArgument::u8(1),
                  TransactionArgument::boolean(true),
                  TransactionArgument::address(core::AccountAddress::fromHexLiteral("0x1").value()),
                  TransactionArgument::u8Vector({0xab})}));

    auto empty = io::parseTransactionArguments("");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());

    auto bad = io::parseTransactionArguments("1, 256u8");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().loc.column, 4u);
}

TEST(IoListParse, StringList)
{
    auto names = io::parseStringList("alpha, Beta_2 ,gamma,");
    ASSERT_TRUE(names);
    EXPECT_EQ(names.value(), (std::vector<std::string>{"alpha", "Beta_2", "gamma"}));

    auto keyword = io::parseStringList("alpha, vector");
    ASSERT_FALSE(keyword);
    EXPECT_EQ(keyword.error().message, "unexpected token 'vector', expected string");

    EXPECT_FALSE(io::parseStringList("1"));
    EXPECT_TRUE(io::parseStringList("").value().empty());
}
