//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
#include "Components/Verification/ShortAuthenticationString.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <set>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

TEST(ShortAuthenticationStringSuite, DecimalBoundsTest)
{
    Security::Buffer const zeros(Verification::ShortAuthenticationStringSize, 0x00);
    auto const optLowest = Verification::GenerateDecimals(zeros);
    ASSERT_TRUE(optLowest);
    EXPECT_EQ(*optLowest, (Verification::Decimals{ 1000, 1000, 1000 }));

    Security::Buffer const ones(Verification::ShortAuthenticationStringSize, 0xFF);
    auto const optHighest = Verification::GenerateDecimals(ones);
    ASSERT_TRUE(optHighest);
    EXPECT_EQ(*optHighest, (Verification::Decimals{ 9191, 9191, 9191 }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ShortAuthenticationStringSuite, DecimalWindowsTest)
{
    // 0b00000000'00001000 sets the lowest bit of the first window, the remaining windows are set bit by bit.
    Security::Buffer const bytes = { 0x00, 0x08, 0x00, 0x40, 0x02, 0x00 };
    auto const optDecimals = Verification::GenerateDecimals(bytes);
    ASSERT_TRUE(optDecimals);
    EXPECT_EQ(*optDecimals, (Verification::Decimals{ 1001, 1001, 1001 }));

    Security::Buffer const mixed = { 0x4C, 0x7A, 0xD3, 0x1E, 0x95, 0x00 };
    auto const optMixed = Verification::GenerateDecimals(mixed);
    ASSERT_TRUE(optMixed);
    EXPECT_EQ((*optMixed)[0], ((0x4C << 5) | (0x7A >> 3)) + 1000);
    EXPECT_EQ((*optMixed)[1], (((0x7A & 0x07) << 10) | (0xD3 << 2) | (0x1E >> 6)) + 1000);
    EXPECT_EQ((*optMixed)[2], (((0x1E & 0x3F) << 7) | (0x95 >> 1)) + 1000);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ShortAuthenticationStringSuite, EmojiWindowsTest)
{
    Security::Buffer const zeros(Verification::ShortAuthenticationStringSize, 0x00);
    auto const optFirst = Verification::GenerateEmojis(zeros);
    ASSERT_TRUE(optFirst);
    for (auto const& emoji : *optFirst) { EXPECT_EQ(emoji.description, "Dog"); }

    Security::Buffer const ones(Verification::ShortAuthenticationStringSize, 0xFF);
    auto const optLast = Verification::GenerateEmojis(ones);
    ASSERT_TRUE(optLast);
    for (auto const& emoji : *optLast) { EXPECT_EQ(emoji.description, "Pin"); }

    // 0b000001'000010'000011'000100'000101'000110'000111 followed by the unused bits.
    Security::Buffer const ascending = { 0x04, 0x20, 0xC4, 0x14, 0x61, 0xC0 };
    auto const optAscending = Verification::GenerateEmojis(ascending);
    ASSERT_TRUE(optAscending);

    auto const table = Verification::GetEmojiTable();
    for (std::size_t idx = 0; idx < Verification::EmojiCount; ++idx) {
        EXPECT_EQ((*optAscending)[idx].description, table[idx + 1].description);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ShortAuthenticationStringSuite, ShortInputTest)
{
    Security::Buffer const bytes(4, 0xAA);
    EXPECT_FALSE(Verification::GenerateDecimals(bytes));
    EXPECT_FALSE(Verification::GenerateEmojis(bytes));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ShortAuthenticationStringSuite, EmojiTableTest)
{
    auto const table = Verification::GetEmojiTable();
    ASSERT_EQ(table.size(), Verification::EmojiTableSize);
    EXPECT_EQ(table[0].description, "Dog");
    EXPECT_EQ(table[32].description, "Hat");
    EXPECT_EQ(table[63].description, "Pin");

    std::set<std::string_view> descriptions;
    for (auto const& emoji : table) {
        EXPECT_FALSE(emoji.symbol.empty());
        descriptions.emplace(emoji.description);
    }
    EXPECT_EQ(descriptions.size(), Verification::EmojiTableSize);
}

//----------------------------------------------------------------------------------------------------------------------
