//----------------------------------------------------------------------------------------------------------------------
// File: ShortAuthenticationString.hpp
// Description: Renders the bytes derived from a SAS key agreement as the numbers and emoji compared by the users.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

struct Emoji
{
    std::string_view symbol;
    std::string_view description;
};

constexpr std::size_t DecimalCount = 3;
constexpr std::size_t EmojiCount = 7;
constexpr std::size_t EmojiTableSize = 64;

// The number of HKDF output bytes consumed by the short authentication string. 
constexpr std::size_t ShortAuthenticationStringSize = 6;

using Decimals = std::array<std::uint16_t, DecimalCount>;
using Emojis = std::array<Emoji, EmojiCount>;

// Three 13 bit big endian windows over the first five bytes, each offset by 1000. 
[[nodiscard]] std::optional<Decimals> GenerateDecimals(Security::ReadableView bytes);

// Seven 6 bit big endian windows over the first six bytes, each an index into the emoji table. 
[[nodiscard]] std::optional<Emojis> GenerateEmojis(Security::ReadableView bytes);

[[nodiscard]] std::span<Emoji const, EmojiTableSize> GetEmojiTable();

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------
