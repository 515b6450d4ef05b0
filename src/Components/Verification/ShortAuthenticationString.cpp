//----------------------------------------------------------------------------------------------------------------------
// File: ShortAuthenticationString.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ShortAuthenticationString.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint16_t DecimalOffset = 1000;

constexpr std::array<Verification::Emoji, Verification::EmojiTableSize> Emojis = {{
    { "\U0001F436", "Dog" }, { "\U0001F431", "Cat" }, { "\U0001F981", "Lion" }, { "\U0001F40E", "Horse" },
    { "\U0001F984", "Unicorn" }, { "\U0001F437", "Pig" }, { "\U0001F418", "Elephant" }, { "\U0001F430", "Rabbit" },
    { "\U0001F43C", "Panda" }, { "\U0001F413", "Rooster" }, { "\U0001F427", "Penguin" }, { "\U0001F422", "Turtle" },
    { "\U0001F41F", "Fish" }, { "\U0001F419", "Octopus" }, { "\U0001F98B", "Butterfly" }, { "\U0001F337", "Flower" },
    { "\U0001F333", "Tree" }, { "\U0001F335", "Cactus" }, { "\U0001F344", "Mushroom" }, { "\U0001F30F", "Globe" },
    { "\U0001F319", "Moon" }, { "☁️", "Cloud" }, { "\U0001F525", "Fire" }, { "\U0001F34C", "Banana" },
    { "\U0001F34E", "Apple" }, { "\U0001F353", "Strawberry" }, { "\U0001F33D", "Corn" }, { "\U0001F355", "Pizza" },
    { "\U0001F382", "Cake" }, { "❤️", "Heart" }, { "\U0001F600", "Smiley" }, { "\U0001F916", "Robot" },
    { "\U0001F3A9", "Hat" }, { "\U0001F453", "Glasses" }, { "\U0001F527", "Spanner" }, { "\U0001F385", "Santa" },
    { "\U0001F44D", "Thumbs Up" }, { "☂️", "Umbrella" }, { "⌛", "Hourglass" }, { "⏰", "Clock" },
    { "\U0001F381", "Gift" }, { "\U0001F4A1", "Light Bulb" }, { "\U0001F4D5", "Book" }, { "✏️", "Pencil" },
    { "\U0001F4CE", "Paperclip" }, { "✂️", "Scissors" }, { "\U0001F512", "Lock" }, { "\U0001F511", "Key" },
    { "\U0001F528", "Hammer" }, { "☎️", "Telephone" }, { "\U0001F3C1", "Flag" }, { "\U0001F682", "Train" },
    { "\U0001F6B2", "Bicycle" }, { "✈️", "Aeroplane" }, { "\U0001F680", "Rocket" }, { "\U0001F3C6", "Trophy" },
    { "⚽", "Ball" }, { "\U0001F3B8", "Guitar" }, { "\U0001F3BA", "Trumpet" }, { "\U0001F514", "Bell" },
    { "⚓", "Anchor" }, { "\U0001F3A7", "Headphones" }, { "\U0001F4C1", "Folder" }, { "\U0001F4CC", "Pin" },
}};

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Decimals> Verification::GenerateDecimals(Security::ReadableView bytes)
{
    if (bytes.size() < 5) { return {}; }

    std::uint32_t const b0 = bytes[0], b1 = bytes[1], b2 = bytes[2], b3 = bytes[3], b4 = bytes[4];
    return Decimals{
        static_cast<std::uint16_t>(((b0 << 5) | (b1 >> 3)) + symbols::DecimalOffset),
        static_cast<std::uint16_t>((((b1 & 0x07) << 10) | (b2 << 2) | (b3 >> 6)) + symbols::DecimalOffset),
        static_cast<std::uint16_t>((((b3 & 0x3F) << 7) | (b4 >> 1)) + symbols::DecimalOffset),
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Emojis> Verification::GenerateEmojis(Security::ReadableView bytes)
{
    if (bytes.size() < 6) { return {}; }

    // Pack the 48 bits into an integer and read the 42 leading bits six at a time.
    std::uint64_t packed = 0;
    for (std::size_t idx = 0; idx < 6; ++idx) { packed = (packed << 8) | bytes[idx]; }

    Emojis emojis;
    for (std::size_t idx = 0; idx < EmojiCount; ++idx) {
        auto const shift = 42 - (idx * 6);
        emojis[idx] = symbols::Emojis[(packed >> shift) & 0x3F];
    }
    return emojis;
}

//----------------------------------------------------------------------------------------------------------------------

std::span<Verification::Emoji const, Verification::EmojiTableSize> Verification::GetEmojiTable()
{
    return symbols::Emojis;
}

//----------------------------------------------------------------------------------------------------------------------
