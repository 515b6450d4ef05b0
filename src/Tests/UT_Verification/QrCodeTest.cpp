//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
#include "Components/Verification/QrCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Verification::QrCode::PublicKey CreateKey(std::uint8_t seed);
[[nodiscard]] Verification::QrCode CreateCode(Verification::QrCode::Mode mode);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view TransactionId = "RwLuCgvQvhcpIZEFTcTqXDhVEmCYiHbM";
Security::Buffer const Secret = {
    0x5A, 0x13, 0xC4, 0x7E, 0x01, 0xFF, 0x90, 0x2B, 0x66, 0xD1, 0x08, 0x3C, 0xE7, 0x42, 0xBD, 0x19 };

constexpr std::size_t KeysOffset = Verification::QrCode::HeaderSize + TransactionId.size();

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, EncodeLayoutTest)
{
    auto const code = local::CreateCode(Verification::QrCode::Mode::CrossUser);
    auto const optPayload = code.Encode();
    ASSERT_TRUE(optPayload);

    auto const& payload = *optPayload;
    ASSERT_EQ(payload.size(), test::KeysOffset + 2 * Security::Ed25519KeySize + test::Secret.size());

    EXPECT_TRUE(std::equal(Verification::QrCode::Magic.begin(), Verification::QrCode::Magic.end(), payload.begin()));
    EXPECT_EQ(payload[6], 0x02);
    EXPECT_EQ(payload[7], 0x02);
    EXPECT_EQ(payload[8], 0x00); // The transaction id length is big endian.
    EXPECT_EQ(payload[9], test::TransactionId.size());

    std::string const transactionId(payload.begin() + 10, payload.begin() + 10 + test::TransactionId.size());
    EXPECT_EQ(transactionId, test::TransactionId);

    auto const first = local::CreateKey(0x10);
    auto const second = local::CreateKey(0x40);
    EXPECT_TRUE(std::equal(first.begin(), first.end(), payload.begin() + test::KeysOffset));
    EXPECT_TRUE(std::equal(second.begin(), second.end(), payload.begin() + test::KeysOffset + first.size()));
    EXPECT_TRUE(std::equal(test::Secret.begin(), test::Secret.end(), payload.end() - test::Secret.size()));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, DecodeEncodedPayloadTest)
{
    using enum Verification::QrCode::Mode;
    for (auto const mode : { SelfTrusted, SelfUntrusted, CrossUser }) {
        auto const code = local::CreateCode(mode);
        auto const optPayload = code.Encode();
        ASSERT_TRUE(optPayload);

        auto const optDecoded = Verification::QrCode::Decode(*optPayload);
        ASSERT_TRUE(optDecoded);
        EXPECT_EQ(optDecoded->GetMode(), mode);
        EXPECT_EQ(optDecoded->GetTransactionId(), test::TransactionId);
        EXPECT_EQ(optDecoded->GetFirstKey(), local::CreateKey(0x10));
        EXPECT_EQ(optDecoded->GetSecondKey(), local::CreateKey(0x40));
        EXPECT_TRUE(std::ranges::equal(optDecoded->GetSecret(), test::Secret));
        EXPECT_EQ(*optDecoded, code);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, DecodeTruncatedPayloadTest)
{
    auto const optPayload = local::CreateCode(Verification::QrCode::Mode::SelfTrusted).Encode();
    ASSERT_TRUE(optPayload);

    // Anything shorter than the minimum secret leaves the payload unusable.
    std::size_t const minimum = optPayload->size() - test::Secret.size() + Verification::QrCode::MinimumSecretSize;
    EXPECT_TRUE(Verification::QrCode::Decode({ optPayload->data(), minimum }));
    for (std::size_t size = 0; size < minimum; ++size) {
        EXPECT_FALSE(Verification::QrCode::Decode({ optPayload->data(), size }));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, DecodeCorruptedHeaderTest)
{
    auto const optPayload = local::CreateCode(Verification::QrCode::Mode::SelfTrusted).Encode();
    ASSERT_TRUE(optPayload);

    {
        auto payload = *optPayload;
        payload[0] = 'N';
        EXPECT_FALSE(Verification::QrCode::Decode(payload));
    }

    {
        auto payload = *optPayload;
        payload[6] = 0x01;
        EXPECT_FALSE(Verification::QrCode::Decode(payload));
    }

    {
        auto payload = *optPayload;
        payload[7] = 0x03;
        EXPECT_FALSE(Verification::QrCode::Decode(payload));
    }

    {
        auto payload = *optPayload;
        payload[8] = 0x01; // The declared transaction id is longer than the payload.
        EXPECT_FALSE(Verification::QrCode::Decode(payload));
    }

    {
        auto payload = *optPayload;
        payload[8] = 0x00;
        payload[9] = 0x00;
        EXPECT_FALSE(Verification::QrCode::Decode(payload));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, EncodeInvalidFieldsTest)
{
    auto const first = local::CreateKey(0x10);
    auto const second = local::CreateKey(0x40);

    Verification::QrCode const missing{ Verification::QrCode::Mode::CrossUser, "", first, second, test::Secret };
    EXPECT_FALSE(missing.Encode());

    Security::Buffer const secret(Verification::QrCode::MinimumSecretSize - 1, 0xAB);
    Verification::QrCode const weak{ Verification::QrCode::Mode::CrossUser, test::TransactionId, first, second, secret };
    EXPECT_FALSE(weak.Encode());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrCodeSuite, EraseSecretTest)
{
    auto code = local::CreateCode(Verification::QrCode::Mode::CrossUser);
    EXPECT_EQ(code.GetSecret().size(), test::Secret.size());

    auto const moved = std::move(code);
    EXPECT_TRUE(std::ranges::equal(moved.GetSecret(), test::Secret));

    // An erased code keeps its keys but can no longer be displayed.
    auto erased = local::CreateCode(Verification::QrCode::Mode::CrossUser);
    erased.Erase();
    EXPECT_TRUE(erased.GetSecret().empty());
    EXPECT_EQ(erased.GetFirstKey(), local::CreateKey(0x10));
    EXPECT_FALSE(erased.Encode());
    EXPECT_FALSE(erased == moved);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::PublicKey local::CreateKey(std::uint8_t seed)
{
    Verification::QrCode::PublicKey key{};
    for (std::size_t idx = 0; idx < key.size(); ++idx) { key[idx] = static_cast<std::uint8_t>(seed + idx); }
    return key;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode local::CreateCode(Verification::QrCode::Mode mode)
{
    return Verification::QrCode{ mode, test::TransactionId, CreateKey(0x10), CreateKey(0x40), test::Secret };
}

//----------------------------------------------------------------------------------------------------------------------
