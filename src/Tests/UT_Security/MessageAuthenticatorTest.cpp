//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Security/MessageAuthenticator.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

// RFC 4231, Test Cases 1 and 2
constexpr std::string_view FirstKey = "0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b";
constexpr std::string_view FirstData = "Hi There";
constexpr std::string_view FirstSignature = "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7";

constexpr std::string_view SecondKey = "Jefe";
constexpr std::string_view SecondData = "what do ya want for nothing?";
constexpr std::string_view SecondSignature = "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(MessageAuthenticatorSuite, KnownVectorTest)
{
    Security::MessageAuthenticator const authenticator;

    auto const optFirst = authenticator.GenerateSignature(
        Security::Test::FromHex(test::FirstKey), Security::ToReadableView(test::FirstData));
    ASSERT_TRUE(optFirst);
    EXPECT_EQ(optFirst->size(), Security::Sha256DigestSize);
    EXPECT_EQ(Security::Test::ToHex(*optFirst), test::FirstSignature);

    auto const optSecond = authenticator.GenerateSignature(
        Security::ToReadableView(test::SecondKey), Security::ToReadableView(test::SecondData));
    ASSERT_TRUE(optSecond);
    EXPECT_EQ(Security::Test::ToHex(*optSecond), test::SecondSignature);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MessageAuthenticatorSuite, EmptyKeyTest)
{
    Security::MessageAuthenticator const authenticator;
    EXPECT_FALSE(authenticator.GenerateSignature(Security::Buffer{}, Security::ToReadableView(test::FirstData)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MessageAuthenticatorSuite, EmptySourceTest)
{
    Security::MessageAuthenticator const authenticator;
    auto const key = Security::Test::FromHex(test::FirstKey);

    auto const optFirst = authenticator.GenerateSignature(key, Security::ReadableView{});
    auto const optSecond = authenticator.GenerateSignature(key, Security::ReadableView{});
    ASSERT_TRUE(optFirst && optSecond);
    EXPECT_EQ(*optFirst, *optSecond);
    EXPECT_NE(Security::Test::ToHex(*optFirst), test::FirstSignature);
}

//----------------------------------------------------------------------------------------------------------------------
