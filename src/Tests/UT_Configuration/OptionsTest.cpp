//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Options.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] boost::json::object ParseObject(std::string_view serialized);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, DefaultsTest)
{
    Configuration::Options::Verification const options;
    EXPECT_EQ(options.GetRequestTimeout(), Configuration::Defaults::RequestTimeout);
    EXPECT_EQ(options.GetStepTimeout(), Configuration::Defaults::StepTimeout);
    EXPECT_EQ(options.GetRetentionPeriod(), Configuration::Defaults::RetentionPeriod);
    EXPECT_EQ(options.GetMethods(), Configuration::Defaults::Methods);
    EXPECT_EQ(options.GetSasEncodings(), Configuration::Defaults::SasEncodings);
    EXPECT_EQ(options.GetQrSecretSize(), Configuration::Defaults::QrSecretSize);
    EXPECT_EQ(options.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    // Options matching the defaults are omitted from the file.
    boost::json::object json;
    EXPECT_EQ(options.Write(json).first, Configuration::StatusCode::Success);
    EXPECT_TRUE(json.empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, MergeTest)
{
    using namespace std::chrono_literals;

    Configuration::Options::Verification options;
    auto const json = local::ParseObject(R"({
        "request_timeout": "1h",
        "methods": [ "m.sas.v1", "M.SAS.V1", "m.reciprocate.v1" ],
        "short_authentication_strings": [ "Decimal", "EMOJI" ]
    })");

    EXPECT_EQ(options.Merge(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(options.GetRequestTimeout(), 1h);
    EXPECT_EQ(options.GetStepTimeout(), Configuration::Defaults::StepTimeout);

    // Repeated values are collapsed.
    Verification::Methods const expected = { Verification::Method::Sas, Verification::Method::Reciprocate };
    EXPECT_EQ(options.GetMethods(), expected);
    EXPECT_EQ(options.GetSasEncodings(), Configuration::Defaults::SasEncodings);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, MergeErrorsTest)
{
    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "step_timeout": 120 })"));
        EXPECT_EQ(status, Configuration::StatusCode::DecodeError);
        EXPECT_NE(message.find("verification.step_timeout"), std::string::npos);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "step_timeout": "0s" })"));
        EXPECT_EQ(status, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "retention": "2days" })"));
        EXPECT_EQ(status, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "methods": [] })"));
        EXPECT_EQ(status, Configuration::StatusCode::InputError);
        EXPECT_EQ(options.GetMethods(), Configuration::Defaults::Methods);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "methods": [ "m.sas.v1", 1 ] })"));
        EXPECT_EQ(status, Configuration::StatusCode::DecodeError);
        EXPECT_NE(message.find("verification.methods[1]"), std::string::npos);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "qr_secret_size": -16 })"));
        EXPECT_EQ(status, Configuration::StatusCode::InputError);
        EXPECT_EQ(options.GetQrSecretSize(), Configuration::Defaults::QrSecretSize);
    }

    {
        Configuration::Options::Verification options;
        auto const [status, message] = options.Merge(local::ParseObject(R"({ "qr_secret_size": "16" })"));
        EXPECT_EQ(status, Configuration::StatusCode::DecodeError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, ModifiedValuesPreferredTest)
{
    using namespace std::chrono_literals;

    Configuration::Options::Verification options;
    bool changed = false;
    EXPECT_TRUE(options.SetStepTimeout(3min, changed));
    EXPECT_TRUE(changed);

    auto const json = local::ParseObject(R"({ "step_timeout": "1min", "request_timeout": "1min" })");
    EXPECT_EQ(options.Merge(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(options.GetStepTimeout(), 3min);
    EXPECT_EQ(options.GetRequestTimeout(), 1min);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, SetterBoundsTest)
{
    using namespace std::chrono_literals;

    Configuration::Options::Verification options;
    bool changed = false;

    EXPECT_FALSE(options.SetRequestTimeout(0ms, changed));
    EXPECT_FALSE(options.SetRequestTimeout(Configuration::Defaults::TimeoutLimit + 1ms, changed));
    EXPECT_TRUE(options.SetRequestTimeout(Configuration::Defaults::TimeoutLimit, changed));

    EXPECT_TRUE(options.SetRetentionPeriod(0ms, changed));
    EXPECT_FALSE(options.SetRetentionPeriod(-1ms, changed));

    EXPECT_FALSE(options.SetQrSecretSize(Configuration::Defaults::MinimumQrSecretSize - 1, changed));
    EXPECT_TRUE(options.SetQrSecretSize(Configuration::Defaults::MinimumQrSecretSize, changed));
    EXPECT_TRUE(options.SetQrSecretSize(Configuration::Defaults::MaximumQrSecretSize, changed));
    EXPECT_FALSE(options.SetQrSecretSize(Configuration::Defaults::MaximumQrSecretSize + 1, changed));

    EXPECT_FALSE(options.SetSasEncodings({ Verification::SasEncoding::Emoji }, changed));
    EXPECT_FALSE(options.SetSasEncodings(
        { Verification::SasEncoding::Decimal, Verification::SasEncoding::Decimal }, changed));

    EXPECT_TRUE(changed);
    EXPECT_EQ(options.GetRequestTimeout(), Configuration::Defaults::TimeoutLimit);
    EXPECT_EQ(options.GetQrSecretSize(), Configuration::Defaults::MaximumQrSecretSize);
    EXPECT_EQ(options.GetSasEncodings(), Configuration::Defaults::SasEncodings);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, WriteTest)
{
    using namespace std::chrono_literals;

    Configuration::Options::Verification options;
    bool changed = false;
    ASSERT_TRUE(options.SetStepTimeout(90s, changed));
    ASSERT_TRUE(options.SetMethods({ Verification::Method::QrCodeShow, Verification::Method::Reciprocate }, changed));
    ASSERT_TRUE(options.SetQrSecretSize(Configuration::Defaults::QrSecretSize, changed));

    boost::json::object json;
    EXPECT_EQ(options.Write(json).first, Configuration::StatusCode::Success);
    ASSERT_TRUE(json.contains("verification"));

    auto const& group = json.at("verification").as_object();
    EXPECT_EQ(group.size(), std::size_t{ 2 });
    EXPECT_EQ(group.at("step_timeout").as_string(), "90s");

    auto const& methods = group.at("methods").as_array();
    ASSERT_EQ(methods.size(), std::size_t{ 2 });
    EXPECT_EQ(methods.at(0).as_string(), "m.qr_code.show.v1");
    EXPECT_EQ(methods.at(1).as_string(), "m.reciprocate.v1");

    Configuration::Options::Verification reader;
    EXPECT_EQ(reader.Merge(group).first, Configuration::StatusCode::Success);
    EXPECT_EQ(reader.GetStepTimeout(), options.GetStepTimeout());
    EXPECT_EQ(reader.GetMethods(), options.GetMethods());
    EXPECT_EQ(reader.GetQrSecretSize(), options.GetQrSecretSize());

    Configuration::Options::Verification duplicate;
    EXPECT_EQ(duplicate.Merge(group).first, Configuration::StatusCode::Success);
    EXPECT_TRUE(duplicate == reader);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VerificationOptionsSuite, DurationConversionTest)
{
    using namespace std::chrono_literals;

    EXPECT_EQ(TimeUtils::StringToDuration("250ms"), 250ms);
    EXPECT_EQ(TimeUtils::StringToDuration("90s"), 90s);
    EXPECT_EQ(TimeUtils::StringToDuration("10min"), 10min);
    EXPECT_EQ(TimeUtils::StringToDuration("24h"), 24h);
    EXPECT_FALSE(TimeUtils::StringToDuration("90"));
    EXPECT_FALSE(TimeUtils::StringToDuration("min"));
    EXPECT_FALSE(TimeUtils::StringToDuration("1.5min"));
    EXPECT_FALSE(TimeUtils::StringToDuration("10days"));

    EXPECT_EQ(TimeUtils::DurationToString(0ms), "0ms");
    EXPECT_EQ(TimeUtils::DurationToString(1500ms), "1500ms");
    EXPECT_EQ(TimeUtils::DurationToString(90s), "90s");
    EXPECT_EQ(TimeUtils::DurationToString(120s), "2min");
    EXPECT_EQ(TimeUtils::DurationToString(1440min), "24h");
    EXPECT_FALSE(TimeUtils::DurationToString(-1ms));
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object local::ParseObject(std::string_view serialized)
{
    auto const parsed = boost::json::parse(serialized);
    return parsed.as_object();
}

//----------------------------------------------------------------------------------------------------------------------
