//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Parser.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path GetFilepath(std::filesystem::path const& filename);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr auto RuntimeOptions = Configuration::Options::Runtime
{ 
    .verbosity = spdlog::level::debug,
    .useStdOutSink = false
};

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseGoodFileTest)
{
    using namespace std::chrono_literals;

    Configuration::Parser parser(local::GetFilepath("good/verification.json"), test::RuntimeOptions);
    EXPECT_FALSE(parser.FilesystemDisabled());
    EXPECT_FALSE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());

    EXPECT_EQ(parser.GetVersion(), "1.0.0");
    EXPECT_EQ(parser.GetRequestTimeout(), 5min);
    EXPECT_EQ(parser.GetStepTimeout(), 90s);
    EXPECT_EQ(parser.GetRetentionPeriod(), 30s);
    EXPECT_EQ(parser.GetQrSecretSize(), std::size_t{ 32 });

    // Method names are matched without regard to case or surrounding whitespace.
    Verification::Methods const expectedMethods = { Verification::Method::Sas, Verification::Method::QrCodeScan };
    EXPECT_EQ(parser.GetMethods(), expectedMethods);
    EXPECT_EQ(parser.GetSasEncodings(), Verification::SasEncodings{ Verification::SasEncoding::Decimal });

    auto const settings = parser.GetVerificationSettings();
    EXPECT_EQ(settings.requestTimeout, 5min);
    EXPECT_EQ(settings.stepTimeout, 90s);
    EXPECT_EQ(settings.retentionPeriod, 30s);
    EXPECT_EQ(settings.futureTolerance, Configuration::Defaults::FutureTolerance);
    EXPECT_EQ(settings.methods, expectedMethods);
    EXPECT_EQ(settings.qrSecretSize, std::size_t{ 32 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseDefaultsFileTest)
{
    Configuration::Parser parser(local::GetFilepath("good/defaults.json"), test::RuntimeOptions);
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());

    EXPECT_EQ(parser.GetRequestTimeout(), Configuration::Defaults::RequestTimeout);
    EXPECT_EQ(parser.GetStepTimeout(), Configuration::Defaults::StepTimeout);
    EXPECT_EQ(parser.GetRetentionPeriod(), Configuration::Defaults::RetentionPeriod);
    EXPECT_EQ(parser.GetMethods(), Configuration::Defaults::Methods);
    EXPECT_EQ(parser.GetSasEncodings(), Configuration::Defaults::SasEncodings);
    EXPECT_EQ(parser.GetQrSecretSize(), Configuration::Defaults::QrSecretSize);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseMalformedFileTest)
{
    Configuration::Parser parser(local::GetFilepath("malformed/verification.json"), test::RuntimeOptions);
    EXPECT_FALSE(parser.FilesystemDisabled());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    EXPECT_FALSE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseMissingFileTest)
{
    Configuration::Parser parser(local::GetFilepath("missing/verification.json"), test::RuntimeOptions);
    EXPECT_FALSE(parser.FilesystemDisabled());
    auto const [status, message] = parser.FetchOptions();
    EXPECT_EQ(status, Configuration::StatusCode::FileError);
    EXPECT_FALSE(message.empty());
    EXPECT_FALSE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
    std::filesystem::remove(local::GetFilepath("missing"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseInvalidFilesTest)
{
    {
        Configuration::Parser parser(local::GetFilepath("invalid/version.json"), test::RuntimeOptions);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
        EXPECT_FALSE(parser.Validated());
    }

    {
        Configuration::Parser parser(local::GetFilepath("invalid/timeout.json"), test::RuntimeOptions);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
        EXPECT_FALSE(parser.Validated());
    }

    {
        Configuration::Parser parser(local::GetFilepath("invalid/methods.json"), test::RuntimeOptions);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
        EXPECT_FALSE(parser.Validated());
    }

    {
        Configuration::Parser parser(local::GetFilepath("invalid/secret.json"), test::RuntimeOptions);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
        EXPECT_FALSE(parser.Validated());
    }

    // The decimal rendering may not be disabled.
    {
        Configuration::Parser parser(local::GetFilepath("invalid/encodings.json"), test::RuntimeOptions);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
        EXPECT_FALSE(parser.Validated());
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, FileGenerationTest)
{
    using namespace std::chrono_literals;

    auto const filepath = local::GetFilepath("good/generated.json");
    if (std::filesystem::exists(filepath)) { std::filesystem::remove(filepath); }

    Configuration::Parser parser(filepath, test::RuntimeOptions);
    EXPECT_FALSE(parser.FilesystemDisabled());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);

    // Verify the default options are set to the expected values. 
    EXPECT_EQ(parser.GetVerbosity(), test::RuntimeOptions.verbosity);
    EXPECT_EQ(parser.UseStdOutSink(), test::RuntimeOptions.useStdOutSink);
    EXPECT_EQ(parser.GetRequestTimeout(), Configuration::Defaults::RequestTimeout);
    EXPECT_EQ(parser.GetMethods(), Configuration::Defaults::Methods);

    // Verify that that all setters and getters work as expected. 
    parser.SetVerbosity(spdlog::level::info);
    EXPECT_EQ(parser.GetVerbosity(), spdlog::level::info);

    parser.SetUseStdOutSink(true);
    EXPECT_TRUE(parser.UseStdOutSink());
    EXPECT_FALSE(parser.Changed()); // Runtime options do not have serializable side effects.

    EXPECT_FALSE(parser.SetRequestTimeout(0ms));
    EXPECT_FALSE(parser.SetRequestTimeout(1441min));
    EXPECT_TRUE(parser.SetRequestTimeout(1440min));
    EXPECT_TRUE(parser.SetRequestTimeout(15min));
    EXPECT_EQ(parser.GetRequestTimeout(), 15min);

    EXPECT_TRUE(parser.SetStepTimeout(45s));
    EXPECT_EQ(parser.GetStepTimeout(), 45s);

    EXPECT_TRUE(parser.SetRetentionPeriod(0ms));
    EXPECT_EQ(parser.GetRetentionPeriod(), 0ms);

    EXPECT_FALSE(parser.SetMethods({}));
    EXPECT_FALSE(parser.SetMethods({ Verification::Method::Sas, Verification::Method::Sas }));
    EXPECT_TRUE(parser.SetMethods({ Verification::Method::Sas }));

    EXPECT_FALSE(parser.SetSasEncodings({ Verification::SasEncoding::Emoji }));
    EXPECT_TRUE(parser.SetSasEncodings({ Verification::SasEncoding::Decimal }));

    EXPECT_FALSE(parser.SetQrSecretSize(Configuration::Defaults::MinimumQrSecretSize - 1));
    EXPECT_FALSE(parser.SetQrSecretSize(Configuration::Defaults::MaximumQrSecretSize + 1));
    EXPECT_TRUE(parser.SetQrSecretSize(24));

    EXPECT_FALSE(parser.Validated());
    EXPECT_TRUE(parser.Changed());

    EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());

    Configuration::Parser checker(filepath, test::RuntimeOptions);
    EXPECT_EQ(checker.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(checker.Validated());
    EXPECT_FALSE(checker.Changed());

    // Verify the fields that are not written to the file are not changed after a read. 
    EXPECT_EQ(checker.GetVerbosity(), test::RuntimeOptions.verbosity);
    EXPECT_EQ(checker.UseStdOutSink(), test::RuntimeOptions.useStdOutSink);

    // Verify the check and original parser values match. 
    EXPECT_EQ(checker.GetRequestTimeout(), parser.GetRequestTimeout());
    EXPECT_EQ(checker.GetStepTimeout(), parser.GetStepTimeout());
    EXPECT_EQ(checker.GetRetentionPeriod(), parser.GetRetentionPeriod());
    EXPECT_EQ(checker.GetMethods(), parser.GetMethods());
    EXPECT_EQ(checker.GetSasEncodings(), parser.GetSasEncodings());
    EXPECT_EQ(checker.GetQrSecretSize(), parser.GetQrSecretSize());

    std::filesystem::remove(filepath);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, PendingChangesTest)
{
    using namespace std::chrono_literals;

    auto const filepath = local::GetFilepath("good/pending.json");
    if (std::filesystem::exists(filepath)) { std::filesystem::remove(filepath); }

    {
        Configuration::Parser parser(filepath, test::RuntimeOptions);
        EXPECT_TRUE(parser.SetStepTimeout(3min));
        EXPECT_TRUE(parser.Changed());
        EXPECT_FALSE(std::filesystem::exists(filepath));
    }

    // Changes that were never serialized are written when the parser is destroyed.
    EXPECT_TRUE(std::filesystem::exists(filepath));

    Configuration::Parser checker(filepath, test::RuntimeOptions);
    EXPECT_EQ(checker.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(checker.GetStepTimeout(), 3min);
    EXPECT_EQ(checker.GetRequestTimeout(), Configuration::Defaults::RequestTimeout);

    std::filesystem::remove(filepath);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, DefaultFilenameTest)
{
    auto const directory = local::GetFilepath("nested/");
    {
        Configuration::Parser parser(directory, test::RuntimeOptions);
        EXPECT_FALSE(parser.FilesystemDisabled());
        EXPECT_EQ(parser.GetFilepath().filename(), "verification.json");
        EXPECT_TRUE(std::filesystem::exists(parser.GetFilepath().parent_path()));
    }
    std::filesystem::remove_all(directory);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, DisabledFilesystemTest)
{
    using namespace std::chrono_literals;

    Configuration::Parser parser(test::RuntimeOptions);
    EXPECT_TRUE(parser.FilesystemDisabled());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());

    EXPECT_TRUE(parser.SetRequestTimeout(20min));
    EXPECT_TRUE(parser.Changed());
    EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::Success);
    EXPECT_FALSE(parser.Changed());
    EXPECT_EQ(parser.GetVerificationSettings().requestTimeout, 20min);
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path local::GetFilepath(std::filesystem::path const& filename)
{
    auto path = std::filesystem::current_path();
    if (path.filename() == "UT_Configuration") { 
        return path / "files" / filename;
    } else {
        if (path.filename() == "bin") { path.remove_filename(); }
        return path / "Tests/UT_Configuration/files" / filename;
    }
}

//----------------------------------------------------------------------------------------------------------------------
