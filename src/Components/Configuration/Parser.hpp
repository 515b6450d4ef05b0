//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads and writes the verification configuration file. The parser owns the options for the lifetime of
// the host and writes pending changes back to the file on destruction.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "StatusCode.hpp"
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    explicit Parser(Options::Runtime const& options);
    Parser(std::filesystem::path const& filepath, Options::Runtime const& options);
    ~Parser();

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void SetFilepath(std::filesystem::path const& filepath);
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] bool UseStdOutSink() const;

    [[nodiscard]] std::chrono::milliseconds const& GetRequestTimeout() const;
    [[nodiscard]] std::chrono::milliseconds const& GetStepTimeout() const;
    [[nodiscard]] std::chrono::milliseconds const& GetRetentionPeriod() const;
    [[nodiscard]] ::Verification::Methods const& GetMethods() const;
    [[nodiscard]] ::Verification::SasEncodings const& GetSasEncodings() const;
    [[nodiscard]] std::size_t GetQrSecretSize() const;
    [[nodiscard]] ::Verification::Settings GetVerificationSettings() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

    void SetVerbosity(spdlog::level::level_enum verbosity);
    void SetUseStdOutSink(bool use);
    [[nodiscard]] bool SetRequestTimeout(std::chrono::milliseconds const& timeout);
    [[nodiscard]] bool SetStepTimeout(std::chrono::milliseconds const& timeout);
    [[nodiscard]] bool SetRetentionPeriod(std::chrono::milliseconds const& period);
    [[nodiscard]] bool SetMethods(::Verification::Methods const& methods);
    [[nodiscard]] bool SetSasEncodings(::Verification::SasEncodings const& encodings);
    [[nodiscard]] bool SetQrSecretSize(std::size_t size);

private:
    void OnFilepathChanged();
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;

    Field<Symbols::Version, std::string> m_version;
    std::filesystem::path m_filepath;

    Options::Runtime m_runtime;
    Options::Verification m_verification;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
