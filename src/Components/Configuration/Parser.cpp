//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <fstream>
#include <sstream>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const DefaultConfigurationFilename = "verification.json";

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "verification": {
//     "request_timeout": Optional String,
//     "step_timeout": Optional String,
//     "retention": Optional String,
//     "methods": Optional Array<String>,
//     "short_authentication_strings": Optional Array<String>,
//     "qr_secret_size": Optional Integer
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(Options::Runtime const& options)
    : m_logger(Logger::Get())
    , m_version(std::string{ Defaults::Version })
    , m_filepath()
    , m_runtime(options)
    , m_verification()
    , m_validated(false)
    , m_changed(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath, Options::Runtime const& options)
    : m_logger(Logger::Get())
    , m_version(std::string{ Defaults::Version })
    , m_filepath(filepath)
    , m_runtime(options)
    , m_verification()
    , m_validated(false)
    , m_changed(false)
{
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::~Parser()
{
    if (!m_filepath.empty() && m_changed) {
        if (auto const status = Serialize(); status.first != StatusCode::Success) {
            m_logger->error("Failed to write pending configuration changes to {}! Reason: {}", m_filepath.string(), status.second);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    if (!m_changed) { return { StatusCode::Success, "" }; }

    // Changes made before the file was read are written back so the file reflects the active options.
    auto const status = Serialize();
    if (status.first != StatusCode::Success) {
        m_logger->error("Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
    }

    return status;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (m_changed) {
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    }

    if (m_filepath.empty()) {
        m_changed = false;
        return { StatusCode::Success, "" };
    }

    boost::json::object json;
    json[m_version.GetFieldName()] = m_version.GetValue();

    if (auto const status = m_verification.Write(json); status.first != StatusCode::Success) { return status; }

    std::ofstream os(m_filepath, std::ofstream::out);
    if (os.fail()) {
        return { StatusCode::FileError, "Failed to open file." };
    }

    JSON::PrettyPrinter{}.Format(json, os);

    os.close();
    if (os.fail()) {
        return { StatusCode::FileError, "Failed to write file." };
    }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed.

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (auto const status = m_verification.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetFilepath(std::filesystem::path const& filepath)
{
    m_changed = true; // Setting the changed flag to true, will cause the options to be serialized to the new file.
    m_filepath = filepath;
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem()
{
    m_filepath.clear(); // This is not considered a change as it does not have serializable side effects.
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Parser::GetVerbosity() const { return m_runtime.verbosity; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::UseStdOutSink() const { return m_runtime.useStdOutSink; }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Parser::GetRequestTimeout() const
{
    return m_verification.GetRequestTimeout();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Parser::GetStepTimeout() const
{
    return m_verification.GetStepTimeout();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Parser::GetRetentionPeriod() const
{
    return m_verification.GetRetentionPeriod();
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Methods const& Configuration::Parser::GetMethods() const { return m_verification.GetMethods(); }

//----------------------------------------------------------------------------------------------------------------------

Verification::SasEncodings const& Configuration::Parser::GetSasEncodings() const
{
    return m_verification.GetSasEncodings();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Configuration::Parser::GetQrSecretSize() const { return m_verification.GetQrSecretSize(); }

//----------------------------------------------------------------------------------------------------------------------

Verification::Settings Configuration::Parser::GetVerificationSettings() const { return m_verification.GetSettings(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated && !m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetVerbosity(spdlog::level::level_enum verbosity)
{
    m_runtime.verbosity = verbosity; // Runtime options are never serialized.
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetUseStdOutSink(bool use) { m_runtime.useStdOutSink = use; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetRequestTimeout(std::chrono::milliseconds const& timeout)
{
    return m_verification.SetRequestTimeout(timeout, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetStepTimeout(std::chrono::milliseconds const& timeout)
{
    return m_verification.SetStepTimeout(timeout, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetRetentionPeriod(std::chrono::milliseconds const& period)
{
    return m_verification.SetRetentionPeriod(period, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetMethods(::Verification::Methods const& methods)
{
    return m_verification.SetMethods(methods, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetSasEncodings(::Verification::SasEncodings const& encodings)
{
    return m_verification.SetSasEncodings(encodings, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetQrSecretSize(std::size_t size)
{
    return m_verification.SetQrSecretSize(size, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::OnFilepathChanged()
{
    if (m_filepath.empty()) { return; }

    if (!m_filepath.has_filename()) { m_filepath = m_filepath / local::DefaultConfigurationFilename; }

    // If we fail to create the folder structure for the file, filesystem usage is disabled.
    if (!FileUtils::CreateFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        DisableFilesystem();
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // If filesystem usage is disabled, there is nothing to do.
    if (m_validated && !m_changed) { return { StatusCode::Success, "" }; } // If there are no changes, there is nothing to do.

    bool const found = std::filesystem::exists(m_filepath);
    bool const isPendingSerialization = found && m_validated && m_changed;
    if (isPendingSerialization) { return { StatusCode::Success, "" }; }

    if (found) {
        m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
        return Deserialize();
    }

    std::string error = [&filepath = m_filepath] () {
        std::ostringstream oss;
        oss << "Failed to locate a configuration file at: ";
        oss << filepath;
        return oss.str();
    }();

    return { StatusCode::FileError, std::move(error) };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    std::error_code sizeError;
    auto const size = std::filesystem::file_size(m_filepath, sizeError);
    if (sizeError) {
        return { StatusCode::FileError, "Failed to determine the size of the configuration file." };
    }

    if (size > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file exceeds the 12KB size limit." };
    }

    constexpr boost::json::parse_options ParserOptions{
        .allow_comments = true,
        .allow_trailing_commas = true,
    };

    std::stringstream buffer;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
    }

    auto const serialized = buffer.str();
    if (serialized.empty()) {
        return { StatusCode::DecodeError, "The configuration file is empty." };
    }

    boost::json::error_code error;
    auto const parsed = boost::json::parse(serialized, error, boost::json::storage_ptr{}, ParserOptions);
    if (error || !parsed.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const& json = parsed.get_object();

    // Required field parsing.
    if (auto itr = json.find(m_version.GetFieldName()); itr != json.end()) {
        if (itr->value().is_string()) {
            auto const& version = itr->value().get_string();
            if (version.empty() || !m_version.SetValueFromConfig(std::string{ version.data(), version.size() })) {
                return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
            }
        } else {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName()) };
        }
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(m_version.GetFieldName()) };
    }

    if (auto itr = json.find(Options::Verification::GetFieldName()); itr != json.end()) {
        if (itr->value().is_object()) {
            auto const& value = itr->value().get_object();
            if (auto const status = m_verification.Merge(value); status.first != StatusCode::Success) {
                return status;
            }
        } else {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("object", Options::Verification::GetFieldName())
            };
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
