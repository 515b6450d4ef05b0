//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

struct Runtime;

class Verification;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Methods);
DEFINE_FIELD_NAME(QrSecretSize);
DEFINE_FIELD_NAME(RequestTimeout);
DEFINE_FIELD_NAME(Retention);
DEFINE_FIELD_NAME(ShortAuthenticationStrings);
DEFINE_FIELD_NAME(StepTimeout);
DEFINE_FIELD_NAME(Verification);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

// Options supplied by the host application. These are never read from or written to the configuration file.
struct Configuration::Options::Runtime
{
    spdlog::level::level_enum verbosity;
    bool useStdOutSink;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The "verification" object of the configuration file. Unset fields resolve to the defaults and are
// omitted when the options are written back to the file.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Verification
{
public:
    Verification();

    [[nodiscard]] bool operator==(Verification const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbols::Verification::GetFieldName(); }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds const& GetRequestTimeout() const;
    [[nodiscard]] std::chrono::milliseconds const& GetStepTimeout() const;
    [[nodiscard]] std::chrono::milliseconds const& GetRetentionPeriod() const;
    [[nodiscard]] ::Verification::Methods const& GetMethods() const;
    [[nodiscard]] ::Verification::SasEncodings const& GetSasEncodings() const;
    [[nodiscard]] std::size_t GetQrSecretSize() const;

    // Collects the options into the settings consumed by the verification service.
    [[nodiscard]] ::Verification::Settings GetSettings() const;

    [[nodiscard]] bool SetRequestTimeout(std::chrono::milliseconds const& value, bool& changed);
    [[nodiscard]] bool SetStepTimeout(std::chrono::milliseconds const& value, bool& changed);
    [[nodiscard]] bool SetRetentionPeriod(std::chrono::milliseconds const& value, bool& changed);
    [[nodiscard]] bool SetMethods(::Verification::Methods const& methods, bool& changed);
    [[nodiscard]] bool SetSasEncodings(::Verification::SasEncodings const& encodings, bool& changed);
    [[nodiscard]] bool SetQrSecretSize(std::size_t size, bool& changed);

private:
    template<typename FieldType>
    [[nodiscard]] DeserializationResult MergeDuration(boost::json::object const& json, FieldType& field);

    [[nodiscard]] DeserializationResult MergeMethods(boost::json::object const& json);
    [[nodiscard]] DeserializationResult MergeSasEncodings(boost::json::object const& json);
    [[nodiscard]] DeserializationResult MergeQrSecretSize(boost::json::object const& json);

    OptionalConstructedField<Symbols::RequestTimeout, std::chrono::milliseconds> m_optRequestTimeout;
    OptionalConstructedField<Symbols::StepTimeout, std::chrono::milliseconds> m_optStepTimeout;
    OptionalConstructedField<Symbols::Retention, std::chrono::milliseconds> m_optRetention;
    OptionalField<Symbols::Methods, ::Verification::Methods> m_optMethods;
    OptionalField<Symbols::ShortAuthenticationStrings, ::Verification::SasEncodings> m_optSasEncodings;
    OptionalField<Symbols::QrSecretSize, std::size_t> m_optQrSecretSize;
};

//----------------------------------------------------------------------------------------------------------------------
