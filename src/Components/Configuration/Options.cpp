//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <limits>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsAllowableTimeout(std::chrono::milliseconds const& value);
[[nodiscard]] bool IsAllowableRetention(std::chrono::milliseconds const& value);
[[nodiscard]] bool IsAllowableSecretSize(std::size_t const& value);
[[nodiscard]] std::string NormalizeValue(boost::json::string const& value);

template<typename ValueType>
[[nodiscard]] bool ContainsDuplicates(std::vector<ValueType> const& values);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Verification::Verification()
    : m_optRequestTimeout(TimeUtils::StringToDuration, TimeUtils::DurationToString, local::IsAllowableTimeout)
    , m_optStepTimeout(TimeUtils::StringToDuration, TimeUtils::DurationToString, local::IsAllowableTimeout)
    , m_optRetention(TimeUtils::StringToDuration, TimeUtils::DurationToString, local::IsAllowableRetention)
    , m_optMethods([] (auto const& methods) { return !methods.empty() && !local::ContainsDuplicates(methods); })
    , m_optSasEncodings([] (auto const& encodings) { return !local::ContainsDuplicates(encodings); })
    , m_optQrSecretSize(local::IsAllowableSecretSize)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::operator==(Verification const& other) const noexcept
{
    return m_optRequestTimeout == other.m_optRequestTimeout &&
        m_optStepTimeout == other.m_optStepTimeout &&
        m_optRetention == other.m_optRetention &&
        m_optMethods == other.m_optMethods &&
        m_optSasEncodings == other.m_optSasEncodings &&
        m_optQrSecretSize == other.m_optQrSecretSize;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Verification::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "verification": {
    //     "request_timeout": Optional String,
    //     "step_timeout": Optional String,
    //     "retention": Optional String,
    //     "methods": Optional Array<String>,
    //     "short_authentication_strings": Optional Array<String>,
    //     "qr_secret_size": Optional Integer
    // },

    if (auto const result = MergeDuration(json, m_optRequestTimeout); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = MergeDuration(json, m_optStepTimeout); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = MergeDuration(json, m_optRetention); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = MergeMethods(json); result.first != StatusCode::Success) { return result; }
    if (auto const result = MergeSasEncodings(json); result.first != StatusCode::Success) { return result; }
    if (auto const result = MergeQrSecretSize(json); result.first != StatusCode::Success) { return result; }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Verification::Write(boost::json::object& json) const
{
    boost::json::object group;

    auto const writeDuration = [&group] (auto const& field, std::chrono::milliseconds const& defaultValue) -> bool {
        if (field.WouldMatchDefault(defaultValue)) { return true; }
        auto const optSerialized = field.GetSerializedValue();
        if (!optSerialized) { return false; }
        group[field.GetFieldName()] = *optSerialized;
        return true;
    };

    if (!writeDuration(m_optRequestTimeout, Defaults::RequestTimeout)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_optRequestTimeout.GetFieldName()) };
    }

    if (!writeDuration(m_optStepTimeout, Defaults::StepTimeout)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_optStepTimeout.GetFieldName()) };
    }

    if (!writeDuration(m_optRetention, Defaults::RetentionPeriod)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_optRetention.GetFieldName()) };
    }

    if (!m_optMethods.WouldMatchDefault(Defaults::Methods)) {
        boost::json::array methods;
        for (auto const method : m_optMethods.GetValueOrElse(Defaults::Methods)) {
            methods.emplace_back(::Verification::ToString(method));
        }
        group[m_optMethods.GetFieldName()] = std::move(methods);
    }

    if (!m_optSasEncodings.WouldMatchDefault(Defaults::SasEncodings)) {
        boost::json::array encodings;
        for (auto const encoding : m_optSasEncodings.GetValueOrElse(Defaults::SasEncodings)) {
            encodings.emplace_back(::Verification::ToString(encoding));
        }
        group[m_optSasEncodings.GetFieldName()] = std::move(encodings);
    }

    if (!m_optQrSecretSize.WouldMatchDefault(Defaults::QrSecretSize)) {
        group[m_optQrSecretSize.GetFieldName()] = static_cast<std::uint64_t>(GetQrSecretSize());
    }

    if (!group.empty()) { json.emplace(GetFieldName(), std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Verification::AreOptionsAllowable() const
{
    // The decimal rendering is mandatory.
    auto const& encodings = GetSasEncodings();
    if (std::ranges::find(encodings, ::Verification::SasEncoding::Decimal) == encodings.end()) {
        return {
            StatusCode::InputError,
            CreateRequiredValueMessage(
                ::Verification::ToString(::Verification::SasEncoding::Decimal),
                GetFieldName(), m_optSasEncodings.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Verification::GetRequestTimeout() const
{
    return m_optRequestTimeout.GetValueOrElse(Defaults::RequestTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Verification::GetStepTimeout() const
{
    return m_optStepTimeout.GetValueOrElse(Defaults::StepTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Verification::GetRetentionPeriod() const
{
    return m_optRetention.GetValueOrElse(Defaults::RetentionPeriod);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Methods const& Configuration::Options::Verification::GetMethods() const
{
    return m_optMethods.GetValueOrElse(Defaults::Methods);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::SasEncodings const& Configuration::Options::Verification::GetSasEncodings() const
{
    return m_optSasEncodings.GetValueOrElse(Defaults::SasEncodings);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Configuration::Options::Verification::GetQrSecretSize() const
{
    return m_optQrSecretSize.GetValueOrElse(Defaults::QrSecretSize);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Settings Configuration::Options::Verification::GetSettings() const
{
    return ::Verification::Settings{
        .requestTimeout = GetRequestTimeout(),
        .stepTimeout = GetStepTimeout(),
        .retentionPeriod = GetRetentionPeriod(),
        .futureTolerance = Defaults::FutureTolerance,
        .methods = GetMethods(),
        .sasEncodings = GetSasEncodings(),
        .qrSecretSize = GetQrSecretSize()
    };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetRequestTimeout(std::chrono::milliseconds const& value, bool& changed)
{
    if (!m_optRequestTimeout.SetValue(value)) { return false; }
    changed = changed || m_optRequestTimeout.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetStepTimeout(std::chrono::milliseconds const& value, bool& changed)
{
    if (!m_optStepTimeout.SetValue(value)) { return false; }
    changed = changed || m_optStepTimeout.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetRetentionPeriod(std::chrono::milliseconds const& value, bool& changed)
{
    if (!m_optRetention.SetValue(value)) { return false; }
    changed = changed || m_optRetention.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetMethods(::Verification::Methods const& methods, bool& changed)
{
    if (!m_optMethods.SetValue(methods)) { return false; }
    changed = changed || m_optMethods.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetSasEncodings(
    ::Verification::SasEncodings const& encodings, bool& changed)
{
    if (std::ranges::find(encodings, ::Verification::SasEncoding::Decimal) == encodings.end()) { return false; }
    if (!m_optSasEncodings.SetValue(encodings)) { return false; }
    changed = changed || m_optSasEncodings.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Verification::SetQrSecretSize(std::size_t size, bool& changed)
{
    if (!m_optQrSecretSize.SetValue(size)) { return false; }
    changed = changed || m_optQrSecretSize.Modified();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
Configuration::DeserializationResult Configuration::Options::Verification::MergeDuration(
    boost::json::object const& json, FieldType& field)
{
    // The existing values of this object are chosen over the file's values.
    if (field.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_string()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("string", GetFieldName(), field.GetFieldName())
        };
    }

    auto const& value = itr->value().get_string();
    if (!field.SetValueFromConfig(std::string_view{ value.data(), value.size() })) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Verification::MergeMethods(
    boost::json::object const& json)
{
    if (m_optMethods.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(m_optMethods.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_array()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("array", GetFieldName(), m_optMethods.GetFieldName())
        };
    }

    auto const& elements = itr->value().get_array();
    ::Verification::Methods methods;
    methods.reserve(elements.size());
    for (std::size_t idx = 0; idx < elements.size(); ++idx) {
        auto const& element = elements[idx];
        if (!element.is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage(
                    "string", CreateArrayContextString(idx, GetFieldName(), m_optMethods.GetFieldName()))
            };
        }

        auto const optMethod = ::Verification::ParseMethod(local::NormalizeValue(element.get_string()));
        if (!optMethod) {
            return {
                StatusCode::InputError,
                CreateInvalidValueMessage(CreateArrayContextString(idx, GetFieldName(), m_optMethods.GetFieldName()))
            };
        }

        if (std::ranges::find(methods, *optMethod) == methods.end()) { methods.emplace_back(*optMethod); }
    }

    if (methods.empty()) {
        return { StatusCode::InputError, CreateEmptyArrayFieldMessage(GetFieldName(), m_optMethods.GetFieldName()) };
    }

    if (!m_optMethods.SetValueFromConfig(methods)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_optMethods.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Verification::MergeSasEncodings(
    boost::json::object const& json)
{
    if (m_optSasEncodings.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(m_optSasEncodings.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_array()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("array", GetFieldName(), m_optSasEncodings.GetFieldName())
        };
    }

    auto const& elements = itr->value().get_array();
    ::Verification::SasEncodings encodings;
    for (std::size_t idx = 0; idx < elements.size(); ++idx) {
        auto const& element = elements[idx];
        if (!element.is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage(
                    "string", CreateArrayContextString(idx, GetFieldName(), m_optSasEncodings.GetFieldName()))
            };
        }

        auto const optEncoding = ::Verification::ParseSasEncoding(local::NormalizeValue(element.get_string()));
        if (!optEncoding) {
            return {
                StatusCode::InputError,
                CreateInvalidValueMessage(
                    CreateArrayContextString(idx, GetFieldName(), m_optSasEncodings.GetFieldName()))
            };
        }

        if (std::ranges::find(encodings, *optEncoding) == encodings.end()) { encodings.emplace_back(*optEncoding); }
    }

    if (!m_optSasEncodings.SetValueFromConfig(encodings)) {
        return {
            StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_optSasEncodings.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Verification::MergeQrSecretSize(
    boost::json::object const& json)
{
    if (m_optQrSecretSize.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(m_optQrSecretSize.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    auto const& value = itr->value();
    std::optional<std::int64_t> optSize;
    if (value.is_int64()) {
        optSize = value.get_int64();
    } else if (value.is_uint64()) {
        optSize = static_cast<std::int64_t>(std::min<std::uint64_t>(value.get_uint64(), std::numeric_limits<std::int64_t>::max()));
    } else {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("integer", GetFieldName(), m_optQrSecretSize.GetFieldName())
        };
    }

    bool const allowable = *optSize >= 0 && m_optQrSecretSize.SetValueFromConfig(static_cast<std::size_t>(*optSize));
    if (!allowable) {
        return {
            StatusCode::InputError,
            CreateValueRangeMessage(
                Defaults::MinimumQrSecretSize, Defaults::MaximumQrSecretSize,
                GetFieldName(), m_optQrSecretSize.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAllowableTimeout(std::chrono::milliseconds const& value)
{
    return value > std::chrono::milliseconds::zero() && value <= Configuration::Defaults::TimeoutLimit;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAllowableRetention(std::chrono::milliseconds const& value)
{
    return value >= std::chrono::milliseconds::zero() && value <= Configuration::Defaults::TimeoutLimit;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAllowableSecretSize(std::size_t const& value)
{
    return value >= Configuration::Defaults::MinimumQrSecretSize &&
        value <= Configuration::Defaults::MaximumQrSecretSize;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::NormalizeValue(boost::json::string const& value)
{
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string{ value.data(), value.size() }));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ValueType>
bool local::ContainsDuplicates(std::vector<ValueType> const& values)
{
    for (auto itr = values.begin(); itr != values.end(); ++itr) {
        if (std::find(std::next(itr), values.end(), *itr) != values.end()) { return true; }
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------
