//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description: Typed configuration fields. Each field carries its snake case name, an optional validator, and a flag
// indicating whether the value was changed through the API rather than read from the configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires
{
    { T::GetFieldName() } -> std::same_as<std::string_view>;
};

template <std::size_t SourceSize>
constexpr std::size_t GetSnakeCaseSize(char const (&source)[SourceSize])
{
    std::size_t size = SourceSize > 0 ? 1 : 0;
    for (std::size_t idx = 1; idx < SourceSize; ++idx) {
        if (source[idx] >= 'A' && source[idx] <= 'Z' && source[idx - 1] >= 'a' && source[idx - 1] <= 'z') {
            ++size;
        }
        ++size;
    }
    return size;
}

template <std::size_t DestinationSize, std::size_t SourceSize>
constexpr auto ConvertToSnakeCase(char const (&source)[SourceSize])
{
    std::array<char, DestinationSize> converted{};

    std::size_t idx = 0;
    for (std::size_t jdx = 0; jdx < SourceSize - 1; ++jdx) {
        if (source[jdx] >= 'A' && source[jdx] <= 'Z') {
            if (jdx > 0 && source[jdx - 1] >= 'a' && source[jdx - 1] <= 'z') { converted[idx++] = '_'; }
            converted[idx++] = static_cast<char>(source[jdx] - 'A' + 'a');
        } else {
            converted[idx++] = source[jdx];
        }
    }

    converted[idx] = '\0';
    return converted;
}

// Declares a tag whose field name is the snake case form of the provided identifier (e.g. StepTimeout -> step_timeout).
#define DEFINE_FIELD_NAME(name) \
    struct name { \
        static constexpr auto FieldName = ConvertToSnakeCase<GetSnakeCaseSize(#name)>(#name); \
        static constexpr std::string_view GetFieldName() { return std::string_view{ FieldName.data() }; } \
    }

//----------------------------------------------------------------------------------------------------------------------

template<FieldNameTag ProvidedNameTag, typename ValueType>
class Field
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr bool AcceptAny(ValueType const&) { return true; }

    explicit Field(Validator const& validator = AcceptAny)
        : m_modified(false)
        , m_value()
        , m_validator(validator)
    {
    }

    explicit Field(ValueType const& value, Validator const& validator = AcceptAny)
        : m_modified(false)
        , m_value(value)
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(Field const& other) const noexcept { return m_value == other.m_value; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return ProvidedNameTag::GetFieldName(); }

    [[nodiscard]] ValueType const& GetValue() const { return m_value; }
    [[nodiscard]] bool WouldMatchDefault(ValueType const& defaultValue) const { return m_value == defaultValue; }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }
    void ClearModifiedFlag() { m_modified = false; }

    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (value == m_value) { return true; }
        if (!m_validator(value)) { return false; }
        m_value = value;
        m_modified = true;
        return true;
    }

    // Values read from the configuration file do not mark the field as modified.
    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (!m_validator(value)) { return false; }
        m_value = value;
        return true;
    }

protected:
    bool m_modified;
    ValueType m_value;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

template<FieldNameTag ProvidedNameTag, typename ValueType>
class OptionalField
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr bool AcceptAny(ValueType const&) { return true; }

    explicit OptionalField(Validator const& validator = AcceptAny)
        : m_modified(false)
        , m_optValue()
        , m_validator(validator)
    {
    }

    explicit OptionalField(ValueType const& value, Validator const& validator = AcceptAny)
        : m_modified(false)
        , m_optValue(value)
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(OptionalField const& other) const noexcept { return m_optValue == other.m_optValue; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return ProvidedNameTag::GetFieldName(); }

    [[nodiscard]] bool HasValue() const { return m_optValue.has_value(); }
    [[nodiscard]] std::optional<ValueType> const& GetOptionalValue() const { return m_optValue; }

    [[nodiscard]] ValueType const& GetValueOrElse(ValueType const& defaultValue) const
    {
        return m_optValue.has_value() ? *m_optValue : defaultValue;
    }

    // An unset field is written as the default, so it always matches.
    [[nodiscard]] bool WouldMatchDefault(ValueType const& defaultValue) const
    {
        return !m_optValue.has_value() || *m_optValue == defaultValue;
    }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }
    void ClearModifiedFlag() { m_modified = false; }

    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (m_optValue == value) { return true; }
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        m_modified = true;
        return true;
    }

    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        return true;
    }

    void ResetValue()
    {
        if (!m_optValue.has_value()) { return; }
        m_optValue.reset();
        m_modified = true;
    }

protected:
    bool m_modified;
    std::optional<ValueType> m_optValue;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

// An optional field whose configuration form is a string (e.g. "2min" for a duration).
template<FieldNameTag ProvidedNameTag, typename ConstructedType>
class OptionalConstructedField : public OptionalField<ProvidedNameTag, ConstructedType>
{
public:
    using Base = OptionalField<ProvidedNameTag, ConstructedType>;
    using ConverterTo = std::function<std::optional<ConstructedType>(std::string_view value)>;
    using ConverterFrom = std::function<std::optional<std::string>(ConstructedType const& value)>;
    using Validator = typename Base::Validator;

    using Base::AcceptAny;
    using Base::SetValue;
    using Base::SetValueFromConfig;

    OptionalConstructedField(
        ConverterTo const& converterTo,
        ConverterFrom const& converterFrom,
        Validator const& validator = AcceptAny)
        : Base(validator)
        , m_convertTo(converterTo)
        , m_convertFrom(converterFrom)
    {
    }

    [[nodiscard]] std::optional<std::string> GetSerializedValue() const
    {
        if (!this->m_optValue) { return {}; }
        return m_convertFrom(*this->m_optValue);
    }

    [[nodiscard]] bool SetValueFromConfig(std::string_view serialized)
    {
        auto const optValue = m_convertTo(serialized);
        if (!optValue) { return false; }
        return Base::SetValueFromConfig(*optValue);
    }

private:
    ConverterTo m_convertTo;
    ConverterFrom m_convertFrom;
};

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
