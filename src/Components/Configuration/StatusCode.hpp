//----------------------------------------------------------------------------------------------------------------------
// File: StatusCode.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t { Success, DecodeError, InputError, FileError };

using DeserializationResult = std::pair<StatusCode, std::string>;
using SerializationResult = std::pair<StatusCode, std::string>;
using ValidationResult = std::pair<StatusCode, std::string>;

[[nodiscard]] constexpr std::string_view ToString(StatusCode code)
{
    switch (code) {
        case StatusCode::Success: return "success";
        case StatusCode::DecodeError: return "decode error";
        case StatusCode::InputError: return "input error";
        case StatusCode::FileError: return "file error";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
