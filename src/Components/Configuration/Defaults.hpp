//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

constexpr std::string_view Version = "1.0.0";

constexpr auto RequestTimeout = std::chrono::milliseconds{ std::chrono::minutes{ 10 } };
constexpr auto StepTimeout = std::chrono::milliseconds{ std::chrono::minutes{ 2 } };
constexpr auto RetentionPeriod = std::chrono::milliseconds{ std::chrono::minutes{ 1 } };
constexpr auto FutureTolerance = std::chrono::milliseconds{ std::chrono::minutes{ 5 } };

// The longest window the service accepts for any of the timeouts.
constexpr auto TimeoutLimit = std::chrono::milliseconds{ std::chrono::hours{ 24 } };

constexpr std::size_t QrSecretSize = 16;
constexpr std::size_t MinimumQrSecretSize = 8;
constexpr std::size_t MaximumQrSecretSize = 64;

inline ::Verification::Methods const Methods = {
    ::Verification::Method::Sas,
    ::Verification::Method::QrCodeShow,
    ::Verification::Method::QrCodeScan,
    ::Verification::Method::Reciprocate
};

inline ::Verification::SasEncodings const SasEncodings = {
    ::Verification::SasEncoding::Decimal,
    ::Verification::SasEncoding::Emoji
};

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
