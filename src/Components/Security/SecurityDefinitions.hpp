//----------------------------------------------------------------------------------------------------------------------
// File: SecurityDefinitions.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

// The side of a key exchange. The initiator is the party whose "start" message began the handshake. 
enum class ExchangeRole : std::uint32_t { Initiator, Acceptor };

enum class VerificationStatus : std::uint32_t { Failed, Success };

constexpr std::size_t Curve25519KeySize = 32;
constexpr std::size_t Ed25519KeySize = 32;
constexpr std::size_t Sha256DigestSize = 32;
constexpr std::size_t MessageAuthenticationKeySize = 32;

constexpr std::string_view DigestName = "sha256";

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
