//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.hpp
// Description: Identifiers for the parties of a verification and the keys they vouch for.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

class IRandomSource;

//----------------------------------------------------------------------------------------------------------------------
namespace Identifier {
//----------------------------------------------------------------------------------------------------------------------

struct Device;

constexpr std::string_view KeyAlgorithm = "ed25519";
constexpr std::string_view KeyAlgorithmSeparator = ":";
constexpr std::size_t TransactionIdentifierSize = 32;

// Returns "ed25519:<device id>", the identifier of a device's signing key.
[[nodiscard]] std::string CreateDeviceKeyIdentifier(std::string_view deviceId);

// Returns "ed25519:<unpadded base64 key>", the identifier of a master cross-signing key.
[[nodiscard]] std::string CreateMasterKeyIdentifier(std::string_view encodedKey);

// Splits a key identifier into its algorithm and the key name. 
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>> ParseKeyIdentifier(std::string_view keyId);

[[nodiscard]] std::optional<std::string> GenerateTransactionIdentifier(IRandomSource& source);

//----------------------------------------------------------------------------------------------------------------------
} // Identifier namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: A (user, device) pair. Ordering is lexicographic on the user and then the device, it is used to pick 
// a single winner when both parties start a handshake at the same time. 
//----------------------------------------------------------------------------------------------------------------------
struct Identifier::Device
{
    std::string userId;
    std::string deviceId;

    [[nodiscard]] bool operator==(Device const& other) const = default;
    [[nodiscard]] std::strong_ordering operator<=>(Device const& other) const = default;
};

//----------------------------------------------------------------------------------------------------------------------
