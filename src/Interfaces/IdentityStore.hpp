//----------------------------------------------------------------------------------------------------------------------
// File: IdentityStore.hpp
// Description: Defines the interface to the long-term device and cross-signing key store. Keys are exchanged as 
// unpadded base64 encodings of the 32 byte ed25519 public keys.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Identifier/Identifier.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IIdentityStore
{
public:
    virtual ~IIdentityStore() = default;

    [[nodiscard]] virtual Identifier::Device const& GetOwnDevice() const = 0;
    [[nodiscard]] virtual std::vector<std::string> GetDeviceIds(std::string_view userId) const = 0;

    [[nodiscard]] virtual std::optional<Security::EncodedKey> GetDeviceKey(
        std::string_view userId, std::string_view deviceId) const = 0;
    [[nodiscard]] virtual std::optional<Security::EncodedKey> GetMasterKey(std::string_view userId) const = 0;

    // Whether the local device has verified its own user's master cross-signing key. 
    [[nodiscard]] virtual bool IsOwnMasterKeyTrusted() const = 0;

    [[nodiscard]] virtual bool MarkDeviceVerified(std::string_view userId, std::string_view deviceId) = 0;
    [[nodiscard]] virtual bool MarkMasterKeyVerified(std::string_view userId) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
