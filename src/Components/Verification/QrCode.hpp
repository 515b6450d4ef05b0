//----------------------------------------------------------------------------------------------------------------------
// File: QrCode.hpp
// Description: The binary payload embedded in a verification QR code. 
//  [0:6] "MATRIX" | [6] version | [7] mode | [8:10] transaction id size (big endian) | transaction id | 
//  first key (32 bytes) | second key (32 bytes) | shared secret (the remainder)
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class QrCode;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::QrCode
{
public:
    // The meaning of the embedded keys depends on the mode, viewed from the device showing the code.
    enum class Mode : std::uint8_t
    {
        SelfTrusted = 0x00, // Same user, the shower trusts the master key: master key, then the other device's key. 
        SelfUntrusted = 0x01, // Same user, master key not yet trusted: the shower's device key, then the master key.
        CrossUser = 0x02 // Different users: the shower's master key, then the other user's master key.
    };

    using PublicKey = std::array<std::uint8_t, Security::Ed25519KeySize>;

    static constexpr std::string_view Magic = "MATRIX";
    static constexpr std::uint8_t Version = 0x02;
    static constexpr std::size_t MinimumSecretSize = 8;
    static constexpr std::size_t HeaderSize = Magic.size() + sizeof(Version) + sizeof(Mode) + sizeof(std::uint16_t);

    QrCode(Mode mode, std::string_view transactionId, PublicKey const& firstKey, PublicKey const& secondKey, 
        Security::ReadableView secret);

    // The embedded secret is scrubbed when the code is erased or destroyed, codes can only be moved. 
    QrCode(QrCode&& other) noexcept = default;
    QrCode& operator=(QrCode&& other) noexcept = default;

    [[nodiscard]] bool operator==(QrCode const& other) const;

    // Returns nothing when the payload is structurally invalid.
    [[nodiscard]] static std::optional<QrCode> Decode(Security::ReadableView payload);

    // Returns nothing when the transaction id or the secret cannot be represented.
    [[nodiscard]] std::optional<Security::Buffer> Encode() const;

    [[nodiscard]] Mode GetMode() const;
    [[nodiscard]] std::string const& GetTransactionId() const;
    [[nodiscard]] PublicKey const& GetFirstKey() const;
    [[nodiscard]] PublicKey const& GetSecondKey() const;
    [[nodiscard]] Security::ReadableView GetSecret() const;

    void Erase();

private:
    Mode m_mode;
    std::string m_transactionId;
    PublicKey m_firstKey;
    PublicKey m_secondKey;
    Security::SecureBuffer m_secret;
};

//----------------------------------------------------------------------------------------------------------------------
