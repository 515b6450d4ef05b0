//----------------------------------------------------------------------------------------------------------------------
// File: KeyAgreement.hpp
// Description: The ephemeral X25519 key agreement used by the short authentication string handshake. Each instance 
// owns exactly one key pair, generated from the injected random source, and is never reused across handshakes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLTypes.hpp"
#include "SecureBuffer.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IRandomSource;

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class Curve25519KeyAgreement;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::Curve25519KeyAgreement
{
public:
    static constexpr std::string_view Name = "curve25519-hkdf-sha256";

    Curve25519KeyAgreement();
    ~Curve25519KeyAgreement();

    Curve25519KeyAgreement(Curve25519KeyAgreement const&) = delete;
    Curve25519KeyAgreement(Curve25519KeyAgreement&&) = delete;
    Curve25519KeyAgreement& operator=(Curve25519KeyAgreement const&) = delete;
    Curve25519KeyAgreement& operator=(Curve25519KeyAgreement&&) = delete;

    [[nodiscard]] OptionalBuffer SetupKeyExchange(IRandomSource& source);
    [[nodiscard]] OptionalSecureBuffer ComputeSharedSecret(ReadableView peerPublicKey) const;

    [[nodiscard]] bool HasKeyPair() const;
    [[nodiscard]] Buffer const& GetPublicKey() const;

    void Erase();

private:
    OpenSSL::KeyPair m_upKeyPair;
    Buffer m_publicKey;
};

//----------------------------------------------------------------------------------------------------------------------
