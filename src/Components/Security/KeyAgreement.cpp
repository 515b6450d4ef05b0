//----------------------------------------------------------------------------------------------------------------------
// File: KeyAgreement.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "KeyAgreement.hpp"
#include "RandomSource.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Security::Curve25519KeyAgreement::Curve25519KeyAgreement()
    : m_upKeyPair()
    , m_publicKey()
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::Curve25519KeyAgreement::~Curve25519KeyAgreement()
{
    Erase();
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::Curve25519KeyAgreement::SetupKeyExchange(IRandomSource& source)
{
    if (m_upKeyPair) {
        return {}; // Key material must never be regenerated for an existing exchange. 
    }

    // The private scalar is drawn from the injected source. OpenSSL clamps the scalar when it is used. 
    auto const optPrivateKey = GenerateSecureRandomData(source, Curve25519KeySize);
    if (!optPrivateKey) {
        return {}; // If we fail to obtain random data, an error has occurred. 
    }

    auto const privateKey = optPrivateKey->GetData();
    m_upKeyPair = OpenSSL::KeyPair{ 
        EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, privateKey.data(), privateKey.size()) };
    if (!m_upKeyPair) {
        return {}; // If we fail to load the private key, an error has occurred. 
    }

    Buffer publicKey(Curve25519KeySize, 0x00);
    std::size_t size = publicKey.size();
    if (EVP_PKEY_get_raw_public_key(m_upKeyPair.get(), publicKey.data(), &size) <= 0 || size != Curve25519KeySize) {
        Erase();
        return {}; // If we fail to extract the public key, an error has occurred. 
    }

    m_publicKey = publicKey;
    return publicKey;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecureBuffer Security::Curve25519KeyAgreement::ComputeSharedSecret(ReadableView peerPublicKey) const
{
    if (!m_upKeyPair) {
        return {}; // If the key pair has not been setup, an error has occurred. 
    }

    if (peerPublicKey.size() != Curve25519KeySize) {
        return {}; // The peer's key must be a raw curve point. 
    }

    auto const upPeerKey = OpenSSL::KeyPair{ 
        EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peerPublicKey.data(), peerPublicKey.size()) };
    if (!upPeerKey) {
        return {}; // If we fail to parse the peer's public key, an error has occurred. 
    }

    auto const upDeriveContext = OpenSSL::KeyPairContext{ EVP_PKEY_CTX_new_from_pkey(nullptr, m_upKeyPair.get(), nullptr) };
    if (!upDeriveContext) {
        return {}; // If we fail to make a context, an error has occurred. 
    }

    if (EVP_PKEY_derive_init(upDeriveContext.get()) <= 0) {
        return {};
    }

    if (EVP_PKEY_derive_set_peer(upDeriveContext.get(), upPeerKey.get()) <= 0) {
        return {};
    }

    std::size_t size = 0;
    if (EVP_PKEY_derive(upDeriveContext.get(), nullptr, &size) <= 0) {
        return {};
    }

    // OpenSSL fails the derivation for peer points of small order, the secret would otherwise be all zeros. 
    SecureBuffer secret{ size };
    if (EVP_PKEY_derive(upDeriveContext.get(), secret.GetData().data(), &size) <= 0 || size != Curve25519KeySize) {
        return {};
    }

    return OptionalSecureBuffer{ std::move(secret) };
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::Curve25519KeyAgreement::HasKeyPair() const
{
    return m_upKeyPair != nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer const& Security::Curve25519KeyAgreement::GetPublicKey() const
{
    return m_publicKey;
}

//----------------------------------------------------------------------------------------------------------------------

void Security::Curve25519KeyAgreement::Erase()
{
    m_upKeyPair.reset(); // OpenSSL cleanses the private scalar when the key is released. 
    m_publicKey.clear();
}

//----------------------------------------------------------------------------------------------------------------------
