//----------------------------------------------------------------------------------------------------------------------
// File: MessageAuthenticator.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "MessageAuthenticator.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Security::MessageAuthenticator::MessageAuthenticator()
    : m_upMacGenerator(EVP_MAC_fetch(nullptr, "hmac", nullptr))
{
    if (!m_upMacGenerator) {
        throw std::runtime_error("Failed to obtain the message authentication code generator!"); 
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::MessageAuthenticator::GenerateSignature(ReadableView key, ReadableView source) const
{
    // A signature without a key would not authenticate anything. 
    if (key.empty()) {
        return {};
    }

    OpenSSL::MessageAuthenticationContext const upContext{ EVP_MAC_CTX_new(m_upMacGenerator.get()) };
    if (!upContext) {
        return {};
    }

    // Note: The OpenSSL interface only supports taking non-const values, however, they are only read as the 
    // parameters are constructed. 
    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>("sha256"), 0),
        OSSL_PARAM_construct_end()
    };

    if (EVP_MAC_init(upContext.get(), key.data(), key.size(), params.data()) <= 0) {
        return {};
    }

    if (!source.empty() && EVP_MAC_update(upContext.get(), source.data(), source.size()) <= 0) {
        return {};
    }

    Buffer signature(Sha256DigestSize, 0x00);
    std::size_t hashed = 0;
    if (EVP_MAC_final(upContext.get(), signature.data(), &hashed, signature.size()) <= 0) {
        return {};
    }

    if (hashed != Sha256DigestSize) { return {}; }
    return signature;
}

//----------------------------------------------------------------------------------------------------------------------
