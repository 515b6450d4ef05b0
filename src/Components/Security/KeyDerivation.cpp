//----------------------------------------------------------------------------------------------------------------------
// File: KeyDerivation.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "KeyDerivation.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <stdexcept>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t MaximumDerivationSize = 255 * 32; // The HKDF-SHA256 expansion limit. 

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::KeyDeriver::KeyDeriver()
    : m_upKeyDerivationFunction(EVP_KDF_fetch(nullptr, "hkdf", nullptr))
{
    if (!m_upKeyDerivationFunction) {
        throw std::runtime_error("Failed to obtain the key derivation function!"); 
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecureBuffer Security::KeyDeriver::Derive(
    ReadableView secret, std::string_view info, std::size_t size) const
{
    return Derive(secret, ReadableView{}, info, size);
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecureBuffer Security::KeyDeriver::Derive(
    ReadableView secret, ReadableView salt, std::string_view info, std::size_t size) const
{
    if (secret.empty() || size == 0 || size > local::MaximumDerivationSize) {
        return {};
    }

    // Setup the context required for the OpenSSL KDF using the fetched function name.
    OpenSSL::KeyDerivationContext const upContext{ EVP_KDF_CTX_new(m_upKeyDerivationFunction.get()) };
    if (!upContext) {
        return {};
    }

    // Note: The OpenSSL interface only supports taking non-const values, however, they are only read as the 
    // parameters are constructed. An absent salt is treated by HKDF as a string of zeros the length of the digest. 
    std::size_t populated = 0;
    std::array<OSSL_PARAM, 5> params = {};
    params[populated++] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char*>("sha256"), 0);
    params[populated++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<std::uint8_t*>(secret.data()), secret.size());
    params[populated++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_INFO, const_cast<char*>(info.data()), info.size());
    if (!salt.empty()) {
        params[populated++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<std::uint8_t*>(salt.data()), salt.size());
    }
    params[populated] = OSSL_PARAM_construct_end();

    // Set the parameters on the context such that they will be used when the key is derived.
    if (EVP_KDF_CTX_set_params(upContext.get(), params.data()) <= 0) {
        return {};
    }

    SecureBuffer derived{ size };
    auto const writable = derived.GetData();
    if (EVP_KDF_derive(upContext.get(), writable.data(), writable.size(), nullptr) <= 0) {
        return {};
    }

    return OptionalSecureBuffer{ std::move(derived) };
}

//----------------------------------------------------------------------------------------------------------------------
