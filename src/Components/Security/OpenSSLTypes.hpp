//----------------------------------------------------------------------------------------------------------------------
// File: OpenSSLTypes.hpp
// Description: Owning handles for the OpenSSL objects used by the security components. The OpenSSL headers are not
// required by the users of these handles. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

typedef struct evp_pkey_ctx_st EVP_PKEY_CTX;
typedef struct evp_pkey_st EVP_PKEY;
typedef struct evp_kdf_st EVP_KDF;
typedef struct evp_kdf_ctx_st EVP_KDF_CTX;
typedef struct evp_mac_st EVP_MAC;
typedef struct evp_mac_ctx_st EVP_MAC_CTX;

extern "C" void EVP_PKEY_CTX_free(EVP_PKEY_CTX* context);
extern "C" void EVP_PKEY_free(EVP_PKEY* key);
extern "C" void EVP_KDF_free(EVP_KDF* kdf);
extern "C" void EVP_KDF_CTX_free(EVP_KDF_CTX* context);
extern "C" void EVP_MAC_free(EVP_MAC* mac);
extern "C" void EVP_MAC_CTX_free(EVP_MAC_CTX* context);

//----------------------------------------------------------------------------------------------------------------------
namespace Security::OpenSSL {
//----------------------------------------------------------------------------------------------------------------------

struct KeyPairContextDeleter
{
    void operator()(EVP_PKEY_CTX* pContext) const { EVP_PKEY_CTX_free(pContext); }
};

using KeyPairContext = std::unique_ptr<EVP_PKEY_CTX, KeyPairContextDeleter>;

struct KeyPairDeleter
{
    void operator()(EVP_PKEY* pKey) const { EVP_PKEY_free(pKey); }
};

using KeyPair = std::unique_ptr<EVP_PKEY, KeyPairDeleter>;

struct KeyDerivationFunctionDeleter
{
    void operator()(EVP_KDF* pFunction) const { EVP_KDF_free(pFunction); }
};

using KeyDerivationFunction = std::unique_ptr<EVP_KDF, KeyDerivationFunctionDeleter>;

struct KeyDerivationContextDeleter
{
    void operator()(EVP_KDF_CTX* pContext) const { EVP_KDF_CTX_free(pContext); }
};

using KeyDerivationContext = std::unique_ptr<EVP_KDF_CTX, KeyDerivationContextDeleter>;

struct MessageAuthenticatorDeleter
{
    void operator()(EVP_MAC* pMac) const { EVP_MAC_free(pMac); }
};

using MessageAuthenticator = std::unique_ptr<EVP_MAC, MessageAuthenticatorDeleter>;

struct MessageAuthenticationContextDeleter
{
    void operator()(EVP_MAC_CTX* pContext) const { EVP_MAC_CTX_free(pContext); }
};

using MessageAuthenticationContext = std::unique_ptr<EVP_MAC_CTX, MessageAuthenticationContextDeleter>;

//----------------------------------------------------------------------------------------------------------------------
} // Security::OpenSSL namespace
//----------------------------------------------------------------------------------------------------------------------
