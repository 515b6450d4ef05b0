//----------------------------------------------------------------------------------------------------------------------
// File: KeyDerivation.hpp
// Description: HKDF-SHA256 with an empty salt, used to derive the short authentication string bytes and the MAC keys
// from the key agreement's shared secret.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLTypes.hpp"
#include "SecureBuffer.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class KeyDeriver;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::KeyDeriver
{
public:
    KeyDeriver();

    KeyDeriver(KeyDeriver const&) = delete;
    KeyDeriver& operator=(KeyDeriver const&) = delete;

    [[nodiscard]] OptionalSecureBuffer Derive(ReadableView secret, std::string_view info, std::size_t size) const;
    [[nodiscard]] OptionalSecureBuffer Derive(
        ReadableView secret, ReadableView salt, std::string_view info, std::size_t size) const;

private:
    OpenSSL::KeyDerivationFunction m_upKeyDerivationFunction;
};

//----------------------------------------------------------------------------------------------------------------------
