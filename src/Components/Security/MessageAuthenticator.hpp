//----------------------------------------------------------------------------------------------------------------------
// File: MessageAuthenticator.hpp
// Description: HMAC-SHA256 over arbitrary data, keyed by a secret derived for a single handshake instance.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLTypes.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class MessageAuthenticator;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::MessageAuthenticator
{
public:
    MessageAuthenticator();

    MessageAuthenticator(MessageAuthenticator const&) = delete;
    MessageAuthenticator& operator=(MessageAuthenticator const&) = delete;

    [[nodiscard]] OptionalBuffer GenerateSignature(ReadableView key, ReadableView source) const;

private:
    OpenSSL::MessageAuthenticator m_upMacGenerator;
};

//----------------------------------------------------------------------------------------------------------------------
