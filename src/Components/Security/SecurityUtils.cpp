//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#ifndef __STDC_WANT_LIB_EXT1__
#define __STDC_WANT_LIB_EXT1__ 1
#endif
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstring>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsBase64Character(char character);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Generate and return a buffer of the provided size filled with random data. 
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::GenerateRandomData(std::size_t size)
{
    if (!std::in_range<std::int32_t>(size)) { return {}; }
    auto buffer = Buffer(size, 0x00);
    if (RAND_bytes(buffer.data(), static_cast<std::int32_t>(size)) != 1) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::GenerateRandomData(WriteableView writeable)
{
    if (!std::in_range<std::int32_t>(writeable.size())) { return false; }
    return RAND_bytes(writeable.data(), static_cast<std::int32_t>(writeable.size())) == 1;
}

//----------------------------------------------------------------------------------------------------------------------

void Security::EraseMemory(void* begin, std::size_t size)
{
    if (begin == nullptr || size == 0) { return; }
#if defined(__STDC_LIB_EXT1__)
    memset_s(begin, size, 0, size);
#else
    OPENSSL_cleanse(begin, size);
#endif
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::ConstantTimeCompare(ReadableView left, ReadableView right)
{
    // The length of the values is not considered secret, only their contents. 
    if (left.size() != right.size()) { return false; }
    if (left.empty()) { return true; }
    return CRYPTO_memcmp(left.data(), right.data(), left.size()) == 0;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Encode the data as base64 without the trailing padding characters used by the protocol. 
//----------------------------------------------------------------------------------------------------------------------
std::string Security::EncodeBase64(ReadableView data)
{
    if (data.empty()) { return {}; }

    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    auto const written = EVP_EncodeBlock(
        reinterpret_cast<std::uint8_t*>(encoded.data()), data.data(), static_cast<std::int32_t>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));

    while (!encoded.empty() && encoded.back() == '=') { encoded.pop_back(); }
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Decode padded or unpadded base64. Returns an empty optional if the input is not valid base64. 
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::DecodeBase64(std::string_view encoded)
{
    while (!encoded.empty() && encoded.back() == '=') { encoded.remove_suffix(1); }
    if (encoded.empty()) { return Buffer{}; }
    if (encoded.size() % 4 == 1) { return {}; } // A single trailing character can never encode a full byte. 
    if (!std::ranges::all_of(encoded, local::IsBase64Character)) { return {}; }

    std::string padded{ encoded };
    std::size_t const padding = (4 - (padded.size() % 4)) % 4;
    padded.append(padding, '=');

    Buffer decoded((padded.size() / 4) * 3, 0x00);
    auto const written = EVP_DecodeBlock(
        decoded.data(), reinterpret_cast<std::uint8_t const*>(padded.data()), static_cast<std::int32_t>(padded.size()));
    if (written < 0 || static_cast<std::size_t>(written) < padding) { return {}; }

    // The OpenSSL block decoder counts the padding characters as zero valued output bytes. 
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::GenerateDigest(ReadableView data)
{
    Buffer digest(Sha256DigestSize, 0x00);
    std::uint32_t size = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &size, EVP_sha256(), nullptr) != 1) {
        return {};
    }

    if (size != Sha256DigestSize) { return {}; }
    return digest;
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::ToReadableView(std::string_view value)
{
    return ReadableView{ reinterpret_cast<std::uint8_t const*>(value.data()), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsBase64Character(char character)
{
    return (character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z') ||
           (character >= '0' && character <= '9') || character == '+' || character == '/';
}

//----------------------------------------------------------------------------------------------------------------------
