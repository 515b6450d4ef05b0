//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Identifier.hpp"
#include "Interfaces/RandomSource.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// The largest multiple of the alphabet size that fits in a byte. Bytes above it are discarded to avoid modulo bias. 
constexpr std::uint32_t SamplingLimit = (256 / Alphabet.size()) * Alphabet.size();

constexpr std::uint32_t MaximumFillAttempts = 16;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Identifier::CreateDeviceKeyIdentifier(std::string_view deviceId)
{
    std::string identifier{ KeyAlgorithm };
    identifier.append(KeyAlgorithmSeparator).append(deviceId);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Identifier::CreateMasterKeyIdentifier(std::string_view encodedKey)
{
    std::string identifier{ KeyAlgorithm };
    identifier.append(KeyAlgorithmSeparator).append(encodedKey);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::pair<std::string_view, std::string_view>> Identifier::ParseKeyIdentifier(std::string_view keyId)
{
    auto const position = keyId.find(KeyAlgorithmSeparator);
    if (position == std::string_view::npos || position == 0 || position + 1 >= keyId.size()) { return {}; }
    return std::make_pair(keyId.substr(0, position), keyId.substr(position + 1));
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Identifier::GenerateTransactionIdentifier(IRandomSource& source)
{
    std::string identifier;
    identifier.reserve(TransactionIdentifierSize);

    std::array<std::uint8_t, TransactionIdentifierSize> block = {};
    for (std::uint32_t attempt = 0; identifier.size() < TransactionIdentifierSize; ++attempt) {
        if (attempt == local::MaximumFillAttempts || !source.Fill(block)) { return {}; }
        for (auto const value : block) {
            if (value >= local::SamplingLimit) { continue; }
            identifier.push_back(local::Alphabet[value % local::Alphabet.size()]);
            if (identifier.size() == TransactionIdentifierSize) { break; }
        }
    }

    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------
