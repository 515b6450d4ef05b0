//----------------------------------------------------------------------------------------------------------------------
// File: RandomSource.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityTypes.hpp"
#include "Interfaces/RandomSource.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SystemRandomSource;

[[nodiscard]] OptionalBuffer GenerateRandomData(IRandomSource& source, std::size_t size);
[[nodiscard]] OptionalSecureBuffer GenerateSecureRandomData(IRandomSource& source, std::size_t size);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

// The default source, backed by the OpenSSL CSPRNG. 
class Security::SystemRandomSource final : public IRandomSource
{
public:
    // IRandomSource {
    [[nodiscard]] virtual bool Fill(WriteableView writeable) override;
    // } IRandomSource
};

//----------------------------------------------------------------------------------------------------------------------
