//----------------------------------------------------------------------------------------------------------------------
// File: RandomSource.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "RandomSource.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

bool Security::SystemRandomSource::Fill(WriteableView writeable)
{
    return GenerateRandomData(writeable);
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::GenerateRandomData(IRandomSource& source, std::size_t size)
{
    Buffer buffer(size, 0x00);
    if (!source.Fill(buffer)) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecureBuffer Security::GenerateSecureRandomData(IRandomSource& source, std::size_t size)
{
    SecureBuffer buffer{ size };
    if (!source.Fill(buffer.GetData())) { return {}; }
    return OptionalSecureBuffer{ std::move(buffer) };
}

//----------------------------------------------------------------------------------------------------------------------
