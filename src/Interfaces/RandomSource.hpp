//----------------------------------------------------------------------------------------------------------------------
// File: RandomSource.hpp
// Description: The capability used to obtain random bytes for ephemeral keys, transaction identifiers, and QR code 
// secrets. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------

class IRandomSource
{
public:
    virtual ~IRandomSource() = default;

    // Fill the entire view with random bytes. Returns false if the source could not provide enough data. 
    [[nodiscard]] virtual bool Fill(Security::WriteableView writeable) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
