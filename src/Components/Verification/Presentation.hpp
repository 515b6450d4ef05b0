//----------------------------------------------------------------------------------------------------------------------
// File: Presentation.hpp
// Description: The data handed to the user interface when a verifier needs a human decision. The callbacks remain 
// safe to invoke after the verifier has finished, they become no-ops.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ShortAuthenticationString.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

struct SasPresentation;
struct ReciprocatePresentation;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

struct Verification::SasPresentation
{
    Decimals decimals;
    std::optional<Emojis> emojis; // Only present when both parties agreed on the emoji encoding. 
    std::function<void()> confirm;
    std::function<void()> mismatch;
    std::function<void()> cancel;
};

//----------------------------------------------------------------------------------------------------------------------

// Raised on the device that showed the QR code once the scanner has echoed the embedded secret. The user confirms 
// that the other device reports a successful scan.
struct Verification::ReciprocatePresentation
{
    std::string otherUserId;
    std::string otherDeviceId;
    std::function<void()> confirm;
    std::function<void()> cancel;
};

//----------------------------------------------------------------------------------------------------------------------
