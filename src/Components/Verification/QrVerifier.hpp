//----------------------------------------------------------------------------------------------------------------------
// File: QrVerifier.hpp
// Description: Drives the reciprocation of a scanned QR code. The scanning device proves it read the code by echoing
// the embedded secret in its start message, the showing device compares the secret and asks its user to confirm the 
// scan. Trust follows from the round trip of the secret, no string is compared by the users.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
#include "Presentation.hpp"
#include "QrCode.hpp"
#include "Verifier.hpp"
#include "Components/Security/SecureBuffer.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class QrVerifier;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::QrVerifier final : public Verifier
{
public:
    enum class Role : std::uint32_t { Show, Scan };
    enum class State : std::uint32_t { Created, AwaitingConfirmation, AwaitingDone, Finished };

    // The code is the one generated by the local device when showing, or the one read from the counterparty when 
    // scanning. The embedded keys must have been checked by the owner before a scanning verifier is created.
    QrVerifier(Context&& context, Role role, QrCode const& code);

    // Echoes the scanned secret to the showing device. Only valid when scanning. 
    [[nodiscard]] OptionalError Start();

    // Checks the echoed secret and asks the local user to confirm the scan. Only valid when showing. 
    [[nodiscard]] OptionalError Reciprocate(Payload::Start const& start);

    void Handle(Envelope const& envelope);

    // The local user's confirmation that the other device reports a successful scan. The showing device sends done 
    // and finishes immediately, the scanner's done is accepted if it arrives first but is never waited upon.
    OptionalError Confirm();

    [[nodiscard]] Role GetRole() const;
    [[nodiscard]] State GetState() const;
    [[nodiscard]] QrCode::Mode GetMode() const;
    [[nodiscard]] std::optional<ReciprocatePresentation> GetReciprocatePresentation() const;

    // Verifier {
    [[nodiscard]] virtual bool HasKeyMaterial() const override;
    // } Verifier

private:
    // Verifier {
    virtual void EraseSecrets() override;
    // } Verifier

    void OnDone();
    void PresentReciprocation();
    void CompleteIfReady();
    void RecordTrust();

    Role const m_role;
    QrCode::Mode const m_mode;
    State m_state;
    Security::SecureBuffer m_secret;
    bool m_hasSentDone;
    bool m_hasReceivedDone;
    std::optional<ReciprocatePresentation> m_optPresentation;
};

//----------------------------------------------------------------------------------------------------------------------
