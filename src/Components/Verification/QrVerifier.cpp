//----------------------------------------------------------------------------------------------------------------------
// File: QrVerifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "QrVerifier.hpp"
#include "Channel.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Interfaces/IdentityStore.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Verification::QrVerifier::QrVerifier(Context&& context, Role role, QrCode const& code)
    : Verifier(std::move(context), Method::Reciprocate, role == Role::Scan)
    , m_role(role)
    , m_mode(code.GetMode())
    , m_state(State::Created)
    , m_secret(code.GetSecret())
    , m_hasSentDone(false)
    , m_hasReceivedDone(false)
    , m_optPresentation()
{
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::QrVerifier::Start()
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_role != Role::Scan || m_state != State::Created) { return Error::InvalidState; }

    Payload::Start start{};
    start.fromDevice = m_context.self.deviceId;
    start.method = Method::Reciprocate;
    start.secret = Security::EncodeBase64(m_secret.GetData());

    // The scan has already been checked against the local keys, the start message is immediately followed by done. 
    m_state = State::AwaitingDone;
    bool const sent = m_context.spChannel->Send(MessageType::Start, start.Write()) &&
        m_context.spChannel->Send(MessageType::Done, {});
    m_hasSentDone = true;

    if (!sent) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::QrVerifier::Reciprocate(Payload::Start const& start)
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_role != Role::Show || m_state != State::Created) { return Error::InvalidState; }

    auto const optSecret = Security::DecodeBase64(start.secret);
    if (!optSecret) {
        Fail(Error::Protocol, CancelCode::InvalidMessage);
        return Error::Protocol;
    }

    if (!m_secret.IsEqual(*optSecret)) {
        Fail(Error::KeyMismatch, CancelCode::KeyMismatch);
        return Error::KeyMismatch;
    }

    m_state = State::AwaitingConfirmation;
    PresentReciprocation();
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::Handle(Envelope const& envelope)
{
    constexpr std::string_view DroppedMessage = "Dropping {} received after the handshake finished. [id={}]";

    std::scoped_lock lock{ *m_context.spMutex };
    if (m_state == State::Finished) {
        m_logger->debug(DroppedMessage, ToString(envelope.type), m_context.spChannel->GetTransactionId());
        return;
    }

    if (envelope.type != MessageType::Done) {
        Fail(Error::Protocol, CancelCode::UnexpectedMessage);
        return;
    }

    OnDone();
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::QrVerifier::Confirm()
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_role != Role::Show || m_state != State::AwaitingConfirmation) { return Error::InvalidState; }

    auto const spSelf = shared_from_this();
    m_state = State::AwaitingDone;
    if (!m_context.spChannel->Send(MessageType::Done, {})) {
        Fail(Error::Transport, CancelCode::User, "The device was unable to send the done message.");
        return Error::Transport;
    }

    m_hasSentDone = true;
    RecordTrust();
    Succeed();
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrVerifier::Role Verification::QrVerifier::GetRole() const
{
    return m_role;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrVerifier::State Verification::QrVerifier::GetState() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_state;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::QrCode::Mode Verification::QrVerifier::GetMode() const
{
    return m_mode;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::ReciprocatePresentation> Verification::QrVerifier::GetReciprocatePresentation() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optPresentation;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::QrVerifier::HasKeyMaterial() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return !m_secret.IsEmpty();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::EraseSecrets()
{
    m_secret.Erase();
    m_state = State::Finished;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::OnDone()
{
    // The scanning device sends done right after its start, it may arrive before the local user has confirmed. The
    // showing device only notes it, its own confirmation completes the exchange.
    if (m_hasReceivedDone || m_state == State::Created) {
        Fail(Error::Protocol, CancelCode::UnexpectedMessage);
        return;
    }

    m_hasReceivedDone = true;
    if (m_role == Role::Scan) { CompleteIfReady(); }
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::PresentReciprocation()
{
    std::weak_ptr<QrVerifier> const wpVerifier = std::static_pointer_cast<QrVerifier>(shared_from_this());
    m_optPresentation = ReciprocatePresentation{
        m_context.other.userId,
        m_context.other.deviceId,
        [wpVerifier] () { if (auto const spVerifier = wpVerifier.lock(); spVerifier) { spVerifier->Confirm(); } },
        [wpVerifier] () { if (auto const spVerifier = wpVerifier.lock(); spVerifier) { spVerifier->Cancel(); } }
    };

    GetPublisher().Publish<Event::Type::ShowReciprocate>(*m_optPresentation);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::CompleteIfReady()
{
    if (m_state != State::AwaitingDone || !m_hasSentDone || !m_hasReceivedDone) { return; }
    RecordTrust();
    Succeed();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::QrVerifier::RecordTrust()
{
    constexpr std::string_view FailureMessage = "Unable to record the verified {} key of {}. [id={}]";

    auto const& self = m_context.self;
    auto const& other = m_context.other;
    auto const& spIdentityStore = m_context.spIdentityStore;
    auto const& transactionId = m_context.spChannel->GetTransactionId();

    // The keys vouched for by the exchange depend on the mode and on which side of the code the device stands.
    bool markOtherDevice = false;
    bool markOwnMasterKey = false;
    bool markOtherMasterKey = false;
    switch (m_mode) {
        case QrCode::Mode::SelfTrusted: {
            markOtherDevice = true;
            markOwnMasterKey = m_role == Role::Scan;
        } break;
        case QrCode::Mode::SelfUntrusted: {
            markOtherDevice = true;
            markOwnMasterKey = m_role == Role::Show;
        } break;
        case QrCode::Mode::CrossUser: markOtherMasterKey = true; break;
    }

    if (markOtherDevice && !spIdentityStore->MarkDeviceVerified(other.userId, other.deviceId)) {
        m_logger->error(FailureMessage, "device", other.deviceId, transactionId);
    }

    if (markOwnMasterKey && !spIdentityStore->MarkMasterKeyVerified(self.userId)) {
        m_logger->error(FailureMessage, "master", self.userId, transactionId);
    }

    if (markOtherMasterKey && !spIdentityStore->MarkMasterKeyVerified(other.userId)) {
        m_logger->error(FailureMessage, "master", other.userId, transactionId);
    }
}

//----------------------------------------------------------------------------------------------------------------------
