//----------------------------------------------------------------------------------------------------------------------
// File: Verifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Verifier.hpp"
#include "Channel.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Verification::Verifier::Verifier(Context&& context, Method method, bool isStarter)
    : m_context(std::move(context))
    , m_logger(Logger::Get())
    , m_method(method)
    , m_isStarter(isStarter)
    , m_hasBeenCancelled(false)
    , m_promise()
    , m_future(m_promise.get_future().share())
    , m_optOutcome()
    , m_publisher()
{
    assert(m_context.spMutex && m_context.spChannel && m_context.spIdentityStore && m_context.spRandomSource);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Method Verification::Verifier::GetMethod() const
{
    return m_method;
}

//----------------------------------------------------------------------------------------------------------------------

Identifier::Device const& Verification::Verifier::GetOtherDevice() const
{
    return m_context.other;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Verifier::IsStarter() const
{
    return m_isStarter;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Verifier::HasBeenCancelled() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_hasBeenCancelled;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Verifier::IsFinished() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optOutcome.has_value();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_future<Verification::Outcome> Verification::Verifier::Verify() const
{
    return m_future;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Outcome> Verification::Verifier::GetOutcome() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optOutcome;
}

//----------------------------------------------------------------------------------------------------------------------

Event::Publisher& Verification::Verifier::GetPublisher()
{
    return m_publisher;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Verifier::Cancel(CancelCode code, std::string_view reason)
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_optOutcome) { return Error::InvalidState; }

    auto const spSelf = shared_from_this(); // The request releases the verifier when it is cancelled. 
    return m_context.cancel(CreateCancellation(code, reason));
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Verifier::Terminate(Cancellation const& cancellation)
{
    constexpr std::string_view CancelledMessage = "The {} verifier has been cancelled with {}. [id={}]";

    std::scoped_lock lock{ *m_context.spMutex };
    if (m_optOutcome) { return; }

    m_hasBeenCancelled = true;
    EraseSecrets();
    m_logger->debug(
        CancelledMessage, ToString(m_method), cancellation.code, m_context.spChannel->GetTransactionId());

    Resolve(cancellation);
    m_publisher.Publish<Event::Type::VerifierCancelled>(cancellation);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Verifier::Fail(Error error, CancelCode code, std::string_view reason)
{
    constexpr std::string_view FailureMessage = "The {} handshake failed with {}. [id={}]";
    constexpr std::string_view UnsentMessage = "The cancellation was not delivered ({}). [id={}]";

    std::scoped_lock lock{ *m_context.spMutex };
    if (m_optOutcome) { return; }

    auto const spSelf = shared_from_this();
    if (error == Error::KeyMismatch) {
        m_logger->error(FailureMessage, ToString(m_method), ToString(code), m_context.spChannel->GetTransactionId());
    } else {
        m_logger->warn(FailureMessage, ToString(m_method), ToString(code), m_context.spChannel->GetTransactionId());
    }

    // The counterparty may not be reachable, the request is cancelled locally regardless.
    auto const cancellation = CreateCancellation(error, code, reason);
    if (auto const optError = m_context.cancel(cancellation); optError) {
        m_logger->debug(UnsentMessage, ToString(*optError), m_context.spChannel->GetTransactionId());
    }

    // The owning request has already been released, the verifier can only resolve itself. 
    if (!m_optOutcome) { Terminate(cancellation); }
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Verifier::Succeed()
{
    constexpr std::string_view VerifiedMessage = "Verified the keys of {} ({}). [id={}]";

    std::scoped_lock lock{ *m_context.spMutex };
    if (m_optOutcome) { return; }

    auto const spSelf = shared_from_this();
    EraseSecrets();
    m_logger->info(
        VerifiedMessage, m_context.other.userId, m_context.other.deviceId, m_context.spChannel->GetTransactionId());

    Resolve(Verified{});
    m_context.complete();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Verifier::Resolve(Outcome const& outcome)
{
    assert(!m_optOutcome);
    m_optOutcome = outcome;
    m_promise.set_value(outcome);
}

//----------------------------------------------------------------------------------------------------------------------
