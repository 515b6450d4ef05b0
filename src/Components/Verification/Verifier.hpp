//----------------------------------------------------------------------------------------------------------------------
// File: Verifier.hpp
// Description: The completion and cancellation contract shared by the SAS and the QR code verifiers. A verifier is 
// owned by its request and resolves its outcome exactly once. Every verifier operation runs under the request's lock.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "VerificationDefinitions.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Identifier/Identifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

class IIdentityStore;
class IRandomSource;

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class Channel;
class Verifier;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::Verifier : public std::enable_shared_from_this<Verifier>
{
public:
    // The collaborators provided by the owning request. 
    struct Context
    {
        std::shared_ptr<std::recursive_mutex> spMutex;
        std::shared_ptr<Channel> spChannel;
        std::shared_ptr<IIdentityStore> spIdentityStore;
        std::shared_ptr<IRandomSource> spRandomSource;
        Settings settings;
        Identifier::Device self;
        Identifier::Device other;
        std::function<OptionalError(Cancellation const&)> cancel; // Cancels the owning request and, through it, the verifier.
        std::function<void()> complete; // Informs the owning request of a successful verification.
    };

    virtual ~Verifier() = default;

    Verifier(Verifier const&) = delete;
    Verifier(Verifier&&) = delete;
    Verifier& operator=(Verifier const&) = delete;
    Verifier& operator=(Verifier&&) = delete;

    [[nodiscard]] Method GetMethod() const;
    [[nodiscard]] Identifier::Device const& GetOtherDevice() const;

    // Whether the local party sent the start message that created this handshake. 
    [[nodiscard]] bool IsStarter() const;
    [[nodiscard]] bool HasBeenCancelled() const;
    [[nodiscard]] bool IsFinished() const;

    // Returns the handle resolved with the outcome of the handshake. 
    [[nodiscard]] std::shared_future<Outcome> Verify() const;
    [[nodiscard]] std::optional<Outcome> GetOutcome() const;

    [[nodiscard]] Event::Publisher& GetPublisher();

    // Cancels the handshake and its request, the counterparty is notified. 
    OptionalError Cancel(CancelCode code = CancelCode::User, std::string_view reason = {});

    // Resolves the verifier with the request's cancellation. The counterparty has already been notified, if needed.
    void Terminate(Cancellation const& cancellation);

    // Whether the verifier holds secrets that would be lost if it were replaced. 
    [[nodiscard]] virtual bool HasKeyMaterial() const = 0;

protected:
    Verifier(Context&& context, Method method, bool isStarter);

    virtual void EraseSecrets() = 0;

    void Fail(Error error, CancelCode code, std::string_view reason = {});
    void Succeed();

    Context const m_context;
    std::shared_ptr<spdlog::logger> m_logger;

private:
    void Resolve(Outcome const& outcome);

    Method const m_method;
    bool const m_isStarter;
    bool m_hasBeenCancelled;
    std::promise<Outcome> m_promise;
    std::shared_future<Outcome> m_future;
    std::optional<Outcome> m_optOutcome;
    Event::Publisher m_publisher;
};

//----------------------------------------------------------------------------------------------------------------------
