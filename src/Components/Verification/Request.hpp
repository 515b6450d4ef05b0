//----------------------------------------------------------------------------------------------------------------------
// File: Request.hpp
// Description: A single verification attempt between the local device and a counterparty. The request negotiates
// the method, owns at most one verifier, and records the terminal outcome. Every operation on the request and its
// verifier is serialized by a lock shared between them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
#include "QrCode.hpp"
#include "VerificationDefinitions.hpp"
#include "Verifier.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Identifier/Identifier.hpp"
#include "Components/Security/SecurityTypes.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

class IIdentityStore;
class IRandomSource;
class ITransport;

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class Channel;
class QrVerifier;
class Request;
class SasVerifier;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::Request : public std::enable_shared_from_this<Request>
{
public:
    struct Context
    {
        std::shared_ptr<ITransport> spTransport;
        std::shared_ptr<IIdentityStore> spIdentityStore;
        std::shared_ptr<IRandomSource> spRandomSource;
        Settings settings;
        TimeUtils::Clock clock;
    };

    using VerifierHandle = std::variant<std::monostate, std::shared_ptr<SasVerifier>, std::shared_ptr<QrVerifier>>;

    Request(
        Context const& context,
        std::string_view transactionId,
        std::string_view otherUserId,
        std::optional<std::string> const& optRoomId,
        bool initiatedByMe);

    ~Request();

    Request(Request const&) = delete;
    Request(Request&&) = delete;
    Request& operator=(Request const&) = delete;
    Request& operator=(Request&&) = delete;

    // Sends the request message to the candidate devices. Room requests are delivered to the room instead.
    [[nodiscard]] OptionalError Send(std::vector<std::string> const& deviceIds);

    // Records the counterparty's request message. Only valid for requests opened by the counterparty.
    [[nodiscard]] bool Receive(Payload::Request const& request);

    [[nodiscard]] std::string const& GetTransactionId() const;
    [[nodiscard]] std::optional<std::string> const& GetRoomId() const;
    [[nodiscard]] bool IsInitiatedByMe() const;
    [[nodiscard]] std::string const& GetOtherUserId() const;
    [[nodiscard]] std::optional<std::string> GetOtherDeviceId() const;
    [[nodiscard]] bool IsSelfVerification() const;

    [[nodiscard]] Phase GetPhase() const;
    [[nodiscard]] Methods const& GetMethods() const;
    [[nodiscard]] bool OtherPartySupportsMethod(Method method) const;
    [[nodiscard]] std::optional<Method> GetChosenMethod() const;
    [[nodiscard]] std::optional<Cancellation> GetCancellation() const;
    [[nodiscard]] std::optional<std::string> GetCancellingUserId() const;
    [[nodiscard]] std::optional<Outcome> GetOutcome() const;

    // Returns the time left before the request or its handshake expires, zero once the request is terminal.
    [[nodiscard]] std::chrono::milliseconds GetTimeRemaining() const;

    [[nodiscard]] VerifierHandle GetVerifier() const;
    [[nodiscard]] std::shared_ptr<SasVerifier> GetSasVerifier() const;
    [[nodiscard]] std::shared_ptr<QrVerifier> GetQrVerifier() const;

    // Resolved once the request reaches either terminal phase.
    [[nodiscard]] std::shared_future<Outcome> GetCompletion() const;

    [[nodiscard]] Event::Publisher& GetPublisher();

    // Answers the counterparty's request with the local methods. Repeated calls share the first call's result.
    [[nodiscard]] std::shared_future<OptionalError> Accept();

    // Cancels the request and any live verifier. The local state changes even if the counterparty is unreachable.
    OptionalError Cancel(CancelCode code = CancelCode::User, std::string_view reason = {});

    // Starts a handshake with the specified method, or the preferred mutually supported one.
    [[nodiscard]] OptionalError BeginVerification(std::optional<Method> const& optMethod = {});

    // Returns the payload to be rendered as a QR code for the counterparty to scan.
    [[nodiscard]] std::optional<Security::Buffer> GenerateQrCode();

    // Checks a QR code read from the counterparty's screen and starts the reciprocation.
    [[nodiscard]] OptionalError ScanQrCode(Security::ReadableView payload);

    void Handle(Envelope const& envelope);

    // Cancels the request when its current window has elapsed. Returns true if the request expired.
    bool CheckTimeout(TimeUtils::Timepoint const& now);

    // Whether the request has been terminal for longer than the retention period.
    [[nodiscard]] bool IsExpired(TimeUtils::Timepoint const& now) const;

    // Releases the request without notifying the counterparty.
    void Teardown();

private:
    [[nodiscard]] bool IsSupportedByBoth(Method method) const;
    [[nodiscard]] bool CanStartSas() const;
    [[nodiscard]] bool CanShowQrCode() const;
    [[nodiscard]] bool CanScanQrCode() const;
    [[nodiscard]] bool HasMutualMethod() const;
    [[nodiscard]] TimeUtils::Timepoint GetDeadline() const;

    void OnReady(Envelope const& envelope);
    void OnStart(Envelope const& envelope);
    void OnCancel(Envelope const& envelope);
    void Forward(Envelope const& envelope);

    [[nodiscard]] bool SelectOtherDevice(std::string_view deviceId);
    [[nodiscard]] bool ResolveStartConflict(Identifier::Device const& other);
    void StartFromCounterparty(Payload::Start const& start, boost::json::object const& content);

    [[nodiscard]] std::optional<QrCode> CreateQrCode() const;
    [[nodiscard]] bool CheckScannedKeys(QrCode const& code) const;

    [[nodiscard]] Verifier::Context CreateVerifierContext();
    void EnterStarted(Method method, VerifierHandle&& handle);

    OptionalError CancelWith(Cancellation const& cancellation, bool notify);
    void Terminate(Cancellation const& cancellation, std::string_view cancellingUserId);
    void OnVerified();

    void NotifyTransition(Phase previous);

    std::shared_ptr<std::recursive_mutex> m_spMutex;
    Context const m_context;
    Identifier::Device const m_self;

    std::string const m_transactionId;
    std::string const m_otherUserId;
    std::optional<std::string> const m_optRoomId;
    bool const m_initiatedByMe;
    std::shared_ptr<Channel> m_spChannel;

    Phase m_phase;
    Methods const m_methods;
    std::optional<Methods> m_optOtherMethods;
    std::optional<std::string> m_optOtherDeviceId;
    std::optional<Method> m_optChosenMethod;
    VerifierHandle m_verifier;
    std::optional<QrCode> m_optQrCode;

    std::optional<std::shared_future<OptionalError>> m_optAcceptance;
    std::optional<Cancellation> m_optCancellation;
    std::optional<std::string> m_optCancellingUserId;
    std::optional<Outcome> m_optOutcome;
    std::promise<Outcome> m_completion;
    std::shared_future<Outcome> m_future;

    TimeUtils::Timepoint const m_created;
    TimeUtils::Timepoint m_lastActivity;
    std::optional<TimeUtils::Timepoint> m_optTerminated;

    Event::Publisher m_publisher;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
