//----------------------------------------------------------------------------------------------------------------------
// File: Request.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Request.hpp"
#include "Channel.hpp"
#include "QrVerifier.hpp"
#include "SasVerifier.hpp"
#include "Components/Security/RandomSource.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Interfaces/IdentityStore.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ReleasedReason = "The verification request was released.";
constexpr std::string_view TeardownReason = "The verification session was closed.";
constexpr std::string_view SupersededReason = "The counterparty's start took precedence.";

[[nodiscard]] bool Contains(Verification::Methods const& methods, Verification::Method method);
[[nodiscard]] std::shared_ptr<Verification::Verifier> GetVerifier(Verification::Request::VerifierHandle const& handle);
[[nodiscard]] std::optional<Verification::Method> ReadMethod(boost::json::object const& content);
[[nodiscard]] std::optional<Verification::QrCode::PublicKey> DecodePublicKey(
    std::optional<Security::EncodedKey> const& optKey);
[[nodiscard]] bool IsMatchingKey(
    std::optional<Security::EncodedKey> const& optKey, Verification::QrCode::PublicKey const& expected);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Verification::Request::Request(
    Context const& context,
    std::string_view transactionId,
    std::string_view otherUserId,
    std::optional<std::string> const& optRoomId,
    bool initiatedByMe)
    : m_spMutex(std::make_shared<std::recursive_mutex>())
    , m_context(context)
    , m_self(context.spIdentityStore->GetOwnDevice())
    , m_transactionId(transactionId)
    , m_otherUserId(otherUserId)
    , m_optRoomId(optRoomId)
    , m_initiatedByMe(initiatedByMe)
    , m_spChannel(std::make_shared<Channel>(context.spTransport, transactionId, otherUserId, optRoomId))
    , m_phase(Phase::Requested)
    , m_methods(context.settings.methods)
    , m_optOtherMethods()
    , m_optOtherDeviceId()
    , m_optChosenMethod()
    , m_verifier()
    , m_optQrCode()
    , m_optAcceptance()
    , m_optCancellation()
    , m_optCancellingUserId()
    , m_optOutcome()
    , m_completion()
    , m_future(m_completion.get_future().share())
    , m_created(context.clock())
    , m_lastActivity(m_created)
    , m_optTerminated()
    , m_publisher()
    , m_logger(Logger::Get())
{
    constexpr std::string_view CreatedMessage = "Created an {} verification request with {}. [id={}]";
    m_logger->debug(CreatedMessage, m_initiatedByMe ? "outbound" : "inbound", m_otherUserId, m_transactionId);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Request::~Request()
{
    std::scoped_lock lock{ *m_spMutex };
    if (!IsTerminal(m_phase)) {
        Terminate(CreateCancellation(Error::Transport, CancelCode::User, local::ReleasedReason), m_self.userId);
    }
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Request::Send(std::vector<std::string> const& deviceIds)
{
    std::scoped_lock lock{ *m_spMutex };
    if (!m_initiatedByMe || m_phase != Phase::Requested) { return Error::InvalidState; }

    Payload::Request request{ m_self.deviceId, m_methods, {} };
    if (!m_spChannel->IsRoomChannel()) {
        if (deviceIds.empty()) { return Error::InvalidState; }
        m_spChannel->SetCandidateDevices(deviceIds);
        request.timestamp = static_cast<std::uint64_t>(TimeUtils::TimepointToTimestamp(m_created).count());
    }

    if (!m_spChannel->Send(MessageType::Request, request.Write())) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::Receive(Payload::Request const& request)
{
    std::scoped_lock lock{ *m_spMutex };
    if (m_initiatedByMe || m_optOtherMethods || m_phase != Phase::Requested) { return false; }

    m_optOtherDeviceId = request.fromDevice;
    m_optOtherMethods = request.methods;
    m_spChannel->SetOtherDevice(request.fromDevice);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Verification::Request::GetTransactionId() const
{
    return m_transactionId;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Verification::Request::GetRoomId() const
{
    return m_optRoomId;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::IsInitiatedByMe() const
{
    return m_initiatedByMe;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Verification::Request::GetOtherUserId() const
{
    return m_otherUserId;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Verification::Request::GetOtherDeviceId() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optOtherDeviceId;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::IsSelfVerification() const
{
    return m_otherUserId == m_self.userId;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Phase Verification::Request::GetPhase() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_phase;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Methods const& Verification::Request::GetMethods() const
{
    return m_methods;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::OtherPartySupportsMethod(Method method) const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optOtherMethods && local::Contains(*m_optOtherMethods, method);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Method> Verification::Request::GetChosenMethod() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optChosenMethod;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Cancellation> Verification::Request::GetCancellation() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optCancellation;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Verification::Request::GetCancellingUserId() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optCancellingUserId;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Outcome> Verification::Request::GetOutcome() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optOutcome;
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Verification::Request::GetTimeRemaining() const
{
    std::scoped_lock lock{ *m_spMutex };
    if (IsTerminal(m_phase)) { return std::chrono::milliseconds::zero(); }
    auto const remaining = GetDeadline() - m_context.clock();
    return std::max(remaining, std::chrono::milliseconds::zero());
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Request::VerifierHandle Verification::Request::GetVerifier() const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_verifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::SasVerifier> Verification::Request::GetSasVerifier() const
{
    std::scoped_lock lock{ *m_spMutex };
    if (auto const pVerifier = std::get_if<std::shared_ptr<SasVerifier>>(&m_verifier); pVerifier) { return *pVerifier; }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::QrVerifier> Verification::Request::GetQrVerifier() const
{
    std::scoped_lock lock{ *m_spMutex };
    if (auto const pVerifier = std::get_if<std::shared_ptr<QrVerifier>>(&m_verifier); pVerifier) { return *pVerifier; }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_future<Verification::Outcome> Verification::Request::GetCompletion() const
{
    return m_future;
}

//----------------------------------------------------------------------------------------------------------------------

Event::Publisher& Verification::Request::GetPublisher()
{
    return m_publisher;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_future<Verification::OptionalError> Verification::Request::Accept()
{
    std::scoped_lock lock{ *m_spMutex };
    if (m_optAcceptance) { return *m_optAcceptance; }

    std::promise<OptionalError> promise;
    auto const future = promise.get_future().share();
    if (m_initiatedByMe || m_phase != Phase::Requested) {
        promise.set_value(OptionalError{ Error::InvalidState });
        return future;
    }

    // A failed delivery leaves the request unanswered, the caller may try again.
    Payload::Ready const ready{ m_self.deviceId, m_methods };
    if (!m_spChannel->Send(MessageType::Ready, ready.Write())) {
        promise.set_value(OptionalError{ Error::Transport });
        return future;
    }

    promise.set_value(OptionalError{});
    m_optAcceptance = future;
    m_lastActivity = m_context.clock();

    auto const previous = std::exchange(m_phase, Phase::Ready);
    NotifyTransition(previous);
    return future;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Request::Cancel(CancelCode code, std::string_view reason)
{
    std::scoped_lock lock{ *m_spMutex };
    auto const spSelf = shared_from_this();
    return CancelWith(CreateCancellation(code, reason), true);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Request::BeginVerification(std::optional<Method> const& optMethod)
{
    std::scoped_lock lock{ *m_spMutex };
    if (m_phase != Phase::Ready) { return Error::InvalidState; }

    // Reciprocation is started by scanning the counterparty's code.
    auto const method = optMethod.value_or(Method::Sas);
    if (method != Method::Sas || !CanStartSas()) { return Error::MethodUnsupported; }

    auto const spSelf = shared_from_this();
    auto const spVerifier = std::make_shared<SasVerifier>(CreateVerifierContext(), Security::ExchangeRole::Initiator);
    EnterStarted(Method::Sas, spVerifier);
    return spVerifier->Start();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::Buffer> Verification::Request::GenerateQrCode()
{
    constexpr std::string_view FailureMessage = "Unable to create a QR code for {}. [id={}]";

    std::scoped_lock lock{ *m_spMutex };
    if (m_phase != Phase::Ready || !CanShowQrCode()) { return {}; }

    if (!m_optQrCode) {
        m_optQrCode = CreateQrCode();
        if (!m_optQrCode) {
            m_logger->warn(FailureMessage, m_otherUserId, m_transactionId);
            return {};
        }
    }

    return m_optQrCode->Encode();
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Request::ScanQrCode(Security::ReadableView payload)
{
    constexpr std::string_view InvalidMessage = "The scanned QR code does not belong to the request. [id={}]";
    constexpr std::string_view MismatchMessage = "The scanned QR code contains unexpected keys. [id={}]";

    std::scoped_lock lock{ *m_spMutex };
    if (m_phase != Phase::Ready) { return Error::InvalidState; }
    if (!CanScanQrCode()) { return Error::MethodUnsupported; }

    auto const spSelf = shared_from_this();
    auto const optCode = QrCode::Decode(payload);
    bool const isValid = optCode && optCode->GetTransactionId() == m_transactionId &&
        (IsSelfVerification() == (optCode->GetMode() != QrCode::Mode::CrossUser));

    if (!isValid) {
        m_logger->warn(InvalidMessage, m_transactionId);
        [[maybe_unused]] auto const optError = CancelWith(
            CreateCancellation(Error::QrCodeInvalid, CancelCode::InvalidMessage), true);
        return Error::QrCodeInvalid;
    }

    if (!CheckScannedKeys(*optCode)) {
        m_logger->error(MismatchMessage, m_transactionId);
        [[maybe_unused]] auto const optError = CancelWith(
            CreateCancellation(Error::KeyMismatch, CancelCode::KeyMismatch), true);
        return Error::KeyMismatch;
    }

    auto const spVerifier = std::make_shared<QrVerifier>(CreateVerifierContext(), QrVerifier::Role::Scan, *optCode);
    EnterStarted(Method::Reciprocate, spVerifier);
    return spVerifier->Start();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::Handle(Envelope const& envelope)
{
    constexpr std::string_view DroppedMessage = "Dropping {} for a request that has already finished. [id={}]";
    constexpr std::string_view DuplicateMessage = "Dropping a duplicate request from {}. [id={}]";

    std::scoped_lock lock{ *m_spMutex };
    auto const spSelf = shared_from_this();
    if (IsTerminal(m_phase)) {
        m_logger->debug(DroppedMessage, ToString(envelope.type), m_transactionId);
        return;
    }

    m_lastActivity = m_context.clock();
    switch (envelope.type) {
        case MessageType::Request: m_logger->debug(DuplicateMessage, envelope.senderUserId, m_transactionId); break;
        case MessageType::Ready: OnReady(envelope); break;
        case MessageType::Start: OnStart(envelope); break;
        case MessageType::Cancel: OnCancel(envelope); break;
        case MessageType::Accept:
        case MessageType::Key:
        case MessageType::Mac:
        case MessageType::Done: Forward(envelope); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::CheckTimeout(TimeUtils::Timepoint const& now)
{
    constexpr std::string_view ExpiredMessage = "The verification request with {} has timed out. [id={}]";

    std::scoped_lock lock{ *m_spMutex };
    if (IsTerminal(m_phase) || now < GetDeadline()) { return false; }

    auto const spSelf = shared_from_this();
    m_logger->warn(ExpiredMessage, m_otherUserId, m_transactionId);
    [[maybe_unused]] auto const optError = CancelWith(CreateCancellation(CancelCode::Timeout), true);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::IsExpired(TimeUtils::Timepoint const& now) const
{
    std::scoped_lock lock{ *m_spMutex };
    return m_optTerminated && (now - *m_optTerminated) >= m_context.settings.retentionPeriod;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::Teardown()
{
    std::scoped_lock lock{ *m_spMutex };
    if (IsTerminal(m_phase)) { return; }
    [[maybe_unused]] auto const optError = CancelWith(
        CreateCancellation(Error::Transport, CancelCode::User, local::TeardownReason), false);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::IsSupportedByBoth(Method method) const
{
    return local::Contains(m_methods, method) && m_optOtherMethods && local::Contains(*m_optOtherMethods, method);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::CanStartSas() const
{
    return IsSupportedByBoth(Method::Sas);
}

//----------------------------------------------------------------------------------------------------------------------

// The reciprocation is only performed by the scanning device, the counterparty needs to advertise the complementary
// QR method alone.
bool Verification::Request::CanShowQrCode() const
{
    if (!m_optOtherMethods) { return false; }
    return local::Contains(m_methods, Method::Reciprocate) && local::Contains(m_methods, Method::QrCodeShow) &&
        local::Contains(*m_optOtherMethods, Method::QrCodeScan);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::CanScanQrCode() const
{
    if (!m_optOtherMethods) { return false; }
    return local::Contains(m_methods, Method::Reciprocate) && local::Contains(m_methods, Method::QrCodeScan) &&
        local::Contains(*m_optOtherMethods, Method::QrCodeShow);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::HasMutualMethod() const
{
    return CanStartSas() || CanShowQrCode() || CanScanQrCode();
}

//----------------------------------------------------------------------------------------------------------------------

TimeUtils::Timepoint Verification::Request::GetDeadline() const
{
    // An unstarted request lives for the request window, a started handshake expires after a period of inactivity.
    if (m_phase == Phase::Started) { return m_lastActivity + m_context.settings.stepTimeout; }
    return m_created + m_context.settings.requestTimeout;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::OnReady(Envelope const& envelope)
{
    constexpr std::string_view InvalidMessage = "Dropping a malformed ready from {}. [id={}]";
    constexpr std::string_view IgnoredMessage = "Ignoring a ready from {} in the {} phase. [id={}]";
    constexpr std::string_view UnknownMessage = "Ignoring a ready from the unknown device {}. [id={}]";

    auto const optReady = Payload::Ready::Parse(envelope.content);
    if (!optReady) {
        m_logger->warn(InvalidMessage, envelope.senderUserId, m_transactionId);
        return;
    }

    // Only the first answer to an outbound request is accepted.
    if (!m_initiatedByMe || m_phase != Phase::Requested) {
        m_logger->debug(IgnoredMessage, optReady->fromDevice, ToString(m_phase), m_transactionId);
        return;
    }

    if (!SelectOtherDevice(optReady->fromDevice)) {
        m_logger->warn(UnknownMessage, optReady->fromDevice, m_transactionId);
        return;
    }

    m_optOtherMethods = optReady->methods;
    if (!HasMutualMethod()) {
        [[maybe_unused]] auto const optError = CancelWith(
            CreateCancellation(Error::MethodUnsupported, CancelCode::UnknownMethod), true);
        return;
    }

    auto const previous = std::exchange(m_phase, Phase::Ready);
    NotifyTransition(previous);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::OnStart(Envelope const& envelope)
{
    constexpr std::string_view UnknownMessage = "Ignoring a start from the unknown device {}. [id={}]";

    auto const optStart = Payload::Start::Parse(envelope.content);
    if (!optStart) {
        auto const optMethod = local::ReadMethod(envelope.content);
        bool const isStartable = optMethod && (*optMethod == Method::Sas || *optMethod == Method::Reciprocate);
        auto const cancellation = isStartable ?
            CreateCancellation(Error::Protocol, CancelCode::InvalidMessage) :
            CreateCancellation(Error::MethodUnsupported, CancelCode::UnknownMethod);
        [[maybe_unused]] auto const optError = CancelWith(cancellation, true);
        return;
    }

    auto const& start = *optStart;
    if (m_phase == Phase::Started) {
        Identifier::Device const other{ m_otherUserId, start.fromDevice };
        if (m_optOtherDeviceId != start.fromDevice) {
            m_logger->warn(UnknownMessage, start.fromDevice, m_transactionId);
            return;
        }
        if (!ResolveStartConflict(other)) { return; }
    } else if (!SelectOtherDevice(start.fromDevice)) {
        m_logger->warn(UnknownMessage, start.fromDevice, m_transactionId);
        return;
    }

    // A counterparty may start without sending ready, the start then stands for its offer.
    if (!m_optOtherMethods) { m_optOtherMethods = Methods{ start.method }; }

    StartFromCounterparty(start, envelope.content);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::OnCancel(Envelope const& envelope)
{
    constexpr std::string_view CancelledMessage = "{} cancelled the verification with {}: {}. [id={}]";

    auto const optCancel = Payload::Cancel::Parse(envelope.content);
    auto const code = optCancel ? optCancel->code : std::string{};
    auto const reason = optCancel ? optCancel->reason : std::string{};

    m_logger->info(CancelledMessage, envelope.senderUserId, code, reason, m_transactionId);
    Terminate(Cancellation{ ClassifyCancelCode(code), code, reason, true }, envelope.senderUserId);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::Forward(Envelope const& envelope)
{
    constexpr std::string_view DroppedMessage = "Dropping {} received without a handshake. [id={}]";

    // The verifier may release the request's reference while handling the message.
    auto const handle = m_verifier;
    if (auto const pVerifier = std::get_if<std::shared_ptr<SasVerifier>>(&handle); pVerifier) {
        (*pVerifier)->Handle(envelope);
        return;
    }

    if (auto const pVerifier = std::get_if<std::shared_ptr<QrVerifier>>(&handle); pVerifier) {
        (*pVerifier)->Handle(envelope);
        return;
    }

    if (envelope.type == MessageType::Done) {
        m_logger->debug(DroppedMessage, ToString(envelope.type), m_transactionId);
        return;
    }

    [[maybe_unused]] auto const optError = CancelWith(
        CreateCancellation(Error::Protocol, CancelCode::UnexpectedMessage), true);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::SelectOtherDevice(std::string_view deviceId)
{
    constexpr std::string_view UnsentMessage = "Unable to inform every other device of the answer. [id={}]";

    if (m_optOtherDeviceId) { return *m_optOtherDeviceId == deviceId; }

    if (!m_spChannel->IsRoomChannel()) {
        auto const& candidates = m_spChannel->GetCandidateDevices();
        if (std::ranges::find(candidates, deviceId) == candidates.end()) { return false; }
    }

    m_optOtherDeviceId = deviceId;
    m_spChannel->SetOtherDevice(deviceId);

    auto const accepted = CreateCancellation(CancelCode::Accepted);
    Payload::Cancel const cancel{ accepted.code, accepted.reason };
    if (!m_spChannel->SendToOthers(deviceId, MessageType::Cancel, cancel.Write())) {
        m_logger->warn(UnsentMessage, m_transactionId);
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::ResolveStartConflict(Identifier::Device const& other)
{
    constexpr std::string_view KeptMessage = "Dropping the counterparty's start in favor of the local one. [id={}]";
    constexpr std::string_view ReplacedMessage = "Replacing the local start with the counterparty's. [id={}]";

    auto const spVerifier = local::GetVerifier(m_verifier);
    if (!spVerifier) { return true; }

    // Only one start from each side is permitted.
    if (!spVerifier->IsStarter()) {
        [[maybe_unused]] auto const optError = CancelWith(
            CreateCancellation(Error::Protocol, CancelCode::UnexpectedMessage), true);
        return false;
    }

    if (m_self < other) {
        m_logger->debug(KeptMessage, m_transactionId);
        return false;
    }

    // Secrets may already have been shared with the counterparty, the local handshake cannot be silently replaced.
    if (spVerifier->HasKeyMaterial()) {
        [[maybe_unused]] auto const optError = CancelWith(
            CreateCancellation(Error::Protocol, CancelCode::UnexpectedMessage), true);
        return false;
    }

    m_logger->debug(ReplacedMessage, m_transactionId);
    m_verifier = std::monostate{};
    m_optChosenMethod.reset();
    spVerifier->Terminate(CreateCancellation(Error::Protocol, CancelCode::UnexpectedMessage, local::SupersededReason));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::StartFromCounterparty(Payload::Start const& start, boost::json::object const& content)
{
    constexpr std::string_view IncompleteMessage = "The {} handshake did not start ({}). [id={}]";

    auto const unsupported = CreateCancellation(Error::MethodUnsupported, CancelCode::UnknownMethod);
    switch (start.method) {
        case Method::Sas: {
            if (!CanStartSas()) { break; }
            auto const spVerifier = std::make_shared<SasVerifier>(
                CreateVerifierContext(), Security::ExchangeRole::Acceptor);
            EnterStarted(Method::Sas, spVerifier);
            if (auto const optError = spVerifier->Accept(start, content); optError) {
                m_logger->debug(IncompleteMessage, ToString(Method::Sas), ToString(*optError), m_transactionId);
            }
        } return;
        case Method::Reciprocate: {
            // The counterparty can only reciprocate a code the local device has shown.
            if (!m_optQrCode || !CanShowQrCode()) { break; }
            auto const spVerifier = std::make_shared<QrVerifier>(
                CreateVerifierContext(), QrVerifier::Role::Show, *m_optQrCode);
            EnterStarted(Method::Reciprocate, spVerifier);
            if (auto const optError = spVerifier->Reciprocate(start); optError) {
                m_logger->debug(IncompleteMessage, ToString(Method::Reciprocate), ToString(*optError), m_transactionId);
            }
        } return;
        default: break;
    }

    [[maybe_unused]] auto const optError = CancelWith(unsupported, true);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::QrCode> Verification::Request::CreateQrCode() const
{
    auto const& spStore = m_context.spIdentityStore;
    auto const optOwnMasterKey = local::DecodePublicKey(spStore->GetMasterKey(m_self.userId));
    if (!optOwnMasterKey) { return {}; }

    QrCode::Mode mode = QrCode::Mode::CrossUser;
    std::optional<QrCode::PublicKey> optFirstKey;
    std::optional<QrCode::PublicKey> optSecondKey;
    if (IsSelfVerification()) {
        if (!m_optOtherDeviceId) { return {}; }
        if (spStore->IsOwnMasterKeyTrusted()) {
            mode = QrCode::Mode::SelfTrusted;
            optFirstKey = optOwnMasterKey;
            optSecondKey = local::DecodePublicKey(spStore->GetDeviceKey(m_self.userId, *m_optOtherDeviceId));
        } else {
            mode = QrCode::Mode::SelfUntrusted;
            optFirstKey = local::DecodePublicKey(spStore->GetDeviceKey(m_self.userId, m_self.deviceId));
            optSecondKey = optOwnMasterKey;
        }
    } else {
        // Vouching for another user requires the local master key to be trusted.
        if (!spStore->IsOwnMasterKeyTrusted()) { return {}; }
        optFirstKey = optOwnMasterKey;
        optSecondKey = local::DecodePublicKey(spStore->GetMasterKey(m_otherUserId));
    }

    if (!optFirstKey || !optSecondKey) { return {}; }

    auto const optSecret = Security::GenerateSecureRandomData(
        *m_context.spRandomSource, m_context.settings.qrSecretSize);
    if (!optSecret) { return {}; }

    return QrCode{ mode, m_transactionId, *optFirstKey, *optSecondKey, optSecret->GetData() };
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Request::CheckScannedKeys(QrCode const& code) const
{
    // The code describes the showing device's view, each key is compared with what the local store holds.
    auto const& spStore = m_context.spIdentityStore;
    switch (code.GetMode()) {
        case QrCode::Mode::SelfTrusted: {
            return local::IsMatchingKey(spStore->GetMasterKey(m_self.userId), code.GetFirstKey()) &&
                local::IsMatchingKey(spStore->GetDeviceKey(m_self.userId, m_self.deviceId), code.GetSecondKey());
        }
        case QrCode::Mode::SelfUntrusted: {
            if (!m_optOtherDeviceId) { return false; }
            return local::IsMatchingKey(spStore->GetDeviceKey(m_otherUserId, *m_optOtherDeviceId), code.GetFirstKey()) &&
                local::IsMatchingKey(spStore->GetMasterKey(m_self.userId), code.GetSecondKey());
        }
        case QrCode::Mode::CrossUser: {
            return local::IsMatchingKey(spStore->GetMasterKey(m_otherUserId), code.GetFirstKey()) &&
                local::IsMatchingKey(spStore->GetMasterKey(m_self.userId), code.GetSecondKey());
        }
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Verifier::Context Verification::Request::CreateVerifierContext()
{
    std::weak_ptr<Request> const wpRequest = weak_from_this();
    return Verifier::Context{
        m_spMutex,
        m_spChannel,
        m_context.spIdentityStore,
        m_context.spRandomSource,
        m_context.settings,
        m_self,
        Identifier::Device{ m_otherUserId, m_optOtherDeviceId.value_or(std::string{}) },
        [wpRequest] (Cancellation const& cancellation) -> OptionalError {
            auto const spRequest = wpRequest.lock();
            if (!spRequest) { return Error::InvalidState; }
            std::scoped_lock lock{ *spRequest->m_spMutex };
            return spRequest->CancelWith(cancellation, true);
        },
        [wpRequest] () {
            if (auto const spRequest = wpRequest.lock(); spRequest) {
                std::scoped_lock lock{ *spRequest->m_spMutex };
                spRequest->OnVerified();
            }
        }
    };
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::EnterStarted(Method method, VerifierHandle&& handle)
{
    m_verifier = std::move(handle);
    m_optChosenMethod = method;
    m_lastActivity = m_context.clock();

    if (m_phase != Phase::Started) {
        auto const previous = std::exchange(m_phase, Phase::Started);
        NotifyTransition(previous);
    }
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::Request::CancelWith(Cancellation const& cancellation, bool notify)
{
    if (IsTerminal(m_phase)) { return Error::InvalidState; }

    bool delivered = true;
    if (notify) {
        Payload::Cancel const cancel{ cancellation.code, cancellation.reason };
        delivered = m_spChannel->Send(MessageType::Cancel, cancel.Write());
    }

    Terminate(cancellation, m_self.userId);
    if (!delivered) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::Terminate(Cancellation const& cancellation, std::string_view cancellingUserId)
{
    // The phase changes first, anything raised by the verifier observes a terminal request.
    auto const previous = std::exchange(m_phase, Phase::Cancelled);
    m_optCancellation = cancellation;
    m_optCancellingUserId = std::string{ cancellingUserId };
    m_optOutcome = cancellation;
    m_optTerminated = m_context.clock();
    m_optQrCode.reset();

    auto const spVerifier = local::GetVerifier(std::exchange(m_verifier, std::monostate{}));
    if (spVerifier) { spVerifier->Terminate(cancellation); }

    m_completion.set_value(Outcome{ cancellation });
    NotifyTransition(previous);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::OnVerified()
{
    if (m_phase != Phase::Started) { return; }

    auto const previous = std::exchange(m_phase, Phase::Done);
    m_optOutcome = Verified{};
    m_optTerminated = m_context.clock();
    m_verifier = std::monostate{};
    m_optQrCode.reset();

    m_completion.set_value(Outcome{ Verified{} });
    NotifyTransition(previous);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Request::NotifyTransition(Phase previous)
{
    constexpr std::string_view TransitionMessage = "The request with {} moved from {} to {}. [id={}]";
    m_logger->info(TransitionMessage, m_otherUserId, ToString(previous), ToString(m_phase), m_transactionId);
    m_publisher.Publish<Event::Type::PhaseChanged>(previous, m_phase);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::Contains(Verification::Methods const& methods, Verification::Method method)
{
    return std::ranges::find(methods, method) != methods.end();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Verifier> local::GetVerifier(Verification::Request::VerifierHandle const& handle)
{
    return std::visit([] (auto const& spVerifier) -> std::shared_ptr<Verification::Verifier> {
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(spVerifier)>, std::monostate>) {
            return nullptr;
        } else {
            return spVerifier;
        }
    }, handle);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Method> local::ReadMethod(boost::json::object const& content)
{
    auto const pValue = content.if_contains("method");
    if (!pValue || !pValue->is_string()) { return {}; }
    auto const& method = pValue->get_string();
    return Verification::ParseMethod({ method.data(), method.size() });
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::QrCode::PublicKey> local::DecodePublicKey(std::optional<Security::EncodedKey> const& optKey)
{
    if (!optKey) { return {}; }
    auto const optDecoded = Security::DecodeBase64(*optKey);
    if (!optDecoded || optDecoded->size() != std::tuple_size_v<Verification::QrCode::PublicKey>) { return {}; }

    Verification::QrCode::PublicKey key{};
    std::ranges::copy(*optDecoded, key.begin());
    return key;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsMatchingKey(
    std::optional<Security::EncodedKey> const& optKey, Verification::QrCode::PublicKey const& expected)
{
    auto const optDecoded = DecodePublicKey(optKey);
    return optDecoded && *optDecoded == expected;
}

//----------------------------------------------------------------------------------------------------------------------
