//----------------------------------------------------------------------------------------------------------------------
// File: Service.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Service.hpp"
#include "Components/Identifier/Identifier.hpp"
#include "Interfaces/IdentityStore.hpp"
#include "Interfaces/RandomSource.hpp"
#include "Interfaces/Transport.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Verification::Service::Service(
    std::shared_ptr<ITransport> const& spTransport,
    std::shared_ptr<IIdentityStore> const& spIdentityStore,
    std::shared_ptr<IRandomSource> const& spRandomSource,
    Settings const& settings,
    TimeUtils::Clock const& clock)
    : m_context{ spTransport, spIdentityStore, spRandomSource, settings, clock }
    , m_store()
    , m_publisher()
    , m_logger(Logger::Get())
{
    assert(m_context.spTransport && m_context.spIdentityStore && m_context.spRandomSource && m_context.clock);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Service::~Service()
{
    Teardown();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::RequestVerification(
    std::string_view userId, std::vector<std::string> const& deviceIds)
{
    constexpr std::string_view NoDevicesMessage = "Unable to request verification, {} has no known devices.";

    auto const& self = m_context.spIdentityStore->GetOwnDevice();
    auto devices = deviceIds.empty() ? m_context.spIdentityStore->GetDeviceIds(userId) : deviceIds;
    if (userId == self.userId) { std::erase(devices, self.deviceId); }

    if (devices.empty()) {
        m_logger->warn(NoDevicesMessage, userId);
        return nullptr;
    }

    return OpenRequest(userId, {}, devices);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::RequestVerificationInRoom(
    std::string_view userId, std::string_view roomId)
{
    return OpenRequest(userId, std::string{ roomId }, {});
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::RequestOwnUserVerification()
{
    return RequestVerification(m_context.spIdentityStore->GetOwnDevice().userId);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Service::HandleMessage(Envelope const& envelope)
{
    constexpr std::string_view MissingMessage = "Dropping {} from {} without a transaction.";
    constexpr std::string_view UnknownMessage = "Dropping {} for an unknown transaction. [id={}]";

    if (envelope.type == MessageType::Request) {
        OnRequest(envelope);
        return;
    }

    auto const optTransactionId = ExtractTransactionId(envelope.content);
    if (!optTransactionId) {
        m_logger->warn(MissingMessage, ToString(envelope.type), envelope.senderUserId);
        return;
    }

    auto const spRequest = m_store.Find(envelope.senderUserId, *optTransactionId);
    if (!spRequest) {
        m_logger->warn(UnknownMessage, ToString(envelope.type), *optTransactionId);
        return;
    }

    spRequest->Handle(envelope);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::FindRequest(
    std::string_view userId, std::string_view transactionId) const
{
    return m_store.Find(userId, transactionId);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::FindRequest(std::string_view transactionId) const
{
    return m_store.Find(transactionId);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::RequestStore::Requests Verification::Service::GetRequestsInProgress(std::string_view userId) const
{
    return m_store.FindByCounterparty(userId, [] (Request const& request) { return !IsTerminal(request.GetPhase()); });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Verification::Service::GetRequestCount() const
{
    return m_store.Size();
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Settings const& Verification::Service::GetSettings() const
{
    return m_context.settings;
}

//----------------------------------------------------------------------------------------------------------------------

Event::Publisher& Verification::Service::GetPublisher()
{
    return m_publisher;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Verification::Service::Execute()
{
    auto const now = m_context.clock();

    std::size_t processed = 0;
    for (auto const& spRequest : m_store.GetRequests()) {
        if (spRequest->CheckTimeout(now)) { ++processed; }
    }

    return processed + m_store.EvictExpired(now);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Service::Teardown()
{
    for (auto const& spRequest : m_store.GetRequests()) { spRequest->Teardown(); }
    m_store.Clear();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::Service::OpenRequest(
    std::string_view userId, std::optional<std::string> const& optRoomId, std::vector<std::string> const& deviceIds)
{
    constexpr std::string_view IdentifierMessage = "Unable to generate a transaction identifier for {}.";
    constexpr std::string_view UnsentMessage = "Unable to deliver the verification request to {}. [id={}]";

    auto const optTransactionId = Identifier::GenerateTransactionIdentifier(*m_context.spRandomSource);
    if (!optTransactionId) {
        m_logger->error(IdentifierMessage, userId);
        return nullptr;
    }

    auto const spRequest = std::make_shared<Request>(m_context, *optTransactionId, userId, optRoomId, true);
    if (!m_store.Insert(spRequest)) { return nullptr; }

    if (auto const optError = spRequest->Send(deviceIds); optError) {
        m_logger->warn(UnsentMessage, userId, *optTransactionId);
        spRequest->Teardown();
        m_store.Erase(userId, *optTransactionId);
        return nullptr;
    }

    return spRequest;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Service::OnRequest(Envelope const& envelope)
{
    constexpr std::string_view InvalidMessage = "Dropping a malformed request from {}.";
    constexpr std::string_view StaleMessage = "Dropping a stale request from {}. [id={}]";
    constexpr std::string_view DuplicateMessage = "Dropping a duplicate request from {}. [id={}]";
    constexpr std::string_view ReceivedMessage = "Received a verification request from {} ({}). [id={}]";

    auto const optRequest = Payload::Request::Parse(envelope.content);
    if (!optRequest) {
        m_logger->warn(InvalidMessage, envelope.senderUserId);
        return;
    }

    // A room request is identified by its event, a direct request names its transaction. 
    auto optTransactionId = envelope.roomId ? envelope.eventId : std::optional<std::string>{};
    if (!optTransactionId) { optTransactionId = ExtractTransactionId(envelope.content); }
    if (!optTransactionId) {
        m_logger->warn(InvalidMessage, envelope.senderUserId);
        return;
    }

    // Room requests sent by the local device are echoed back through the room.
    auto const& self = m_context.spIdentityStore->GetOwnDevice();
    if (envelope.senderUserId == self.userId && optRequest->fromDevice == self.deviceId) { return; }

    auto const timestamp = optRequest->timestamp ?
        TimeUtils::TimestampToTimepoint(*optRequest->timestamp) : envelope.timestamp;
    if (!IsFresh(timestamp)) {
        m_logger->warn(StaleMessage, envelope.senderUserId, *optTransactionId);
        return;
    }

    if (m_store.Find(envelope.senderUserId, *optTransactionId)) {
        m_logger->debug(DuplicateMessage, envelope.senderUserId, *optTransactionId);
        return;
    }

    auto const spRequest = std::make_shared<Request>(
        m_context, *optTransactionId, envelope.senderUserId, envelope.roomId, false);
    if (!spRequest->Receive(*optRequest) || !m_store.Insert(spRequest)) { return; }

    m_logger->info(ReceivedMessage, envelope.senderUserId, optRequest->fromDevice, *optTransactionId);
    m_publisher.Publish<Event::Type::RequestReceived>(spRequest);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Service::IsFresh(TimeUtils::Timepoint const& timestamp) const
{
    auto const now = m_context.clock();
    return timestamp + m_context.settings.requestTimeout >= now && timestamp <= now + m_context.settings.futureTolerance;
}

//----------------------------------------------------------------------------------------------------------------------
