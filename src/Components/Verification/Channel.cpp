//----------------------------------------------------------------------------------------------------------------------
// File: Channel.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Channel.hpp"
#include "Messages.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Verification::Channel::Channel(
    std::shared_ptr<ITransport> const& spTransport,
    std::string_view transactionId,
    std::string_view otherUserId,
    std::optional<std::string> const& optRoomId)
    : m_spTransport(spTransport)
    , m_transactionId(transactionId)
    , m_otherUserId(otherUserId)
    , m_optRoomId(optRoomId)
    , m_optOtherDeviceId()
    , m_candidates()
    , m_logger(Logger::Get())
{
    assert(m_spTransport);
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Verification::Channel::GetTransactionId() const
{
    return m_transactionId;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Channel::IsRoomChannel() const
{
    return m_optRoomId.has_value();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Channel::SetCandidateDevices(std::vector<std::string> const& deviceIds)
{
    m_candidates = deviceIds;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::Channel::SetOtherDevice(std::string_view deviceId)
{
    m_optOtherDeviceId = deviceId;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Verification::Channel::GetCandidateDevices() const
{
    return m_candidates;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Channel::Send(MessageType type, boost::json::object content) const
{
    // The room request is the event every later message references, it names its own transaction instead. 
    AttachTransactionId(content, m_transactionId, IsRoomChannel() && type != MessageType::Request);

    if (m_optRoomId) { return Deliver({ m_otherUserId, {}, m_optRoomId }, type, content); }
    if (m_optOtherDeviceId) { return Deliver({ m_otherUserId, *m_optOtherDeviceId, {} }, type, content); }

    bool delivered = !m_candidates.empty();
    for (auto const& deviceId : m_candidates) {
        delivered = Deliver({ m_otherUserId, deviceId, {} }, type, content) && delivered;
    }
    return delivered;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Channel::SendToOthers(
    std::string_view excludedDeviceId, MessageType type, boost::json::object content) const
{
    if (m_optRoomId) { return true; } // Every member of the room observes the same request. 

    AttachTransactionId(content, m_transactionId, false);

    bool delivered = true;
    for (auto const& deviceId : m_candidates) {
        if (deviceId == excludedDeviceId) { continue; }
        delivered = Deliver({ m_otherUserId, deviceId, {} }, type, content) && delivered;
    }
    return delivered;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::Channel::Deliver(
    ITransport::Destination const& destination, MessageType type, boost::json::object const& content) const
{
    constexpr std::string_view SendingMessage = "Sending {} to {}. [id={}]";
    constexpr std::string_view FailureMessage = "Unable to send {} to {}. [id={}]";

    auto const& recipient = destination.roomId ? *destination.roomId : destination.deviceId;
    m_logger->debug(SendingMessage, ToString(type), recipient, m_transactionId);

    if (!m_spTransport->Send(destination, type, content)) {
        m_logger->warn(FailureMessage, ToString(type), recipient, m_transactionId);
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
