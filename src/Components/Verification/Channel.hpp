//----------------------------------------------------------------------------------------------------------------------
// File: Channel.hpp
// Description: Addresses the protocol messages of a single request. Attaches the transaction id the way the 
// transport expects it and fans messages out to every candidate device until one of them has answered. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "VerificationDefinitions.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class Channel;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::Channel
{
public:
    Channel(
        std::shared_ptr<ITransport> const& spTransport,
        std::string_view transactionId,
        std::string_view otherUserId,
        std::optional<std::string> const& optRoomId);

    [[nodiscard]] std::string const& GetTransactionId() const;
    [[nodiscard]] bool IsRoomChannel() const;

    // Direct messages are addressed to the candidate devices until the counterparty's device is known. 
    void SetCandidateDevices(std::vector<std::string> const& deviceIds);
    void SetOtherDevice(std::string_view deviceId);
    [[nodiscard]] std::vector<std::string> const& GetCandidateDevices() const;

    // Returns true only if the message was delivered to every addressed recipient. 
    [[nodiscard]] bool Send(MessageType type, boost::json::object content) const;

    // Sends the message to the candidate devices other than the specified one.
    [[nodiscard]] bool SendToOthers(std::string_view excludedDeviceId, MessageType type, boost::json::object content) const;

private:
    [[nodiscard]] bool Deliver(
        ITransport::Destination const& destination, MessageType type, boost::json::object const& content) const;

    std::shared_ptr<ITransport> m_spTransport;
    std::string m_transactionId;
    std::string m_otherUserId;
    std::optional<std::string> m_optRoomId;
    std::optional<std::string> m_optOtherDeviceId;
    std::vector<std::string> m_candidates;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
