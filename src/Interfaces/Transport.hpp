//----------------------------------------------------------------------------------------------------------------------
// File: Transport.hpp
// Description: Defines the interface used by verification requests to deliver protocol messages to a counterparty, 
// either directly to one of its devices or as an event in a shared room.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class ITransport
{
public:
    // A room message is addressed by the room alone, a direct message by the user and device. 
    struct Destination
    {
        std::string userId;
        std::string deviceId;
        std::optional<std::string> roomId;
    };

    virtual ~ITransport() = default;

    // Returns false when the message could not be handed to the homeserver. A room request names its transaction id
    // in the content and every later room message refers to the request through that id. The transport must publish
    // the request under an event id equal to that transaction id, a transport that cannot choose the event id is not
    // able to carry room verifications.
    [[nodiscard]] virtual bool Send(
        Destination const& destination, Verification::MessageType type, boost::json::object const& content) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
