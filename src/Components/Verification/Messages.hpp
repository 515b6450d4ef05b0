//----------------------------------------------------------------------------------------------------------------------
// File: Messages.hpp
// Description: The content of the verification protocol messages. Each payload can be parsed from and written to the 
// JSON object carried by the transport. Parsing only validates the schema, sequencing is left to the request and the
// verifiers. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "VerificationDefinitions.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

struct Envelope;

//----------------------------------------------------------------------------------------------------------------------
namespace Payload {
//----------------------------------------------------------------------------------------------------------------------

struct Request;
struct Ready;
struct Start;
struct Accept;
struct Key;
struct Mac;
struct Cancel;

//----------------------------------------------------------------------------------------------------------------------
} // Payload namespace
//----------------------------------------------------------------------------------------------------------------------

namespace Fields {

constexpr std::string_view TransactionId = "transaction_id";
constexpr std::string_view RelatesTo = "m.relates_to";
constexpr std::string_view RelationType = "rel_type";
constexpr std::string_view EventId = "event_id";
constexpr std::string_view Reference = "m.reference";

} // Fields namespace

// Room messages reference the request event, direct messages name the transaction. 
[[nodiscard]] std::optional<std::string> ExtractTransactionId(boost::json::object const& content);
void AttachTransactionId(boost::json::object& content, std::string_view transactionId, bool isRoomMessage);

// Serializes the value with lexicographically sorted object keys and no insignificant whitespace.
[[nodiscard]] std::string CanonicalJson(boost::json::value const& value);

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: An inbound protocol message as surfaced by the transport. The event identifier is only known for room 
// messages and identifies the request event. 
//----------------------------------------------------------------------------------------------------------------------
struct Verification::Envelope
{
    MessageType type;
    std::string senderUserId;
    std::optional<std::string> roomId;
    std::optional<std::string> eventId;
    TimeUtils::Timepoint timestamp;
    boost::json::object content;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Request
{
    std::string fromDevice;
    Methods methods;
    std::optional<std::uint64_t> timestamp; // Room requests are timestamped by the server instead. 

    [[nodiscard]] static std::optional<Request> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Ready
{
    std::string fromDevice;
    Methods methods;

    [[nodiscard]] static std::optional<Ready> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: Opens a handshake. The SAS fields are only present for the SAS method and the secret is only present 
// for the reciprocation method. 
//----------------------------------------------------------------------------------------------------------------------
struct Verification::Payload::Start
{
    std::string fromDevice;
    Method method;

    std::vector<std::string> keyAgreementProtocols;
    std::vector<std::string> hashes;
    std::vector<std::string> messageAuthenticationCodes;
    std::vector<std::string> shortAuthenticationStrings;

    std::string secret;

    [[nodiscard]] static std::optional<Start> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Accept
{
    std::string keyAgreementProtocol;
    std::string hash;
    std::string messageAuthenticationCode;
    std::vector<std::string> shortAuthenticationStrings;
    std::string commitment;

    [[nodiscard]] static std::optional<Accept> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Key
{
    std::string key;

    [[nodiscard]] static std::optional<Key> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Mac
{
    std::map<std::string, std::string> mac; // Ordered by key identifier. 
    std::string keys;

    [[nodiscard]] static std::optional<Mac> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------

struct Verification::Payload::Cancel
{
    std::string code;
    std::string reason;

    [[nodiscard]] static std::optional<Cancel> Parse(boost::json::object const& content);
    [[nodiscard]] boost::json::object Write() const;
};

//----------------------------------------------------------------------------------------------------------------------
