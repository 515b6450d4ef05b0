//----------------------------------------------------------------------------------------------------------------------
// File: Messages.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view FromDevice = "from_device";
constexpr std::string_view Methods = "methods";
constexpr std::string_view Timestamp = "timestamp";
constexpr std::string_view Method = "method";
constexpr std::string_view KeyAgreementProtocols = "key_agreement_protocols";
constexpr std::string_view Hashes = "hashes";
constexpr std::string_view MessageAuthenticationCodes = "message_authentication_codes";
constexpr std::string_view ShortAuthenticationString = "short_authentication_string";
constexpr std::string_view Secret = "secret";
constexpr std::string_view KeyAgreementProtocol = "key_agreement_protocol";
constexpr std::string_view Hash = "hash";
constexpr std::string_view MessageAuthenticationCode = "message_authentication_code";
constexpr std::string_view Commitment = "commitment";
constexpr std::string_view Key = "key";
constexpr std::string_view Mac = "mac";
constexpr std::string_view Keys = "keys";
constexpr std::string_view Code = "code";
constexpr std::string_view Reason = "reason";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> GetString(boost::json::object const& json, std::string_view key);
[[nodiscard]] std::optional<std::vector<std::string>> GetStrings(boost::json::object const& json, std::string_view key);
[[nodiscard]] std::optional<Verification::Methods> GetMethods(boost::json::object const& json);

[[nodiscard]] boost::json::array WriteStrings(std::vector<std::string> const& values);
[[nodiscard]] boost::json::array WriteMethods(Verification::Methods const& methods);

void WriteCanonical(boost::json::value const& value, std::string& out);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Verification::ExtractTransactionId(boost::json::object const& content)
{
    if (auto const itr = content.find(Fields::RelatesTo); itr != content.end()) {
        auto const pRelation = itr->value().if_object();
        if (!pRelation) { return {}; }
        if (local::GetString(*pRelation, Fields::RelationType) != Fields::Reference) { return {}; }
        return local::GetString(*pRelation, Fields::EventId);
    }
    return local::GetString(content, Fields::TransactionId);
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::AttachTransactionId(boost::json::object& content, std::string_view transactionId, bool isRoomMessage)
{
    if (isRoomMessage) {
        boost::json::object relation;
        relation[Fields::RelationType] = Fields::Reference;
        relation[Fields::EventId] = transactionId;
        content[Fields::RelatesTo] = std::move(relation);
    } else {
        content[Fields::TransactionId] = transactionId;
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string Verification::CanonicalJson(boost::json::value const& value)
{
    std::string out;
    local::WriteCanonical(value, out);
    return out;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Request> Verification::Payload::Request::Parse(
    boost::json::object const& content)
{
    auto optFromDevice = local::GetString(content, symbols::FromDevice);
    auto optMethods = local::GetMethods(content);
    if (!optFromDevice || optFromDevice->empty() || !optMethods) { return {}; }

    Request request{ std::move(*optFromDevice), std::move(*optMethods), {} };
    if (auto const itr = content.find(symbols::Timestamp); itr != content.end()) {
        if (auto const pUnsigned = itr->value().if_uint64(); pUnsigned) {
            request.timestamp = *pUnsigned;
        } else if (auto const pSigned = itr->value().if_int64(); pSigned && *pSigned >= 0) {
            request.timestamp = static_cast<std::uint64_t>(*pSigned);
        } else {
            return {};
        }
    }
    return request;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Request::Write() const
{
    boost::json::object content;
    content[symbols::FromDevice] = fromDevice;
    content[symbols::Methods] = local::WriteMethods(methods);
    if (timestamp) { content[symbols::Timestamp] = *timestamp; }
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Ready> Verification::Payload::Ready::Parse(boost::json::object const& content)
{
    auto optFromDevice = local::GetString(content, symbols::FromDevice);
    auto optMethods = local::GetMethods(content);
    if (!optFromDevice || optFromDevice->empty() || !optMethods) { return {}; }
    return Ready{ std::move(*optFromDevice), std::move(*optMethods) };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Ready::Write() const
{
    boost::json::object content;
    content[symbols::FromDevice] = fromDevice;
    content[symbols::Methods] = local::WriteMethods(methods);
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Start> Verification::Payload::Start::Parse(boost::json::object const& content)
{
    auto optFromDevice = local::GetString(content, symbols::FromDevice);
    auto const optMethodName = local::GetString(content, symbols::Method);
    if (!optFromDevice || optFromDevice->empty() || !optMethodName) { return {}; }

    auto const optMethod = ParseMethod(*optMethodName);
    if (!optMethod) { return {}; }

    Start start{};
    start.fromDevice = std::move(*optFromDevice);
    start.method = *optMethod;

    switch (start.method) {
        case Method::Sas: {
            auto optKeyAgreementProtocols = local::GetStrings(content, symbols::KeyAgreementProtocols);
            auto optHashes = local::GetStrings(content, symbols::Hashes);
            auto optMessageAuthenticationCodes = local::GetStrings(content, symbols::MessageAuthenticationCodes);
            auto optShortAuthenticationStrings = local::GetStrings(content, symbols::ShortAuthenticationString);
            if (!optKeyAgreementProtocols || !optHashes || !optMessageAuthenticationCodes) { return {}; }
            if (!optShortAuthenticationStrings) { return {}; }
            start.keyAgreementProtocols = std::move(*optKeyAgreementProtocols);
            start.hashes = std::move(*optHashes);
            start.messageAuthenticationCodes = std::move(*optMessageAuthenticationCodes);
            start.shortAuthenticationStrings = std::move(*optShortAuthenticationStrings);
        } break;
        case Method::Reciprocate: {
            auto optSecret = local::GetString(content, symbols::Secret);
            if (!optSecret || optSecret->empty()) { return {}; }
            start.secret = std::move(*optSecret);
        } break;
        // Showing and scanning are advertised capabilities, they are never started. 
        case Method::QrCodeShow:
        case Method::QrCodeScan: return {};
    }

    return start;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Start::Write() const
{
    boost::json::object content;
    content[symbols::FromDevice] = fromDevice;
    content[symbols::Method] = ToString(method);
    if (method == Method::Sas) {
        content[symbols::KeyAgreementProtocols] = local::WriteStrings(keyAgreementProtocols);
        content[symbols::Hashes] = local::WriteStrings(hashes);
        content[symbols::MessageAuthenticationCodes] = local::WriteStrings(messageAuthenticationCodes);
        content[symbols::ShortAuthenticationString] = local::WriteStrings(shortAuthenticationStrings);
    } else if (method == Method::Reciprocate) {
        content[symbols::Secret] = secret;
    }
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Accept> Verification::Payload::Accept::Parse(
    boost::json::object const& content)
{
    auto optKeyAgreementProtocol = local::GetString(content, symbols::KeyAgreementProtocol);
    auto optHash = local::GetString(content, symbols::Hash);
    auto optMessageAuthenticationCode = local::GetString(content, symbols::MessageAuthenticationCode);
    auto optShortAuthenticationStrings = local::GetStrings(content, symbols::ShortAuthenticationString);
    auto optCommitment = local::GetString(content, symbols::Commitment);
    if (!optKeyAgreementProtocol || !optHash || !optMessageAuthenticationCode) { return {}; }
    if (!optShortAuthenticationStrings || !optCommitment || optCommitment->empty()) { return {}; }

    return Accept{
        std::move(*optKeyAgreementProtocol),
        std::move(*optHash),
        std::move(*optMessageAuthenticationCode),
        std::move(*optShortAuthenticationStrings),
        std::move(*optCommitment)
    };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Accept::Write() const
{
    boost::json::object content;
    content[symbols::KeyAgreementProtocol] = keyAgreementProtocol;
    content[symbols::Hash] = hash;
    content[symbols::MessageAuthenticationCode] = messageAuthenticationCode;
    content[symbols::ShortAuthenticationString] = local::WriteStrings(shortAuthenticationStrings);
    content[symbols::Commitment] = commitment;
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Key> Verification::Payload::Key::Parse(boost::json::object const& content)
{
    auto optKey = local::GetString(content, symbols::Key);
    if (!optKey || optKey->empty()) { return {}; }
    return Key{ std::move(*optKey) };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Key::Write() const
{
    boost::json::object content;
    content[symbols::Key] = key;
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Mac> Verification::Payload::Mac::Parse(boost::json::object const& content)
{
    auto optKeys = local::GetString(content, symbols::Keys);
    if (!optKeys || optKeys->empty()) { return {}; }

    auto const itr = content.find(symbols::Mac);
    if (itr == content.end()) { return {}; }
    auto const pMacs = itr->value().if_object();
    if (!pMacs || pMacs->empty()) { return {}; }

    Mac mac{ {}, std::move(*optKeys) };
    for (auto const& entry : *pMacs) {
        auto const pValue = entry.value().if_string();
        if (!pValue) { return {}; }
        mac.mac.emplace(std::string{ entry.key() }, std::string{ pValue->c_str(), pValue->size() });
    }
    return mac;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Mac::Write() const
{
    boost::json::object macs;
    for (auto const& [keyId, value] : mac) { macs[keyId] = value; }

    boost::json::object content;
    content[symbols::Mac] = std::move(macs);
    content[symbols::Keys] = keys;
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Cancel> Verification::Payload::Cancel::Parse(
    boost::json::object const& content)
{
    auto optCode = local::GetString(content, symbols::Code);
    if (!optCode || optCode->empty()) { return {}; }
    return Cancel{ std::move(*optCode), local::GetString(content, symbols::Reason).value_or("") };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Verification::Payload::Cancel::Write() const
{
    boost::json::object content;
    content[symbols::Code] = code;
    content[symbols::Reason] = reason;
    return content;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::GetString(boost::json::object const& json, std::string_view key)
{
    auto const itr = json.find(key);
    if (itr == json.end()) { return {}; }
    auto const pString = itr->value().if_string();
    if (!pString) { return {}; }
    return std::string{ pString->c_str(), pString->size() };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::vector<std::string>> local::GetStrings(boost::json::object const& json, std::string_view key)
{
    auto const itr = json.find(key);
    if (itr == json.end()) { return {}; }
    auto const pArray = itr->value().if_array();
    if (!pArray) { return {}; }

    std::vector<std::string> values;
    values.reserve(pArray->size());
    for (auto const& element : *pArray) {
        auto const pString = element.if_string();
        if (!pString) { return {}; }
        values.emplace_back(pString->c_str(), pString->size());
    }
    return values;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Methods> local::GetMethods(boost::json::object const& json)
{
    auto const optNames = GetStrings(json, symbols::Methods);
    if (!optNames) { return {}; }

    // Methods this implementation does not know are skipped, they can never be negotiated.
    Verification::Methods methods;
    for (auto const& name : *optNames) {
        auto const optMethod = Verification::ParseMethod(name);
        if (optMethod && std::ranges::find(methods, *optMethod) == methods.end()) { methods.emplace_back(*optMethod); }
    }
    return methods;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::array local::WriteStrings(std::vector<std::string> const& values)
{
    boost::json::array array;
    for (auto const& value : values) { array.emplace_back(value); }
    return array;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::array local::WriteMethods(Verification::Methods const& methods)
{
    boost::json::array array;
    for (auto const method : methods) { array.emplace_back(Verification::ToString(method)); }
    return array;
}

//----------------------------------------------------------------------------------------------------------------------

void local::WriteCanonical(boost::json::value const& value, std::string& out)
{
    switch (value.kind()) {
        case boost::json::kind::object: {
            auto const& object = value.get_object();
            std::vector<boost::json::key_value_pair const*> entries;
            entries.reserve(object.size());
            for (auto const& entry : object) { entries.emplace_back(&entry); }
            std::ranges::sort(entries, [] (auto const* pLeft, auto const* pRight) {
                return pLeft->key() < pRight->key();
            });

            out.push_back('{');
            for (bool first = true; auto const* pEntry : entries) {
                if (!std::exchange(first, false)) { out.push_back(','); }
                out.append(boost::json::serialize(boost::json::string{ pEntry->key() }));
                out.push_back(':');
                WriteCanonical(pEntry->value(), out);
            }
            out.push_back('}');
        } break;
        case boost::json::kind::array: {
            out.push_back('[');
            for (bool first = true; auto const& element : value.get_array()) {
                if (!std::exchange(first, false)) { out.push_back(','); }
                WriteCanonical(element, out);
            }
            out.push_back(']');
        } break;
        default: out.append(boost::json::serialize(value)); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------
