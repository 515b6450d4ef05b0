//----------------------------------------------------------------------------------------------------------------------
// File: VerificationDefinitions.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

using namespace Verification;

static constexpr std::array<std::pair<std::string_view, Method>, 4> Methods = {
    std::make_pair("m.sas.v1", Method::Sas),
    std::make_pair("m.qr_code.show.v1", Method::QrCodeShow),
    std::make_pair("m.qr_code.scan.v1", Method::QrCodeScan),
    std::make_pair("m.reciprocate.v1", Method::Reciprocate),
};

static constexpr std::array<std::pair<std::string_view, MessageType>, 8> MessageTypes = {
    std::make_pair("m.key.verification.request", MessageType::Request),
    std::make_pair("m.key.verification.ready", MessageType::Ready),
    std::make_pair("m.key.verification.start", MessageType::Start),
    std::make_pair("m.key.verification.accept", MessageType::Accept),
    std::make_pair("m.key.verification.key", MessageType::Key),
    std::make_pair("m.key.verification.mac", MessageType::Mac),
    std::make_pair("m.key.verification.done", MessageType::Done),
    std::make_pair("m.key.verification.cancel", MessageType::Cancel),
};

static constexpr std::array<std::pair<std::string_view, CancelCode>, 11> CancelCodes = {
    std::make_pair("m.user", CancelCode::User),
    std::make_pair("m.timeout", CancelCode::Timeout),
    std::make_pair("m.unknown_transaction", CancelCode::UnknownTransaction),
    std::make_pair("m.unknown_method", CancelCode::UnknownMethod),
    std::make_pair("m.unexpected_message", CancelCode::UnexpectedMessage),
    std::make_pair("m.key_mismatch", CancelCode::KeyMismatch),
    std::make_pair("m.user_mismatch", CancelCode::UserMismatch),
    std::make_pair("m.invalid_message", CancelCode::InvalidMessage),
    std::make_pair("m.accepted", CancelCode::Accepted),
    std::make_pair("m.mismatched_commitment", CancelCode::MismatchedCommitment),
    std::make_pair("m.mismatched_sas", CancelCode::MismatchedSas),
};

static constexpr std::array<std::pair<std::string_view, std::string_view>, 11> CancelReasons = {
    std::make_pair("m.user", "The user cancelled the verification."),
    std::make_pair("m.timeout", "The verification process timed out."),
    std::make_pair("m.unknown_transaction", "The transaction is not known to the device."),
    std::make_pair("m.unknown_method", "The device does not support the requested method."),
    std::make_pair("m.unexpected_message", "The device received an unexpected message."),
    std::make_pair("m.key_mismatch", "The expected key did not match the verified one."),
    std::make_pair("m.user_mismatch", "The expected user did not match the verified one."),
    std::make_pair("m.invalid_message", "The message received was invalid."),
    std::make_pair("m.accepted", "The request was accepted by a different device."),
    std::make_pair("m.mismatched_commitment", "The key commitment did not match the received key."),
    std::make_pair("m.mismatched_sas", "The short authentication strings did not match."),
};

static constexpr std::array<std::pair<std::string_view, SasEncoding>, 2> SasEncodings = {
    std::make_pair("decimal", SasEncoding::Decimal),
    std::make_pair("emoji", SasEncoding::Emoji),
};

//----------------------------------------------------------------------------------------------------------------------

template<typename ValueType, std::size_t ArraySize>
[[nodiscard]] std::optional<ValueType> FindValue(
    std::array<std::pair<std::string_view, ValueType>, ArraySize> const& values, std::string_view key)
{
    auto const found = std::ranges::find_if(values, [&key] (auto const& entry) { return entry.first == key; });
    if (found == values.end()) { return {}; }
    return found->second;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ValueType, std::size_t ArraySize>
[[nodiscard]] std::string_view FindName(
    std::array<std::pair<std::string_view, ValueType>, ArraySize> const& values, ValueType value)
{
    auto const found = std::ranges::find_if(values, [&value] (auto const& entry) { return entry.second == value; });
    if (found == values.end()) { return {}; }
    return found->first;
}

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(Phase phase)
{
    switch (phase) {
        case Phase::Requested: return "requested";
        case Phase::Ready: return "ready";
        case Phase::Started: return "started";
        case Phase::Cancelled: return "cancelled";
        case Phase::Done: return "done";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(Method method)
{
    return symbols::FindName(symbols::Methods, method);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(MessageType type)
{
    return symbols::FindName(symbols::MessageTypes, type);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(Error error)
{
    switch (error) {
        case Error::InvalidState: return "invalid state";
        case Error::Protocol: return "protocol error";
        case Error::MethodUnsupported: return "method unsupported";
        case Error::KeyMismatch: return "key mismatch";
        case Error::QrCodeInvalid: return "invalid qr code";
        case Error::Timeout: return "timeout";
        case Error::UserCancelled: return "user cancelled";
        case Error::Transport: return "transport error";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(CancelCode code)
{
    return symbols::FindName(symbols::CancelCodes, code);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Verification::ToString(SasEncoding encoding)
{
    return symbols::FindName(symbols::SasEncodings, encoding);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Method> Verification::ParseMethod(std::string_view method)
{
    return symbols::FindValue(symbols::Methods, method);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::MessageType> Verification::ParseMessageType(std::string_view type)
{
    return symbols::FindValue(symbols::MessageTypes, type);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::CancelCode> Verification::ParseCancelCode(std::string_view code)
{
    return symbols::FindValue(symbols::CancelCodes, code);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::SasEncoding> Verification::ParseSasEncoding(std::string_view encoding)
{
    return symbols::FindValue(symbols::SasEncodings, encoding);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::IsTerminal(Phase phase)
{
    return phase == Phase::Cancelled || phase == Phase::Done;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Error Verification::ClassifyCancelCode(std::string_view code)
{
    auto const optCode = ParseCancelCode(code);
    if (!optCode) { return Error::Protocol; }

    switch (*optCode) {
        case CancelCode::User: return Error::UserCancelled;
        case CancelCode::Timeout: return Error::Timeout;
        case CancelCode::UnknownMethod: return Error::MethodUnsupported;
        case CancelCode::KeyMismatch:
        case CancelCode::MismatchedSas:
        case CancelCode::MismatchedCommitment: return Error::KeyMismatch;
        case CancelCode::Accepted: return Error::InvalidState;
        case CancelCode::UnknownTransaction:
        case CancelCode::UnexpectedMessage:
        case CancelCode::UserMismatch:
        case CancelCode::InvalidMessage: return Error::Protocol;
    }
    return Error::Protocol;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Cancellation Verification::CreateCancellation(Error error, CancelCode code, std::string_view reason)
{
    auto const name = ToString(code);
    if (reason.empty()) { reason = symbols::FindValue(symbols::CancelReasons, name).value_or(""); }
    return Cancellation{ error, std::string{ name }, std::string{ reason }, false };
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Cancellation Verification::CreateCancellation(CancelCode code, std::string_view reason)
{
    return CreateCancellation(ClassifyCancelCode(ToString(code)), code, reason);
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::IsVerified(Outcome const& outcome)
{
    return std::holds_alternative<Verified>(outcome);
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Cancellation const* Verification::GetCancellation(Outcome const& outcome)
{
    return std::get_if<Cancellation>(&outcome);
}

//----------------------------------------------------------------------------------------------------------------------
