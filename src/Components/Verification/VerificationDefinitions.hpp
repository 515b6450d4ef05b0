//----------------------------------------------------------------------------------------------------------------------
// File: VerificationDefinitions.hpp
// Description: The vocabulary shared by the verification request, the verifiers, and the service. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

// Cancelled and Done are terminal. Transitions only ever move forward through the list. 
enum class Phase : std::uint32_t { Requested, Ready, Started, Cancelled, Done };

enum class Method : std::uint32_t { Sas, QrCodeShow, QrCodeScan, Reciprocate };

enum class MessageType : std::uint32_t { Request, Ready, Start, Accept, Key, Mac, Done, Cancel };

enum class Error : std::uint32_t 
{
    InvalidState,
    Protocol,
    MethodUnsupported,
    KeyMismatch,
    QrCodeInvalid,
    Timeout,
    UserCancelled,
    Transport
};

enum class CancelCode : std::uint32_t
{
    User,
    Timeout,
    UnknownTransaction,
    UnknownMethod,
    UnexpectedMessage,
    KeyMismatch,
    UserMismatch,
    InvalidMessage,
    Accepted,
    MismatchedCommitment,
    MismatchedSas
};

enum class SasEncoding : std::uint32_t { Decimal, Emoji };

using Methods = std::vector<Method>;
using SasEncodings = std::vector<SasEncoding>;
using OptionalError = std::optional<Error>;

struct Cancellation;
struct Verified {};

// The terminal result of a handshake or request.
using Outcome = std::variant<Verified, Cancellation>;

struct Settings;

constexpr std::string_view MessagePrefix = "m.key.verification.";

[[nodiscard]] std::string_view ToString(Phase phase);
[[nodiscard]] std::string_view ToString(Method method);
[[nodiscard]] std::string_view ToString(MessageType type);
[[nodiscard]] std::string_view ToString(Error error);
[[nodiscard]] std::string_view ToString(CancelCode code);
[[nodiscard]] std::string_view ToString(SasEncoding encoding);

[[nodiscard]] std::optional<Method> ParseMethod(std::string_view method);
[[nodiscard]] std::optional<MessageType> ParseMessageType(std::string_view type);
[[nodiscard]] std::optional<CancelCode> ParseCancelCode(std::string_view code);
[[nodiscard]] std::optional<SasEncoding> ParseSasEncoding(std::string_view encoding);

[[nodiscard]] bool IsTerminal(Phase phase);

// Maps a wire cancel code onto the error reported to the caller. Unrecognized codes are protocol errors. 
[[nodiscard]] Error ClassifyCancelCode(std::string_view code);

[[nodiscard]] Cancellation CreateCancellation(Error error, CancelCode code, std::string_view reason = {});
[[nodiscard]] Cancellation CreateCancellation(CancelCode code, std::string_view reason = {});

[[nodiscard]] bool IsVerified(Outcome const& outcome);
[[nodiscard]] Cancellation const* GetCancellation(Outcome const& outcome);

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

struct Verification::Cancellation
{
    Error error;
    std::string code; // The wire code, retained verbatim for codes received from the counterparty. 
    std::string reason;
    bool isRemote;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The tunables of the verification service. 
//----------------------------------------------------------------------------------------------------------------------
struct Verification::Settings
{
    std::chrono::milliseconds requestTimeout;
    std::chrono::milliseconds stepTimeout;
    std::chrono::milliseconds retentionPeriod;
    std::chrono::milliseconds futureTolerance;
    Methods methods;
    SasEncodings sasEncodings;
    std::size_t qrSecretSize;
};

//----------------------------------------------------------------------------------------------------------------------
