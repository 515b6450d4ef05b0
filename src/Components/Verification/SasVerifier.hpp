//----------------------------------------------------------------------------------------------------------------------
// File: SasVerifier.hpp
// Description: Drives the short authentication string handshake. The parties exchange ephemeral curve25519 keys, 
// derive a string the users compare out of band, and then authenticate their long-term keys with MACs keyed from 
// the shared secret. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
#include "Presentation.hpp"
#include "ShortAuthenticationString.hpp"
#include "Verifier.hpp"
#include "Components/Security/KeyAgreement.hpp"
#include "Components/Security/KeyDerivation.hpp"
#include "Components/Security/MessageAuthenticator.hpp"
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class SasVerifier;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::SasVerifier final : public Verifier
{
public:
    static constexpr std::string_view KeyAgreementProtocol = Security::Curve25519KeyAgreement::Name;
    static constexpr std::string_view HashAlgorithm = Security::DigestName;
    static constexpr std::string_view MessageAuthenticationCode = "hkdf-hmac-sha256.v2";

    static constexpr std::string_view SasInfoPrefix = "MATRIX_KEY_VERIFICATION_SAS";
    static constexpr std::string_view MacInfoPrefix = "MATRIX_KEY_VERIFICATION_MAC";
    static constexpr std::string_view KeyIdsIdentifier = "KEY_IDS";

    enum class State : std::uint32_t 
    {
        Created,
        AwaitingAccept,
        AwaitingKey,
        AwaitingConfirmation,
        AwaitingMac,
        AwaitingDone,
        Finished
    };

    SasVerifier(Context&& context, Security::ExchangeRole role);

    // Sends the start message. Only valid for the initiator of the exchange. 
    [[nodiscard]] OptionalError Start();

    // Answers the counterparty's start message with an accept message. Only valid for the acceptor of the exchange.
    [[nodiscard]] OptionalError Accept(Payload::Start const& start, boost::json::object const& content);

    void Handle(Envelope const& envelope);

    // The user's decision after comparing the short authentication strings. 
    OptionalError Confirm();
    OptionalError Mismatch();

    [[nodiscard]] State GetState() const;
    [[nodiscard]] Security::ExchangeRole GetRole() const;
    [[nodiscard]] std::optional<Decimals> GetDecimals() const;
    [[nodiscard]] std::optional<Emojis> GetEmojis() const;

    // The strings and decision callbacks last handed to the user interface. Empty until both keys are exchanged.
    [[nodiscard]] std::optional<SasPresentation> GetSasPresentation() const;

    // Verifier {
    [[nodiscard]] virtual bool HasKeyMaterial() const override;
    // } Verifier

private:
    // Verifier {
    virtual void EraseSecrets() override;
    // } Verifier

    void OnAccept(boost::json::object const& content);
    void OnKey(boost::json::object const& content);
    void OnMac(boost::json::object const& content);
    void OnDone();

    [[nodiscard]] bool SetupKeyExchange();
    [[nodiscard]] bool DeriveShortAuthenticationString();
    void PresentShortAuthenticationString();

    [[nodiscard]] std::string GenerateCommitment(std::string_view encodedKey) const;
    [[nodiscard]] std::string GetMacInfo(Identifier::Device const& sender, Identifier::Device const& receiver) const;
    [[nodiscard]] std::optional<std::string> GenerateMac(std::string_view info, std::string_view input) const;
    [[nodiscard]] std::optional<Payload::Mac> GenerateMacPayload() const;
    [[nodiscard]] Security::VerificationStatus VerifyMacPayload(Payload::Mac const& mac);

    [[nodiscard]] bool SendMac();
    void ProcessMac(Payload::Mac const& mac);
    void RecordTrust();

    Security::ExchangeRole const m_role;
    State m_state;

    Security::Curve25519KeyAgreement m_keyAgreement;
    Security::KeyDeriver const m_keyDeriver;
    Security::MessageAuthenticator const m_authenticator;
    Security::OptionalSecureBuffer m_optSharedSecret;

    boost::json::object m_startContent;
    std::string m_commitment;
    std::string m_ownKey;
    std::string m_otherKey;
    SasEncodings m_encodings;

    std::optional<Decimals> m_optDecimals;
    std::optional<Emojis> m_optEmojis;
    std::optional<Payload::Mac> m_optPendingMac;
    std::optional<SasPresentation> m_optPresentation;

    bool m_hasVerifiedDevice;
    bool m_hasVerifiedMasterKey;
};

//----------------------------------------------------------------------------------------------------------------------
