//----------------------------------------------------------------------------------------------------------------------
// File: SasVerifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SasVerifier.hpp"
#include "Channel.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Interfaces/IdentityStore.hpp"
#include "Interfaces/RandomSource.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <map>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool Contains(std::vector<std::string> const& values, std::string_view value);
[[nodiscard]] std::string JoinKeyIdentifiers(std::map<std::string, std::string> const& macs);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Verification::SasVerifier::SasVerifier(Context&& context, Security::ExchangeRole role)
    : Verifier(std::move(context), Method::Sas, role == Security::ExchangeRole::Initiator)
    , m_role(role)
    , m_state(State::Created)
    , m_keyAgreement()
    , m_keyDeriver()
    , m_authenticator()
    , m_optSharedSecret()
    , m_startContent()
    , m_commitment()
    , m_ownKey()
    , m_otherKey()
    , m_encodings()
    , m_optDecimals()
    , m_optEmojis()
    , m_optPendingMac()
    , m_optPresentation()
    , m_hasVerifiedDevice(false)
    , m_hasVerifiedMasterKey(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::SasVerifier::Start()
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_role != Security::ExchangeRole::Initiator || m_state != State::Created) { return Error::InvalidState; }

    Payload::Start start{};
    start.fromDevice = m_context.self.deviceId;
    start.method = Method::Sas;
    start.keyAgreementProtocols = { std::string{ KeyAgreementProtocol } };
    start.hashes = { std::string{ HashAlgorithm } };
    start.messageAuthenticationCodes = { std::string{ MessageAuthenticationCode } };
    for (auto const encoding : m_context.settings.sasEncodings) {
        start.shortAuthenticationStrings.emplace_back(ToString(encoding));
    }

    // The commitment is computed over the content as delivered, including the transaction reference. 
    auto const& spChannel = m_context.spChannel;
    m_startContent = start.Write();
    AttachTransactionId(m_startContent, spChannel->GetTransactionId(), spChannel->IsRoomChannel());

    m_state = State::AwaitingAccept;
    if (!spChannel->Send(MessageType::Start, m_startContent)) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::SasVerifier::Accept(
    Payload::Start const& start, boost::json::object const& content)
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_role != Security::ExchangeRole::Acceptor || m_state != State::Created) { return Error::InvalidState; }

    bool const isSupported = local::Contains(start.keyAgreementProtocols, KeyAgreementProtocol) &&
        local::Contains(start.hashes, HashAlgorithm) &&
        local::Contains(start.messageAuthenticationCodes, MessageAuthenticationCode);

    for (auto const encoding : m_context.settings.sasEncodings) {
        if (local::Contains(start.shortAuthenticationStrings, ToString(encoding))) { m_encodings.emplace_back(encoding); }
    }

    bool const hasDecimal = std::ranges::find(m_encodings, SasEncoding::Decimal) != m_encodings.end();
    if (!isSupported || !hasDecimal) {
        Fail(Error::MethodUnsupported, CancelCode::UnknownMethod);
        return Error::MethodUnsupported;
    }

    m_startContent = content;
    if (!SetupKeyExchange()) {
        Fail(Error::Protocol, CancelCode::User, "The device was unable to generate key material.");
        return Error::Protocol;
    }

    Payload::Accept accept{};
    accept.keyAgreementProtocol = KeyAgreementProtocol;
    accept.hash = HashAlgorithm;
    accept.messageAuthenticationCode = MessageAuthenticationCode;
    for (auto const encoding : m_encodings) { accept.shortAuthenticationStrings.emplace_back(ToString(encoding)); }
    accept.commitment = GenerateCommitment(m_ownKey);

    m_state = State::AwaitingKey;
    if (!m_context.spChannel->Send(MessageType::Accept, accept.Write())) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::Handle(Envelope const& envelope)
{
    constexpr std::string_view DroppedMessage = "Dropping {} received after the handshake finished. [id={}]";

    std::scoped_lock lock{ *m_context.spMutex };
    if (m_state == State::Finished) {
        m_logger->debug(DroppedMessage, ToString(envelope.type), m_context.spChannel->GetTransactionId());
        return;
    }

    switch (envelope.type) {
        case MessageType::Accept: OnAccept(envelope.content); break;
        case MessageType::Key: OnKey(envelope.content); break;
        case MessageType::Mac: OnMac(envelope.content); break;
        case MessageType::Done: OnDone(); break;
        default: Fail(Error::Protocol, CancelCode::UnexpectedMessage); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::SasVerifier::Confirm()
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_state != State::AwaitingConfirmation) { return Error::InvalidState; }

    auto const spSelf = shared_from_this();
    m_state = State::AwaitingMac;
    bool const sent = SendMac();
    if (IsFinished()) { return Error::Protocol; } // The MAC could not be generated. 

    // The counterparty may have confirmed first, its MAC is processed now that the local user has agreed. 
    if (auto optPendingMac = std::exchange(m_optPendingMac, {}); optPendingMac) { ProcessMac(*optPendingMac); }

    if (!sent) { return Error::Transport; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Verification::OptionalError Verification::SasVerifier::Mismatch()
{
    std::scoped_lock lock{ *m_context.spMutex };
    if (m_state != State::AwaitingConfirmation) { return Error::InvalidState; }
    Fail(Error::KeyMismatch, CancelCode::MismatchedSas);
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Verification::SasVerifier::State Verification::SasVerifier::GetState() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_state;
}

//----------------------------------------------------------------------------------------------------------------------

Security::ExchangeRole Verification::SasVerifier::GetRole() const
{
    return m_role;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Decimals> Verification::SasVerifier::GetDecimals() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optDecimals;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Emojis> Verification::SasVerifier::GetEmojis() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optEmojis;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::SasPresentation> Verification::SasVerifier::GetSasPresentation() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_optPresentation;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::SasVerifier::HasKeyMaterial() const
{
    std::scoped_lock lock{ *m_context.spMutex };
    return m_keyAgreement.HasKeyPair() || m_optSharedSecret.has_value();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::EraseSecrets()
{
    m_keyAgreement.Erase();
    if (m_optSharedSecret) { m_optSharedSecret->Erase(); }
    m_optSharedSecret.reset();
    m_optPendingMac.reset();
    m_state = State::Finished;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::OnAccept(boost::json::object const& content)
{
    if (m_role != Security::ExchangeRole::Initiator || m_state != State::AwaitingAccept) {
        Fail(Error::Protocol, CancelCode::UnexpectedMessage);
        return;
    }

    auto const optAccept = Payload::Accept::Parse(content);
    if (!optAccept) {
        Fail(Error::Protocol, CancelCode::InvalidMessage);
        return;
    }

    bool const isSupported = optAccept->keyAgreementProtocol == KeyAgreementProtocol && 
        optAccept->hash == HashAlgorithm &&
        optAccept->messageAuthenticationCode == MessageAuthenticationCode;

    // The acceptor may only choose from the encodings that were offered.
    bool isOffered = true;
    for (auto const& name : optAccept->shortAuthenticationStrings) {
        auto const optEncoding = ParseSasEncoding(name);
        auto const& offered = m_context.settings.sasEncodings;
        if (!optEncoding || std::ranges::find(offered, *optEncoding) == offered.end()) {
            isOffered = false;
            break;
        }
        if (std::ranges::find(m_encodings, *optEncoding) == m_encodings.end()) { m_encodings.emplace_back(*optEncoding); }
    }

    bool const hasDecimal = std::ranges::find(m_encodings, SasEncoding::Decimal) != m_encodings.end();
    if (!isSupported || !isOffered || !hasDecimal) {
        Fail(Error::MethodUnsupported, CancelCode::UnknownMethod);
        return;
    }

    m_commitment = optAccept->commitment;
    if (!SetupKeyExchange()) {
        Fail(Error::Protocol, CancelCode::User, "The device was unable to generate key material.");
        return;
    }

    m_state = State::AwaitingKey;
    if (!m_context.spChannel->Send(MessageType::Key, Payload::Key{ m_ownKey }.Write())) {
        Fail(Error::Transport, CancelCode::User, "The device was unable to send its ephemeral key.");
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::OnKey(boost::json::object const& content)
{
    if (m_state != State::AwaitingKey) {
        Fail(Error::Protocol, CancelCode::UnexpectedMessage);
        return;
    }

    auto const optKey = Payload::Key::Parse(content);
    auto const optDecoded = optKey ? Security::DecodeBase64(optKey->key) : Security::OptionalBuffer{};
    if (!optDecoded || optDecoded->size() != Security::Curve25519KeySize) {
        Fail(Error::Protocol, CancelCode::InvalidMessage);
        return;
    }

    // The initiator checks the acceptor's key against the commitment it received before revealing its own key.
    if (m_role == Security::ExchangeRole::Initiator) {
        auto const commitment = GenerateCommitment(optKey->key);
        if (!Security::ConstantTimeCompare(
            Security::ToReadableView(commitment), Security::ToReadableView(m_commitment))) {
            Fail(Error::KeyMismatch, CancelCode::MismatchedCommitment);
            return;
        }
    }

    m_otherKey = optKey->key;
    m_optSharedSecret = m_keyAgreement.ComputeSharedSecret(*optDecoded);
    m_keyAgreement.Erase(); // The private key is not needed once the secret has been agreed upon. 
    if (!m_optSharedSecret) {
        Fail(Error::Protocol, CancelCode::InvalidMessage);
        return;
    }

    if (m_role == Security::ExchangeRole::Acceptor) {
        if (!m_context.spChannel->Send(MessageType::Key, Payload::Key{ m_ownKey }.Write())) {
            Fail(Error::Transport, CancelCode::User, "The device was unable to send its ephemeral key.");
            return;
        }
    }

    if (!DeriveShortAuthenticationString()) {
        Fail(Error::Protocol, CancelCode::User, "The device was unable to derive the short authentication string.");
        return;
    }

    m_state = State::AwaitingConfirmation;
    PresentShortAuthenticationString();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::OnMac(boost::json::object const& content)
{
    auto optMac = Payload::Mac::Parse(content);
    if (!optMac) {
        Fail(Error::Protocol, CancelCode::InvalidMessage);
        return;
    }

    switch (m_state) {
        case State::AwaitingConfirmation: {
            if (m_optPendingMac) {
                Fail(Error::Protocol, CancelCode::UnexpectedMessage);
                return;
            }
            m_optPendingMac = std::move(optMac);
        } break;
        case State::AwaitingMac: ProcessMac(*optMac); break;
        default: Fail(Error::Protocol, CancelCode::UnexpectedMessage); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::OnDone()
{
    if (m_state != State::AwaitingDone) {
        Fail(Error::Protocol, CancelCode::UnexpectedMessage);
        return;
    }

    RecordTrust();
    Succeed();
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::SasVerifier::SetupKeyExchange()
{
    auto const optPublicKey = m_keyAgreement.SetupKeyExchange(*m_context.spRandomSource);
    if (!optPublicKey) { return false; }
    m_ownKey = Security::EncodeBase64(*optPublicKey);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::SasVerifier::DeriveShortAuthenticationString()
{
    bool const isInitiator = m_role == Security::ExchangeRole::Initiator;
    auto const& initiator = isInitiator ? m_context.self : m_context.other;
    auto const& initiatorKey = isInitiator ? m_ownKey : m_otherKey;
    auto const& acceptor = isInitiator ? m_context.other : m_context.self;
    auto const& acceptorKey = isInitiator ? m_otherKey : m_ownKey;

    // The order of the parties within the info is fixed, swapping them produces a different string on each side. 
    auto const info = fmt::format("{}|{}|{}|{}|{}|{}|{}|{}",
        SasInfoPrefix,
        initiator.userId, initiator.deviceId, initiatorKey,
        acceptor.userId, acceptor.deviceId, acceptorKey,
        m_context.spChannel->GetTransactionId());

    auto const optBytes = m_keyDeriver.Derive(
        m_optSharedSecret->GetData(), info, ShortAuthenticationStringSize);
    if (!optBytes) { return false; }

    m_optDecimals = GenerateDecimals(optBytes->GetData());
    if (std::ranges::find(m_encodings, SasEncoding::Emoji) != m_encodings.end()) {
        m_optEmojis = GenerateEmojis(optBytes->GetData());
    }
    return m_optDecimals.has_value();
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::PresentShortAuthenticationString()
{
    std::weak_ptr<SasVerifier> const wpVerifier = std::static_pointer_cast<SasVerifier>(shared_from_this());
    m_optPresentation = SasPresentation{
        *m_optDecimals,
        m_optEmojis,
        [wpVerifier] () { if (auto const spVerifier = wpVerifier.lock(); spVerifier) { spVerifier->Confirm(); } },
        [wpVerifier] () { if (auto const spVerifier = wpVerifier.lock(); spVerifier) { spVerifier->Mismatch(); } },
        [wpVerifier] () { if (auto const spVerifier = wpVerifier.lock(); spVerifier) { spVerifier->Cancel(); } }
    };

    GetPublisher().Publish<Event::Type::ShowSas>(*m_optPresentation);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Verification::SasVerifier::GenerateCommitment(std::string_view encodedKey) const
{
    std::string source{ encodedKey };
    source.append(CanonicalJson(m_startContent));

    auto const optDigest = Security::GenerateDigest(Security::ToReadableView(source));
    if (!optDigest) { return {}; }
    return Security::EncodeBase64(*optDigest);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Verification::SasVerifier::GetMacInfo(
    Identifier::Device const& sender, Identifier::Device const& receiver) const
{
    std::string info{ MacInfoPrefix };
    info.append(sender.userId).append(sender.deviceId);
    info.append(receiver.userId).append(receiver.deviceId);
    info.append(m_context.spChannel->GetTransactionId());
    return info;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Verification::SasVerifier::GenerateMac(std::string_view info, std::string_view input) const
{
    if (!m_optSharedSecret) { return {}; }

    auto const optKey = m_keyDeriver.Derive(
        m_optSharedSecret->GetData(), info, Security::MessageAuthenticationKeySize);
    if (!optKey) { return {}; }

    auto const optSignature = m_authenticator.GenerateSignature(optKey->GetData(), Security::ToReadableView(input));
    if (!optSignature) { return {}; }

    return Security::EncodeBase64(*optSignature);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Verification::Payload::Mac> Verification::SasVerifier::GenerateMacPayload() const
{
    auto const& self = m_context.self;
    auto const& spIdentityStore = m_context.spIdentityStore;
    auto const info = GetMacInfo(self, m_context.other);

    auto const optDeviceKey = spIdentityStore->GetDeviceKey(self.userId, self.deviceId);
    if (!optDeviceKey) { return {}; }

    Payload::Mac payload{};
    auto const deviceKeyId = Identifier::CreateDeviceKeyIdentifier(self.deviceId);
    auto optDeviceMac = GenerateMac(info + deviceKeyId, *optDeviceKey);
    if (!optDeviceMac) { return {}; }
    payload.mac.emplace(deviceKeyId, std::move(*optDeviceMac));

    if (auto const optMasterKey = spIdentityStore->GetMasterKey(self.userId); optMasterKey) {
        auto const masterKeyId = Identifier::CreateMasterKeyIdentifier(*optMasterKey);
        auto optMasterMac = GenerateMac(info + masterKeyId, *optMasterKey);
        if (!optMasterMac) { return {}; }
        payload.mac.emplace(masterKeyId, std::move(*optMasterMac));
    }

    auto optKeysMac = GenerateMac(info + std::string{ KeyIdsIdentifier }, local::JoinKeyIdentifiers(payload.mac));
    if (!optKeysMac) { return {}; }
    payload.keys = std::move(*optKeysMac);

    return payload;
}

//----------------------------------------------------------------------------------------------------------------------

Security::VerificationStatus Verification::SasVerifier::VerifyMacPayload(Payload::Mac const& mac)
{
    constexpr std::string_view UnknownKeyMessage = "Ignoring the MAC of an unknown key {}. [id={}]";

    auto const& other = m_context.other;
    auto const& spIdentityStore = m_context.spIdentityStore;
    auto const info = GetMacInfo(other, m_context.self);

    auto const optKeysMac = GenerateMac(info + std::string{ KeyIdsIdentifier }, local::JoinKeyIdentifiers(mac.mac));
    if (!optKeysMac || !Security::ConstantTimeCompare(
        Security::ToReadableView(*optKeysMac), Security::ToReadableView(mac.keys))) {
        return Security::VerificationStatus::Failed;
    }

    auto const optMasterKey = spIdentityStore->GetMasterKey(other.userId);
    for (auto const& [keyId, value] : mac.mac) {
        auto const optParsed = Identifier::ParseKeyIdentifier(keyId);
        if (!optParsed || optParsed->first != Identifier::KeyAlgorithm) { continue; }

        bool const isDeviceKey = optParsed->second == other.deviceId;
        bool const isMasterKey = !isDeviceKey && optMasterKey && *optMasterKey == optParsed->second;
        std::optional<Security::EncodedKey> optKey;
        if (isDeviceKey) {
            optKey = spIdentityStore->GetDeviceKey(other.userId, other.deviceId);
        } else if (isMasterKey) {
            optKey = optMasterKey;
        }

        if (!optKey) {
            m_logger->debug(UnknownKeyMessage, keyId, m_context.spChannel->GetTransactionId());
            continue;
        }

        auto const optExpected = GenerateMac(info + keyId, *optKey);
        if (!optExpected || !Security::ConstantTimeCompare(
            Security::ToReadableView(*optExpected), Security::ToReadableView(value))) {
            return Security::VerificationStatus::Failed;
        }

        if (isDeviceKey) { m_hasVerifiedDevice = true; } else { m_hasVerifiedMasterKey = true; }
    }

    // At least one key known to the local device must have been authenticated. 
    if (!m_hasVerifiedDevice && !m_hasVerifiedMasterKey) { return Security::VerificationStatus::Failed; }
    return Security::VerificationStatus::Success;
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::SasVerifier::SendMac()
{
    auto const optPayload = GenerateMacPayload();
    if (!optPayload) {
        Fail(Error::Protocol, CancelCode::User, "The device was unable to authenticate its keys.");
        return false;
    }
    return m_context.spChannel->Send(MessageType::Mac, optPayload->Write());
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::ProcessMac(Payload::Mac const& mac)
{
    if (VerifyMacPayload(mac) != Security::VerificationStatus::Success) {
        Fail(Error::KeyMismatch, CancelCode::KeyMismatch);
        return;
    }

    m_state = State::AwaitingDone;
    if (!m_context.spChannel->Send(MessageType::Done, {})) {
        Fail(Error::Transport, CancelCode::User, "The device was unable to send the done message.");
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::SasVerifier::RecordTrust()
{
    constexpr std::string_view FailureMessage = "Unable to record the verified {} key of {}. [id={}]";

    auto const& other = m_context.other;
    auto const& spIdentityStore = m_context.spIdentityStore;
    auto const& transactionId = m_context.spChannel->GetTransactionId();

    if (m_hasVerifiedDevice && !spIdentityStore->MarkDeviceVerified(other.userId, other.deviceId)) {
        m_logger->error(FailureMessage, "device", other.deviceId, transactionId);
    }

    if (m_hasVerifiedMasterKey && !spIdentityStore->MarkMasterKeyVerified(other.userId)) {
        m_logger->error(FailureMessage, "master", other.userId, transactionId);
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool local::Contains(std::vector<std::string> const& values, std::string_view value)
{
    return std::ranges::find(values, value) != values.end();
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::JoinKeyIdentifiers(std::map<std::string, std::string> const& macs)
{
    std::string joined;
    for (auto const& [keyId, mac] : macs) {
        if (!joined.empty()) { joined.push_back(','); }
        joined.append(keyId);
    }
    return joined;
}

//----------------------------------------------------------------------------------------------------------------------
